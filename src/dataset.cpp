#include "intentnn/dataset.h"
#include "intentnn/errors.h"
#include <stdexcept>

EncodedDataset::EncodedDataset(const std::vector<std::string>& texts,
                               const std::vector<std::string>& labels,
                               const TextTokenizer& tokenizer,
                               size_t max_length,
                               const LabelCodec& codec)
    : texts(texts), max_length(max_length)
{
    if (texts.size() != labels.size()) {
        throw EncodingError("Got " + std::to_string(texts.size()) + " texts but "
                            + std::to_string(labels.size()) + " labels");
    }

    examples.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        int label_id;
        EncodedText encoded;
        try {
            label_id = codec.encode(labels[i]);
            encoded = tokenizer.encode(texts[i], max_length);
        } catch (const EncodingError& e) {
            throw EncodingError("Example " + std::to_string(i) + ": " + e.what());
        }

        if (encoded.token_ids.size() != max_length || encoded.attention_mask.size() != max_length) {
            throw EncodingError("Tokenizer returned length " + std::to_string(encoded.token_ids.size())
                                + " for example " + std::to_string(i)
                                + ", expected " + std::to_string(max_length));
        }

        examples.push_back({std::move(encoded.token_ids), std::move(encoded.attention_mask), label_id});
    }
}

const EncodedExample& EncodedDataset::get(size_t index) const {
    if (index >= examples.size()) {
        throw std::out_of_range("Dataset index " + std::to_string(index) + " out of range");
    }
    return examples[index];
}

const std::string& EncodedDataset::text(size_t index) const {
    if (index >= texts.size()) {
        throw std::out_of_range("Dataset index " + std::to_string(index) + " out of range");
    }
    return texts[index];
}

std::vector<size_t> EncodedDataset::labelCounts(size_t num_labels) const {
    std::vector<size_t> counts(num_labels, 0);
    for (const auto& example : examples) {
        if (static_cast<size_t>(example.label_id) < num_labels) {
            counts[example.label_id]++;
        }
    }
    return counts;
}
