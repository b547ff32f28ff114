#ifndef INTENTNN_DATASET_H
#define INTENTNN_DATASET_H

#include "label_codec.h"
#include "tokenizer.h"
#include <string>
#include <vector>

/**
 * @brief One tokenized training example, fixed length
 */
struct EncodedExample {
    std::vector<int> token_ids;
    std::vector<int> attention_mask;
    int label_id;
};

/**
 * @brief Eagerly tokenized labeled dataset
 *
 * All texts are encoded once at construction, so every epoch reads the
 * exact same token ids and get() is O(1). Examples are immutable.
 */
class EncodedDataset {
private:
    std::vector<EncodedExample> examples;
    std::vector<std::string> texts;
    size_t max_length;

public:
    /**
     * @brief Tokenize and label-encode parallel text/label lists
     * @param texts Raw texts
     * @param labels Intent names, parallel to texts
     * @param tokenizer Encoder's tokenizer
     * @param max_length Fixed sequence length
     * @param codec Label mapping of the model being trained
     * @throws EncodingError on length mismatch, unknown labels, empty texts
     *         or tokenizer output of the wrong length
     */
    EncodedDataset(const std::vector<std::string>& texts,
                   const std::vector<std::string>& labels,
                   const TextTokenizer& tokenizer,
                   size_t max_length,
                   const LabelCodec& codec);

    size_t size() const { return examples.size(); }
    bool empty() const { return examples.empty(); }
    size_t getMaxLength() const { return max_length; }

    /**
     * @throws std::out_of_range
     */
    const EncodedExample& get(size_t index) const;
    const EncodedExample& operator[](size_t index) const { return get(index); }

    /**
     * @brief Source text of example index
     */
    const std::string& text(size_t index) const;
    const std::vector<std::string>& getTexts() const { return texts; }

    /**
     * @brief Number of examples per label id
     */
    std::vector<size_t> labelCounts(size_t num_labels) const;
};

#endif // INTENTNN_DATASET_H
