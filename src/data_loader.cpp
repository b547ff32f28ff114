#include "intentnn/data_loader.h"
#include "intentnn/errors.h"
#include <algorithm>
#include <numeric>

Batch collate(const EncodedDataset& dataset, const std::vector<size_t>& indices) {
    Batch batch;
    batch.token_ids.reserve(indices.size());
    batch.attention_mask.reserve(indices.size());
    batch.label_ids.reserve(indices.size());

    for (size_t idx : indices) {
        const EncodedExample& example = dataset.get(idx);
        batch.token_ids.push_back(example.token_ids);
        batch.attention_mask.push_back(example.attention_mask);
        batch.label_ids.push_back(example.label_id);
    }
    batch.indices = indices;
    return batch;
}

Batch collateTexts(const std::vector<std::string>& texts,
                   const TextTokenizer& tokenizer,
                   size_t max_length) {
    Batch batch;
    std::vector<EncodedText> encoded = tokenizer.encodeBatch(texts, max_length);
    for (size_t i = 0; i < encoded.size(); ++i) {
        batch.token_ids.push_back(std::move(encoded[i].token_ids));
        batch.attention_mask.push_back(std::move(encoded[i].attention_mask));
        batch.indices.push_back(i);
    }
    return batch;
}

DataLoader::DataLoader(const EncodedDataset& dataset,
                       size_t batch_size,
                       bool shuffle,
                       unsigned int seed)
    : dataset(dataset), batch_size(batch_size), shuffle(shuffle), rng(seed)
{
    if (batch_size == 0) {
        throw ConfigurationError("batch_size must be positive");
    }
    indices.resize(dataset.size());
    std::iota(indices.begin(), indices.end(), 0);
}

Batch DataLoader::Iterator::operator*() const {
    size_t start = batch_idx * loader->batch_size;
    size_t end = std::min(start + loader->batch_size, loader->indices.size());

    std::vector<size_t> slice(loader->indices.begin() + start, loader->indices.begin() + end);
    return collate(loader->dataset, slice);
}

DataLoader::Iterator DataLoader::begin() {
    if (shuffle) {
        std::iota(indices.begin(), indices.end(), 0);
        std::shuffle(indices.begin(), indices.end(), rng);
    }
    return Iterator(this, 0);
}

DataLoader::Iterator DataLoader::end() const {
    return Iterator(this, numBatches());
}

size_t DataLoader::numBatches() const {
    return (indices.size() + batch_size - 1) / batch_size;
}
