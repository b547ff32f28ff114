#ifndef INTENTNN_DATA_LOADER_H
#define INTENTNN_DATA_LOADER_H

#include "batch.h"
#include "dataset.h"
#include <random>
#include <vector>

/**
 * @brief Stack dataset examples at the given positions into a batch
 */
Batch collate(const EncodedDataset& dataset, const std::vector<size_t>& indices);

/**
 * @brief Tokenize raw texts into a label-free inference batch
 * @throws EncodingError for empty texts
 */
Batch collateTexts(const std::vector<std::string>& texts,
                   const TextTokenizer& tokenizer,
                   size_t max_length);

/**
 * @brief Lazily slices a dataset into batches of up to batch_size examples
 *
 * The last batch may be shorter and is never dropped. With shuffling on,
 * every call to begin() starts a new pass over a fresh permutation drawn
 * from the seeded generator; without shuffling the order is dataset order.
 * The dataset is never modified and must outlive the loader.
 */
class DataLoader {
public:
    /**
     * @throws ConfigurationError if batch_size is 0
     */
    DataLoader(const EncodedDataset& dataset,
               size_t batch_size,
               bool shuffle = false,
               unsigned int seed = 42);

    // Iterator for range-based for loops
    class Iterator {
    public:
        Iterator(const DataLoader* loader, size_t batch_idx)
            : loader(loader), batch_idx(batch_idx) {}

        Batch operator*() const;

        Iterator& operator++() {
            ++batch_idx;
            return *this;
        }

        bool operator!=(const Iterator& other) const {
            return batch_idx != other.batch_idx;
        }

    private:
        const DataLoader* loader;
        size_t batch_idx;
    };

    /**
     * @brief Start a pass; reshuffles when shuffling is enabled
     */
    Iterator begin();
    Iterator end() const;

    size_t numBatches() const;

    /**
     * @brief Index order of the current pass
     */
    const std::vector<size_t>& order() const { return indices; }

private:
    const EncodedDataset& dataset;
    size_t batch_size;
    bool shuffle;
    std::mt19937 rng;
    std::vector<size_t> indices;
};

#endif // INTENTNN_DATA_LOADER_H
