#ifndef INTENTNN_BATCH_H
#define INTENTNN_BATCH_H

#include <vector>
#include <cstddef>

/**
 * @brief Stacked group of encoded examples
 *
 * Rows are aligned across all members. indices holds each row's position
 * in the source dataset, so predictions can be re-aligned to their texts.
 * label_ids is empty for inference batches built from raw text.
 */
struct Batch {
    std::vector<std::vector<int>> token_ids;
    std::vector<std::vector<int>> attention_mask;
    std::vector<int> label_ids;
    std::vector<size_t> indices;

    size_t size() const { return token_ids.size(); }
    bool hasLabels() const { return !label_ids.empty(); }
};

#endif // INTENTNN_BATCH_H
