#ifndef INTENTNN_LOSS_H
#define INTENTNN_LOSS_H

#include "matrix.h"
#include <string>
#include <vector>

/**
 * @brief Row-wise softmax, shifted by the row max for stability
 */
Matrix softmax(const Matrix& logits);

/**
 * @brief Softmax cross-entropy against integer label ids
 * CE = -(1/n) * Σ log softmax(z_i)[y_i]
 *
 * Mean reduction over the batch.
 */
class CrossEntropyLoss {
public:
    /**
     * @brief Mean loss over the batch
     * @throws std::invalid_argument if labels and logits rows differ or a
     *         label is outside [0, cols)
     */
    double calculate(const Matrix& logits, const std::vector<int>& labels) const;

    /**
     * @brief dLoss/dLogits = (softmax - onehot) / n
     */
    Matrix gradient(const Matrix& logits, const std::vector<int>& labels) const;

    std::string getName() const { return "CrossEntropy"; }
};

#endif // INTENTNN_LOSS_H
