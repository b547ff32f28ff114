#include "intentnn/loss.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace {

void checkLabels(const Matrix& logits, const std::vector<int>& labels) {
    if (labels.size() != logits.getRows()) {
        throw std::invalid_argument("Number of labels must match number of logit rows");
    }
    for (int label : labels) {
        if (label < 0 || static_cast<size_t>(label) >= logits.getCols()) {
            throw std::invalid_argument("Label id " + std::to_string(label) + " out of range");
        }
    }
}

} // namespace

Matrix softmax(const Matrix& logits) {
    Matrix result(logits.getRows(), logits.getCols());
    for (size_t i = 0; i < logits.getRows(); ++i) {
        double max_val = logits(i, 0);
        for (size_t j = 1; j < logits.getCols(); ++j) {
            max_val = std::max(max_val, logits(i, j));
        }
        double sum = 0.0;
        for (size_t j = 0; j < logits.getCols(); ++j) {
            result(i, j) = std::exp(logits(i, j) - max_val);
            sum += result(i, j);
        }
        for (size_t j = 0; j < logits.getCols(); ++j) {
            result(i, j) /= sum;
        }
    }
    return result;
}

double CrossEntropyLoss::calculate(const Matrix& logits, const std::vector<int>& labels) const {
    checkLabels(logits, labels);
    if (labels.empty()) return 0.0;

    double total = 0.0;
    for (size_t i = 0; i < logits.getRows(); ++i) {
        // log-sum-exp
        double max_val = logits(i, 0);
        for (size_t j = 1; j < logits.getCols(); ++j) {
            max_val = std::max(max_val, logits(i, j));
        }
        double sum = 0.0;
        for (size_t j = 0; j < logits.getCols(); ++j) {
            sum += std::exp(logits(i, j) - max_val);
        }
        total += max_val + std::log(sum) - logits(i, labels[i]);
    }
    return total / static_cast<double>(labels.size());
}

Matrix CrossEntropyLoss::gradient(const Matrix& logits, const std::vector<int>& labels) const {
    checkLabels(logits, labels);
    Matrix grad = softmax(logits);
    if (labels.empty()) return grad;

    const double n = static_cast<double>(labels.size());
    for (size_t i = 0; i < grad.getRows(); ++i) {
        grad(i, labels[i]) -= 1.0;
    }
    grad *= 1.0 / n;
    return grad;
}
