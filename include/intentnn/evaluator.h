#ifndef INTENTNN_EVALUATOR_H
#define INTENTNN_EVALUATOR_H

#include "dataset.h"
#include "label_codec.h"
#include "matrix.h"
#include "sequence_classifier.h"
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct ClassMetrics {
    std::string intent;
    double precision;
    double recall;
    double f1;
    size_t support;

    nlohmann::json toJson() const;
};

/**
 * @brief Accuracy plus support-weighted precision / recall / F1
 */
struct OverallMetrics {
    double accuracy;
    double precision;
    double recall;
    double f1;
    size_t total;

    nlohmann::json toJson() const;
};

struct MisclassifiedExample {
    size_t index;
    std::string text;
    std::string true_intent;
    std::string predicted_intent;
    double predicted_confidence;
    double true_confidence;
    double confidence_diff;     // predicted_confidence - true_confidence

    nlohmann::json toJson() const;
};

struct ErrorPattern {
    std::string true_intent;
    std::string predicted_intent;
    size_t count;

    std::string describe() const { return true_intent + " -> " + predicted_intent; }
};

/**
 * @brief Immutable result of one evaluation run
 *
 * Rows and columns of the confusion matrix, and the per-class list, follow
 * the label codec's canonical order; intents absent from the data still
 * appear, with zero counts and zero metrics.
 */
class EvaluationReport {
private:
    LabelCodec labels;
    std::vector<std::string> texts;
    std::vector<int> true_ids;
    std::vector<int> predicted_ids;
    Matrix probabilities;

    OverallMetrics overall;
    std::vector<ClassMetrics> per_class;
    std::vector<std::vector<size_t>> confusion;
    std::vector<MisclassifiedExample> errors;
    std::vector<ErrorPattern> patterns;

    EvaluationReport(const LabelCodec& labels,
                     const std::vector<std::string>& texts,
                     const std::vector<int>& true_ids,
                     const std::vector<int>& predicted_ids,
                     const Matrix& probabilities);

public:
    /**
     * @brief Compute every metric from aligned predictions
     * @param labels Canonical intent order
     * @param texts Source texts, one per example
     * @param true_ids Gold label ids
     * @param predicted_ids Argmax label ids
     * @param probabilities Softmax output, examples × intents
     * @throws std::invalid_argument if the inputs are not aligned
     */
    static EvaluationReport build(const LabelCodec& labels,
                                  const std::vector<std::string>& texts,
                                  const std::vector<int>& true_ids,
                                  const std::vector<int>& predicted_ids,
                                  const Matrix& probabilities);

    const OverallMetrics& getOverall() const { return overall; }
    const ClassMetrics& getClassMetrics(const std::string& intent) const;

    /**
     * @brief confusion[true_id][predicted_id] = count
     */
    const std::vector<std::vector<size_t>>& getConfusionMatrix() const { return confusion; }

    /**
     * @brief Misclassifications, most confident prediction first
     */
    const std::vector<MisclassifiedExample>& getErrors() const { return errors; }

    /**
     * @brief (true -> predicted) counts, most frequent first
     */
    const std::vector<ErrorPattern>& getErrorPatterns() const { return patterns; }

    const LabelCodec& getLabels() const { return labels; }

    size_t size() const { return true_ids.size(); }
    size_t totalErrors() const { return errors.size(); }
    double errorRate() const;

    nlohmann::json toJson() const;

    /**
     * @brief Write evaluation_metrics.json, detailed_predictions.csv and
     *        confusion_matrix.csv into a directory
     */
    void save(const std::string& directory) const;

    void printSummary(std::ostream& os = std::cout) const;
    void printErrorAnalysis(size_t top_k = 10, std::ostream& os = std::cout) const;
};

/**
 * @brief Runs a trained classifier over a held-out set
 *
 * Read-only with respect to the model; batches go through predictLogits in
 * dataset order.
 */
class Evaluator {
private:
    const SequenceClassifier& model;
    const LabelCodec& labels;

public:
    /**
     * @throws ConfigurationError if the label codec does not fit the model head
     */
    Evaluator(const SequenceClassifier& model, const LabelCodec& labels);

    /**
     * @throws EncodingError on unknown labels or empty texts
     */
    EvaluationReport evaluate(const std::vector<std::string>& texts,
                              const std::vector<std::string>& true_labels,
                              size_t batch_size = 32) const;

    EvaluationReport evaluate(const EncodedDataset& dataset, size_t batch_size = 32) const;
};

#endif // INTENTNN_EVALUATOR_H
