#ifndef INTENTNN_PREDICTOR_H
#define INTENTNN_PREDICTOR_H

#include "label_codec.h"
#include "sequence_classifier.h"
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

struct IntentPrediction {
    std::string text;
    std::string predicted_intent;   // "unknown" when below threshold
    double confidence;
    bool below_threshold;

    // All intents, highest probability first
    std::vector<std::pair<std::string, double>> probabilities;

    /**
     * @brief probabilities is written as an array, keeping its order
     */
    nlohmann::json toJson() const;

    double probabilityOf(const std::string& intent) const;
};

/**
 * @brief Serves predictions from a trained checkpoint
 *
 * The classifier and its label mapping always travel together; a
 * confidence threshold above 0 maps low-confidence predictions to
 * UNKNOWN_INTENT.
 */
class IntentPredictor {
private:
    std::unique_ptr<SequenceClassifier> model;
    LabelCodec labels;
    double threshold;

public:
    static constexpr const char* UNKNOWN_INTENT = "unknown";

    /**
     * @throws ConfigurationError if labels do not fit the model head or the
     *         threshold is outside [0, 1]
     */
    IntentPredictor(std::unique_ptr<SequenceClassifier> model, const LabelCodec& labels,
                    double threshold = 0.0);

    /**
     * @brief Load model and paired label mapping from a checkpoint directory
     */
    static IntentPredictor fromCheckpoint(const std::string& dir, double threshold = 0.0);

    IntentPrediction predictSingle(const std::string& text) const;

    std::vector<IntentPrediction> predictBatch(const std::vector<std::string>& texts,
                                               size_t batch_size = 32) const;

    /**
     * @brief Read-eval loop on stdin; 'quit' / 'exit' leave, 'intents' lists labels
     */
    void interactive(std::istream& in, std::ostream& out) const;

    /**
     * @brief Write predictions as JSON (.json) or CSV (anything else)
     *
     * CSV rows carry one prob_<intent> column per intent, in label order.
     */
    void savePredictions(const std::vector<IntentPrediction>& predictions,
                         const std::string& path) const;

    void setThreshold(double value);
    double getThreshold() const { return threshold; }
};

#endif // INTENTNN_PREDICTOR_H
