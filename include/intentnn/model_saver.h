#ifndef INTENTNN_MODEL_SAVER_H
#define INTENTNN_MODEL_SAVER_H

#include "label_codec.h"
#include "sequence_classifier.h"
#include <fstream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Classifier and the label mapping it was trained with
 */
struct LoadedCheckpoint {
    std::unique_ptr<SequenceClassifier> model;
    LabelCodec labels;
};

/**
 * @brief Save and load checkpoints in HuggingFace-style format
 *
 * Directory structure:
 *   model_dir/
 *     ├── config.json          (model type, hyper-parameters, tokenizer type)
 *     ├── model.bin            (named weight tensors in binary)
 *     ├── label_mapping.json   (intent_labels, label_to_id, id_to_label)
 *     └── vocab.json | spiece.model
 *
 * Weights and label mapping are always written and read together.
 */
class ModelSaver {
public:
    static constexpr const char* CONFIG_FILE = "config.json";
    static constexpr const char* WEIGHTS_FILE = "model.bin";
    static constexpr const char* LABELS_FILE = "label_mapping.json";

    static void saveConfig(const std::string& dir, const nlohmann::json& config);
    static nlohmann::json loadConfig(const std::string& dir);

    /**
     * @brief Save Matrix to binary stream (rows, cols, row-major doubles)
     */
    static void saveMatrix(std::ofstream& file, const Matrix& mat);

    /**
     * @brief Load Matrix from binary stream
     * @throws CheckpointError on truncated data or a shape larger than the
     *         rest of the stream
     */
    static Matrix loadMatrix(std::ifstream& file);

    static void saveWeights(const std::string& dir, const WeightSnapshot& weights);
    static WeightSnapshot loadWeights(const std::string& dir);

    /**
     * @brief Persist model weights, config, tokenizer and label mapping
     * @throws CheckpointError if the label mapping does not fit the model head
     */
    static void saveCheckpoint(const std::string& dir,
                               const SequenceClassifier& model,
                               const LabelCodec& labels);

    /**
     * @brief Rebuild a classifier and its paired label mapping
     * @throws CheckpointError on missing files, unknown model types, weight
     *         mismatches or a label mapping that disagrees with the model head
     */
    static LoadedCheckpoint loadCheckpoint(const std::string& dir);

    /**
     * @brief Pretty-printed JSON file, used for histories and reports
     */
    static void saveJson(const std::string& path, const nlohmann::json& j);
};

#endif // INTENTNN_MODEL_SAVER_H
