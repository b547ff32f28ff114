#ifndef INTENTNN_CONFIG_H
#define INTENTNN_CONFIG_H

#include "embedding_pool_classifier.h"
#include "label_codec.h"
#include "tokenizer.h"
#include "trainer.h"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Read and parse a JSON file
 * @throws std::runtime_error if the file cannot be opened
 * @throws ConfigurationError if it is not valid JSON
 */
nlohmann::json loadJsonFile(const std::string& path);

struct TokenizerConfig {
    std::string type = "word";      // "word" or "sentencepiece"
    size_t min_frequency = 1;       // word only
    std::string model_path;         // sentencepiece only

    static TokenizerConfig fromJson(const nlohmann::json& j);

    /**
     * @brief Build the tokenizer, fitting the word vocabulary on train_texts
     */
    std::unique_ptr<TextTokenizer> create(const std::vector<std::string>& train_texts) const;
};

/**
 * @brief Everything intent_train needs for one run
 *
 * {
 *   "intent_labels": [...],                      optional, office intents
 *   "data": {"train": ..., "validation": ..., "test": ...},
 *   "tokenizer": {"type": "word", "min_frequency": 1},
 *   "model": {"d_model": 64, "max_length": 32, "seed": 42},
 *   "training": {"batch_size": 16, "learning_rate": 2e-5, ...},
 *   "output_dir": "models/intent_classifier"
 * }
 */
struct RunConfig {
    std::vector<std::string> intent_labels;
    std::string train_path;
    std::string validation_path;
    std::string test_path;          // empty = no final test evaluation
    TokenizerConfig tokenizer;
    EmbeddingPoolConfig model;
    TrainingConfig training;
    std::string output_dir;

    LabelCodec labelCodec() const { return LabelCodec(intent_labels); }

    /**
     * @throws ConfigurationError naming the missing or invalid key
     */
    static RunConfig fromJson(const nlohmann::json& j);
    static RunConfig load(const std::string& path);
};

#endif // INTENTNN_CONFIG_H
