#ifndef INTENTNN_EMBEDDING_POOL_CLASSIFIER_H
#define INTENTNN_EMBEDDING_POOL_CLASSIFIER_H

#include "sequence_classifier.h"
#include <memory>

/**
 * @file embedding_pool_classifier.h
 * @brief Reference encoder backend for intent classification
 *
 * ═══════════════════════════════════════════════════════════════════════════
 * ARCHITECTURE
 * ═══════════════════════════════════════════════════════════════════════════
 *
 * Input: "book a meeting room for 3pm"
 *   ↓
 * Token Embeddings + Position Embeddings     (seq_len × d_model)
 *   ↓
 * Masked Mean Pooling over real tokens       (1 × d_model)
 *   ↓
 * Pooler: tanh(P · W_p + b_p)                (1 × d_model)
 *   ↓
 * Classifier: A · W_c + b_c                  (1 × num_labels)
 */

struct EmbeddingPoolConfig {
    size_t vocab_size = 0;
    size_t d_model = 64;
    size_t max_length = 32;
    size_t num_labels = 7;
    unsigned int seed = 42;

    /**
     * @throws ConfigurationError on zero dimensions
     */
    void validate() const;

    nlohmann::json toJson() const;
    static EmbeddingPoolConfig fromJson(const nlohmann::json& j);
};

class EmbeddingPoolClassifier : public SequenceClassifier {
private:
    EmbeddingPoolConfig config;
    std::unique_ptr<TextTokenizer> text_tokenizer;

    size_t token_embedding;
    size_t position_embedding;
    size_t pooler_weight;
    size_t pooler_bias;
    size_t classifier_weight;
    size_t classifier_bias;

    // For backward pass
    Batch batch_cache;
    std::vector<double> token_counts;
    Matrix pooled_cache;
    Matrix activation_cache;

    /**
     * @brief Masked mean of token + position embeddings per row
     * @throws EncodingError on wrong sequence length or out-of-vocab ids
     */
    Matrix pool(const Batch& batch, std::vector<double>& counts) const;

public:
    /**
     * @brief Build a freshly initialized model
     * @param config Dimensions and init seed
     * @param tokenizer Tokenizer whose ids index the token embedding table
     * @throws ConfigurationError if vocab_size is smaller than the tokenizer's
     */
    EmbeddingPoolClassifier(const EmbeddingPoolConfig& config,
                            std::unique_ptr<TextTokenizer> tokenizer);

    const TextTokenizer& tokenizer() const override { return *text_tokenizer; }
    size_t maxLength() const override { return config.max_length; }
    size_t numLabels() const override { return config.num_labels; }

    Matrix forward(const Batch& batch) override;
    void backward(const Matrix& grad_logits) override;
    Matrix predictLogits(const Batch& batch) const override;

    nlohmann::json getConfig() const override { return config.toJson(); }
    std::string getName() const override { return "embedding_pool"; }

    void printSummary() const;
};

#endif // INTENTNN_EMBEDDING_POOL_CLASSIFIER_H
