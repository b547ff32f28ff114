#include "intentnn/embedding_pool_classifier.h"
#include "intentnn/errors.h"
#include <cmath>
#include <iostream>
#include <random>

using json = nlohmann::json;

// ===== EmbeddingPoolConfig =====

void EmbeddingPoolConfig::validate() const {
    if (vocab_size == 0) throw ConfigurationError("model.vocab_size must be positive");
    if (d_model == 0) throw ConfigurationError("model.d_model must be positive");
    if (max_length == 0) throw ConfigurationError("model.max_length must be positive");
    if (num_labels == 0) throw ConfigurationError("model.num_labels must be positive");
}

json EmbeddingPoolConfig::toJson() const {
    return {
        {"vocab_size", vocab_size},
        {"d_model", d_model},
        {"max_length", max_length},
        {"num_labels", num_labels},
        {"seed", seed}
    };
}

EmbeddingPoolConfig EmbeddingPoolConfig::fromJson(const json& j) {
    EmbeddingPoolConfig config;
    try {
        config.vocab_size = j.value("vocab_size", config.vocab_size);
        config.d_model = j.value("d_model", config.d_model);
        config.max_length = j.value("max_length", config.max_length);
        config.num_labels = j.value("num_labels", config.num_labels);
        config.seed = j.value("seed", config.seed);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid model config: ") + e.what());
    }
    return config;
}

// ===== EmbeddingPoolClassifier =====

EmbeddingPoolClassifier::EmbeddingPoolClassifier(const EmbeddingPoolConfig& cfg,
                                                 std::unique_ptr<TextTokenizer> tokenizer)
    : config(cfg), text_tokenizer(std::move(tokenizer))
{
    if (!text_tokenizer) {
        throw ConfigurationError("EmbeddingPoolClassifier requires a tokenizer");
    }
    config.validate();
    if (config.vocab_size < text_tokenizer->getVocabSize()) {
        throw ConfigurationError("model.vocab_size (" + std::to_string(config.vocab_size)
                                 + ") is smaller than the tokenizer vocabulary ("
                                 + std::to_string(text_tokenizer->getVocabSize()) + ")");
    }

    const size_t d = config.d_model;
    std::mt19937 gen(config.seed);

    Matrix tok(config.vocab_size, d);
    tok.randomNormal(gen, 0.0, 0.02);
    Matrix pos(config.max_length, d);
    pos.randomNormal(gen, 0.0, 0.02);
    Matrix wp(d, d);
    wp.xavierInit(gen, d, d);
    Matrix wc(d, config.num_labels);
    wc.xavierInit(gen, d, config.num_labels);

    token_embedding = registerParameter("embeddings.token", tok);
    position_embedding = registerParameter("embeddings.position", pos);
    pooler_weight = registerParameter("pooler.dense.weight", wp);
    pooler_bias = registerParameter("pooler.dense.bias", Matrix(1, d, 0.0));
    classifier_weight = registerParameter("classifier.weight", wc);
    classifier_bias = registerParameter("classifier.bias", Matrix(1, config.num_labels, 0.0));
}

Matrix EmbeddingPoolClassifier::pool(const Batch& batch, std::vector<double>& counts) const {
    const size_t d = config.d_model;
    const Matrix& tok = param(token_embedding);
    const Matrix& pos = param(position_embedding);

    if (batch.attention_mask.size() != batch.size()) {
        throw EncodingError("Batch token ids and attention masks have different row counts");
    }

    Matrix pooled(batch.size(), d, 0.0);
    counts.assign(batch.size(), 0.0);

    for (size_t b = 0; b < batch.size(); ++b) {
        const auto& ids = batch.token_ids[b];
        const auto& mask = batch.attention_mask[b];
        if (ids.size() != config.max_length || mask.size() != config.max_length) {
            throw EncodingError("Sequence length " + std::to_string(ids.size())
                                + " does not match max_length " + std::to_string(config.max_length));
        }

        for (size_t t = 0; t < config.max_length; ++t) {
            if (mask[t] == 0) continue;
            int id = ids[t];
            if (id < 0 || static_cast<size_t>(id) >= config.vocab_size) {
                throw EncodingError("Token id " + std::to_string(id) + " outside vocabulary");
            }
            for (size_t k = 0; k < d; ++k) {
                pooled(b, k) += tok(id, k) + pos(t, k);
            }
            counts[b] += 1.0;
        }

        // Fully masked rows pool to the zero vector
        if (counts[b] > 0.0) {
            for (size_t k = 0; k < d; ++k) {
                pooled(b, k) /= counts[b];
            }
        }
    }
    return pooled;
}

Matrix EmbeddingPoolClassifier::forward(const Batch& batch) {
    pooled_cache = pool(batch, token_counts);
    batch_cache = batch;

    Matrix z = (pooled_cache * param(pooler_weight)).addRowVector(param(pooler_bias));
    activation_cache = z.apply([](double x) { return std::tanh(x); });

    return (activation_cache * param(classifier_weight)).addRowVector(param(classifier_bias));
}

void EmbeddingPoolClassifier::backward(const Matrix& grad_logits) {
    if (batch_cache.size() == 0 || grad_logits.getRows() != batch_cache.size()
        || grad_logits.getCols() != config.num_labels) {
        throw std::runtime_error("backward() needs logits gradient matching the last forward() batch");
    }
    const size_t d = config.d_model;

    // Classification head
    grad(classifier_weight) += activation_cache.transpose() * grad_logits;
    grad(classifier_bias) += grad_logits.sumCols();
    Matrix grad_act = grad_logits * param(classifier_weight).transpose();

    // Pooler, tanh'(z) = 1 - tanh(z)²
    Matrix tanh_grad = activation_cache.apply([](double a) { return 1.0 - a * a; });
    Matrix grad_z = grad_act.hadamard(tanh_grad);
    grad(pooler_weight) += pooled_cache.transpose() * grad_z;
    grad(pooler_bias) += grad_z.sumCols();
    Matrix grad_pooled = grad_z * param(pooler_weight).transpose();

    // Scatter back through the mean into both embedding tables
    Matrix& tok_grad = grad(token_embedding);
    Matrix& pos_grad = grad(position_embedding);
    for (size_t b = 0; b < batch_cache.size(); ++b) {
        if (token_counts[b] == 0.0) continue;
        const double scale = 1.0 / token_counts[b];
        const auto& ids = batch_cache.token_ids[b];
        const auto& mask = batch_cache.attention_mask[b];
        for (size_t t = 0; t < config.max_length; ++t) {
            if (mask[t] == 0) continue;
            for (size_t k = 0; k < d; ++k) {
                double g = grad_pooled(b, k) * scale;
                tok_grad(ids[t], k) += g;
                pos_grad(t, k) += g;
            }
        }
    }
}

Matrix EmbeddingPoolClassifier::predictLogits(const Batch& batch) const {
    std::vector<double> counts;
    Matrix pooled = pool(batch, counts);
    Matrix z = (pooled * param(pooler_weight)).addRowVector(param(pooler_bias));
    Matrix act = z.apply([](double x) { return std::tanh(x); });
    return (act * param(classifier_weight)).addRowVector(param(classifier_bias));
}

void EmbeddingPoolClassifier::printSummary() const {
    std::cout << "========== EmbeddingPoolClassifier ==========\n";
    std::cout << "Vocabulary Size: " << config.vocab_size << "\n";
    std::cout << "d_model:         " << config.d_model << "\n";
    std::cout << "Max Length:      " << config.max_length << "\n";
    std::cout << "Num Labels:      " << config.num_labels << "\n";
    std::cout << "Tokenizer:       " << text_tokenizer->getName() << "\n";
    for (const auto* p : parameters()) {
        std::cout << "  " << p->name << " (" << p->value.getRows() << "x"
                  << p->value.getCols() << ")\n";
    }
    std::cout << "Total Parameters: " << numParameters() << "\n";
    std::cout << "=============================================\n";
}
