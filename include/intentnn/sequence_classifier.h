#ifndef INTENTNN_SEQUENCE_CLASSIFIER_H
#define INTENTNN_SEQUENCE_CLASSIFIER_H

#include "matrix.h"
#include "batch.h"
#include "tokenizer.h"
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Named trainable tensor with its accumulated gradient
 */
struct Parameter {
    std::string name;
    Matrix value;
    Matrix grad;
};

/**
 * @brief Deep copy of every parameter value, keyed by parameter name
 */
using WeightSnapshot = std::map<std::string, Matrix>;

/**
 * @brief Encoder + classification head the pipeline trains and evaluates
 *
 * The Trainer and Evaluator only see this capability set, so any backend
 * that tokenizes text, produces logits and exposes named parameters can be
 * swapped in.
 *
 * Parameters are registered once, during construction of the derived
 * class; pointers returned by parameters() stay valid for the lifetime of
 * the model.
 */
class SequenceClassifier {
protected:
    std::vector<Parameter> params;

    /**
     * @brief Register a parameter and a zero gradient of the same shape
     * @return Index for later access through param(i)
     */
    size_t registerParameter(const std::string& name, const Matrix& init);

    Matrix& param(size_t i) { return params[i].value; }
    const Matrix& param(size_t i) const { return params[i].value; }
    Matrix& grad(size_t i) { return params[i].grad; }

public:
    virtual ~SequenceClassifier() = default;

    virtual const TextTokenizer& tokenizer() const = 0;
    virtual size_t maxLength() const = 0;
    virtual size_t numLabels() const = 0;

    /**
     * @brief Training forward pass; records the activations backward needs
     * @return Logits (batch × numLabels)
     */
    virtual Matrix forward(const Batch& batch) = 0;

    /**
     * @brief Back-propagate dLoss/dLogits of the last forward() call
     *
     * Gradients accumulate into Parameter::grad; call zeroGrad() between
     * steps.
     */
    virtual void backward(const Matrix& grad_logits) = 0;

    /**
     * @brief Inference forward pass, no gradient bookkeeping
     */
    virtual Matrix predictLogits(const Batch& batch) const = 0;

    /**
     * @brief Model hyper-parameters, enough to rebuild the architecture
     */
    virtual nlohmann::json getConfig() const = 0;

    /**
     * @brief Architecture tag stored in checkpoint config
     */
    virtual std::string getName() const = 0;

    std::vector<Parameter*> parameters();
    std::vector<const Parameter*> parameters() const;

    void zeroGrad();

    WeightSnapshot snapshot() const;

    /**
     * @brief Overwrite parameter values from a snapshot
     * @throws CheckpointError on missing, extra or mis-shaped tensors;
     *         the model is left untouched in that case
     */
    void restore(const WeightSnapshot& weights);

    size_t numParameters() const;
};

#endif // INTENTNN_SEQUENCE_CLASSIFIER_H
