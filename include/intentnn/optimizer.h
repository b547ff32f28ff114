#ifndef INTENTNN_OPTIMIZER_H
#define INTENTNN_OPTIMIZER_H

#include "matrix.h"
#include "sequence_classifier.h"
#include <string>
#include <vector>
#include <unordered_map>

/**
 * @brief Base class for optimization algorithms
 */
class Optimizer {
protected:
    double learning_rate;

public:
    explicit Optimizer(double learning_rate = 0.001) : learning_rate(learning_rate) {}
    virtual ~Optimizer() = default;

    /**
     * @brief Update parameters using computed gradients
     * @param parameters Current parameter values
     * @param gradients Computed gradients
     * @param param_id Unique identifier for parameter (for stateful optimizers)
     * @return Updated parameters
     */
    virtual Matrix update(const Matrix& parameters, const Matrix& gradients,
                          const std::string& param_id) = 0;

    /**
     * @brief Apply one update to every parameter, in place, keyed by name
     */
    void step(const std::vector<Parameter*>& params);

    virtual std::string getName() const = 0;

    /**
     * @brief Reset optimizer state
     */
    virtual void reset() {}

    void setLearningRate(double lr) { learning_rate = lr; }
    double getLearningRate() const { return learning_rate; }
};

/**
 * @brief Adam with decoupled weight decay (AdamW)
 *
 * θ = θ * (1 - α * λ)
 * m = β₁ * m + (1 - β₁) * ∇θ
 * v = β₂ * v + (1 - β₂) * ∇θ²
 * m̂ = m / (1 - β₁^t)
 * v̂ = v / (1 - β₂^t)
 * θ = θ - α * m̂ / (√v̂ + ε)
 *
 * Weight decay applies to every parameter, biases and embeddings included.
 */
class AdamW : public Optimizer {
private:
    double beta1;         // First moment decay rate (typically 0.9)
    double beta2;         // Second moment decay rate (typically 0.999)
    double epsilon;       // Small constant for numerical stability
    double weight_decay;

    std::unordered_map<std::string, Matrix> m;  // First moment
    std::unordered_map<std::string, Matrix> v;  // Second moment
    std::unordered_map<std::string, int> t;     // Time step

public:
    explicit AdamW(double learning_rate = 0.001, double weight_decay = 0.01,
                   double beta1 = 0.9, double beta2 = 0.999, double epsilon = 1e-8)
        : Optimizer(learning_rate), beta1(beta1), beta2(beta2),
          epsilon(epsilon), weight_decay(weight_decay) {}

    Matrix update(const Matrix& parameters, const Matrix& gradients,
                  const std::string& param_id) override;

    std::string getName() const override { return "AdamW"; }

    void reset() override {
        m.clear();
        v.clear();
        t.clear();
    }

    /**
     * @brief Number of updates applied to a parameter so far
     */
    int stepCount(const std::string& param_id) const;
};

/**
 * @brief Global L2 norm over all parameter gradients
 */
double gradNorm(const std::vector<Parameter*>& params);

/**
 * @brief Scale all gradients so their global L2 norm is at most max_norm
 * @return Norm before clipping
 */
double clipGradNorm(const std::vector<Parameter*>& params, double max_norm);

#endif // INTENTNN_OPTIMIZER_H
