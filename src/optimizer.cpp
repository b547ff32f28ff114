#include "intentnn/optimizer.h"
#include <cmath>
#include <stdexcept>

void Optimizer::step(const std::vector<Parameter*>& params) {
    for (Parameter* p : params) {
        p->value = update(p->value, p->grad, p->name);
    }
}

// ==================== AdamW ====================

Matrix AdamW::update(const Matrix& parameters, const Matrix& gradients,
                     const std::string& param_id) {
    if (!parameters.sameShape(gradients)) {
        throw std::invalid_argument("Gradient shape does not match parameter '" + param_id + "'");
    }

    // Initialize moments if not exists
    if (m.find(param_id) == m.end()) {
        m[param_id] = Matrix(parameters.getRows(), parameters.getCols(), 0.0);
        v[param_id] = Matrix(parameters.getRows(), parameters.getCols(), 0.0);
        t[param_id] = 0;
    }

    t[param_id]++;
    int time_step = t[param_id];

    // Decoupled weight decay: θ = θ * (1 - α * λ)
    Matrix decayed = parameters * (1.0 - learning_rate * weight_decay);

    // m = β₁ * m + (1 - β₁) * ∇θ
    m[param_id] = m[param_id] * beta1 + gradients * (1.0 - beta1);

    // v = β₂ * v + (1 - β₂) * ∇θ²
    Matrix grad_squared = gradients.hadamard(gradients);
    v[param_id] = v[param_id] * beta2 + grad_squared * (1.0 - beta2);

    double bias_correction1 = 1.0 - std::pow(beta1, time_step);
    double bias_correction2 = 1.0 - std::pow(beta2, time_step);

    // θ = θ - α * m̂ / (√v̂ + ε)
    const Matrix& m_t = m[param_id];
    const Matrix& v_t = v[param_id];
    Matrix delta(parameters.getRows(), parameters.getCols());
    for (size_t i = 0; i < delta.getRows(); ++i) {
        for (size_t j = 0; j < delta.getCols(); ++j) {
            double m_hat = m_t(i, j) / bias_correction1;
            double v_hat = v_t(i, j) / bias_correction2;
            delta(i, j) = learning_rate * m_hat / (std::sqrt(v_hat) + epsilon);
        }
    }
    return decayed - delta;
}

int AdamW::stepCount(const std::string& param_id) const {
    auto it = t.find(param_id);
    return it != t.end() ? it->second : 0;
}

// ==================== Gradient clipping ====================

double gradNorm(const std::vector<Parameter*>& params) {
    double total = 0.0;
    for (const Parameter* p : params) {
        total += p->grad.squaredNorm();
    }
    return std::sqrt(total);
}

double clipGradNorm(const std::vector<Parameter*>& params, double max_norm) {
    double total_norm = gradNorm(params);

    // Avoid division by zero
    double clip_coef = max_norm / (total_norm + 1e-6);

    if (clip_coef < 1.0) {
        for (Parameter* p : params) {
            p->grad *= clip_coef;
        }
    }
    return total_norm;
}
