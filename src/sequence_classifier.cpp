#include "intentnn/sequence_classifier.h"
#include "intentnn/errors.h"

size_t SequenceClassifier::registerParameter(const std::string& name, const Matrix& init) {
    for (const auto& p : params) {
        if (p.name == name) {
            throw std::invalid_argument("Duplicate parameter name: " + name);
        }
    }
    params.push_back({name, init, Matrix(init.getRows(), init.getCols(), 0.0)});
    return params.size() - 1;
}

std::vector<Parameter*> SequenceClassifier::parameters() {
    std::vector<Parameter*> result;
    result.reserve(params.size());
    for (auto& p : params) {
        result.push_back(&p);
    }
    return result;
}

std::vector<const Parameter*> SequenceClassifier::parameters() const {
    std::vector<const Parameter*> result;
    result.reserve(params.size());
    for (const auto& p : params) {
        result.push_back(&p);
    }
    return result;
}

void SequenceClassifier::zeroGrad() {
    for (auto& p : params) {
        p.grad.zeros();
    }
}

WeightSnapshot SequenceClassifier::snapshot() const {
    WeightSnapshot weights;
    for (const auto& p : params) {
        weights.emplace(p.name, p.value);
    }
    return weights;
}

void SequenceClassifier::restore(const WeightSnapshot& weights) {
    if (weights.size() != params.size()) {
        throw CheckpointError("Snapshot has " + std::to_string(weights.size())
                              + " tensors, model has " + std::to_string(params.size()));
    }

    // Validate everything first so a bad snapshot never half-applies
    for (const auto& p : params) {
        auto it = weights.find(p.name);
        if (it == weights.end()) {
            throw CheckpointError("Snapshot is missing tensor '" + p.name + "'");
        }
        if (!it->second.sameShape(p.value)) {
            throw CheckpointError("Shape mismatch for tensor '" + p.name + "': expected "
                                  + std::to_string(p.value.getRows()) + "x"
                                  + std::to_string(p.value.getCols()) + ", got "
                                  + std::to_string(it->second.getRows()) + "x"
                                  + std::to_string(it->second.getCols()));
        }
    }

    for (auto& p : params) {
        p.value = weights.at(p.name);
    }
}

size_t SequenceClassifier::numParameters() const {
    size_t total = 0;
    for (const auto& p : params) {
        total += p.value.size();
    }
    return total;
}
