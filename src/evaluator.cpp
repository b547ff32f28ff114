#include "intentnn/evaluator.h"
#include "intentnn/console.h"
#include "intentnn/data_io.h"
#include "intentnn/data_loader.h"
#include "intentnn/errors.h"
#include "intentnn/loss.h"
#include "intentnn/model_saver.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

double safeRatio(double num, double den) {
    return den > 0.0 ? num / den : 0.0;
}

} // namespace

// ===== Metric records =====

json ClassMetrics::toJson() const {
    return {
        {"precision", precision},
        {"recall", recall},
        {"f1-score", f1},
        {"support", support}
    };
}

json OverallMetrics::toJson() const {
    return {
        {"accuracy", accuracy},
        {"precision", precision},
        {"recall", recall},
        {"f1_score", f1},
        {"total", total}
    };
}

json MisclassifiedExample::toJson() const {
    return {
        {"index", index},
        {"text", text},
        {"true_intent", true_intent},
        {"predicted_intent", predicted_intent},
        {"predicted_confidence", predicted_confidence},
        {"true_confidence", true_confidence},
        {"confidence_diff", confidence_diff}
    };
}

// ===== EvaluationReport =====

EvaluationReport EvaluationReport::build(const LabelCodec& labels,
                                         const std::vector<std::string>& texts,
                                         const std::vector<int>& true_ids,
                                         const std::vector<int>& predicted_ids,
                                         const Matrix& probabilities) {
    const size_t n = true_ids.size();
    if (texts.size() != n || predicted_ids.size() != n || probabilities.getRows() != n) {
        throw std::invalid_argument("Texts, labels, predictions and probabilities must be aligned");
    }
    if (probabilities.getCols() != labels.size()) {
        throw std::invalid_argument("Probability columns must match the number of intents");
    }
    const int num_labels = static_cast<int>(labels.size());
    for (size_t i = 0; i < n; ++i) {
        if (true_ids[i] < 0 || true_ids[i] >= num_labels
            || predicted_ids[i] < 0 || predicted_ids[i] >= num_labels) {
            throw std::invalid_argument("Label id out of range at example " + std::to_string(i));
        }
    }
    return EvaluationReport(labels, texts, true_ids, predicted_ids, probabilities);
}

EvaluationReport::EvaluationReport(const LabelCodec& labels,
                                   const std::vector<std::string>& texts,
                                   const std::vector<int>& true_ids,
                                   const std::vector<int>& predicted_ids,
                                   const Matrix& probabilities)
    : labels(labels), texts(texts), true_ids(true_ids),
      predicted_ids(predicted_ids), probabilities(probabilities)
{
    const size_t k = labels.size();
    const size_t n = true_ids.size();

    // Confusion matrix: rows = true, cols = predicted
    confusion.assign(k, std::vector<size_t>(k, 0));
    size_t correct = 0;
    for (size_t i = 0; i < n; ++i) {
        confusion[true_ids[i]][predicted_ids[i]]++;
        if (true_ids[i] == predicted_ids[i]) ++correct;
    }

    // Per-class metrics, zero wherever a ratio is undefined
    double weighted_p = 0.0, weighted_r = 0.0, weighted_f1 = 0.0;
    for (size_t c = 0; c < k; ++c) {
        size_t tp = confusion[c][c];
        size_t predicted = 0, actual = 0;
        for (size_t j = 0; j < k; ++j) {
            predicted += confusion[j][c];
            actual += confusion[c][j];
        }

        ClassMetrics m;
        m.intent = labels.decode(static_cast<int>(c));
        m.precision = safeRatio(static_cast<double>(tp), static_cast<double>(predicted));
        m.recall = safeRatio(static_cast<double>(tp), static_cast<double>(actual));
        m.f1 = safeRatio(2.0 * m.precision * m.recall, m.precision + m.recall);
        m.support = actual;
        per_class.push_back(m);

        weighted_p += m.precision * static_cast<double>(actual);
        weighted_r += m.recall * static_cast<double>(actual);
        weighted_f1 += m.f1 * static_cast<double>(actual);
    }

    const double total = static_cast<double>(n);
    overall.accuracy = safeRatio(static_cast<double>(correct), total);
    overall.precision = safeRatio(weighted_p, total);
    overall.recall = safeRatio(weighted_r, total);
    overall.f1 = safeRatio(weighted_f1, total);
    overall.total = n;

    // Error list and first-seen pattern order
    for (size_t i = 0; i < n; ++i) {
        int t = true_ids[i];
        int p = predicted_ids[i];
        if (t == p) continue;

        MisclassifiedExample e;
        e.index = i;
        e.text = texts[i];
        e.true_intent = labels.decode(t);
        e.predicted_intent = labels.decode(p);
        e.predicted_confidence = probabilities(i, p);
        e.true_confidence = probabilities(i, t);
        e.confidence_diff = e.predicted_confidence - e.true_confidence;
        errors.push_back(e);

        auto it = std::find_if(patterns.begin(), patterns.end(), [&](const ErrorPattern& ep) {
            return ep.true_intent == e.true_intent && ep.predicted_intent == e.predicted_intent;
        });
        if (it == patterns.end()) {
            patterns.push_back({e.true_intent, e.predicted_intent, 1});
        } else {
            it->count++;
        }
    }

    std::stable_sort(errors.begin(), errors.end(),
                     [](const MisclassifiedExample& a, const MisclassifiedExample& b) {
                         return a.predicted_confidence > b.predicted_confidence;
                     });
    std::stable_sort(patterns.begin(), patterns.end(),
                     [](const ErrorPattern& a, const ErrorPattern& b) {
                         return a.count > b.count;
                     });
}

const ClassMetrics& EvaluationReport::getClassMetrics(const std::string& intent) const {
    return per_class[labels.encode(intent)];
}

double EvaluationReport::errorRate() const {
    return safeRatio(static_cast<double>(errors.size()), static_cast<double>(true_ids.size()));
}

json EvaluationReport::toJson() const {
    json j;
    j["overall_metrics"] = overall.toJson();

    json per_class_json = json::object();
    for (const auto& m : per_class) {
        per_class_json[m.intent] = m.toJson();
    }
    j["per_class_metrics"] = per_class_json;

    j["intent_labels"] = labels.getLabels();
    j["confusion_matrix"] = confusion;
    j["total_errors"] = errors.size();
    j["error_rate"] = errorRate();

    json pattern_json = json::array();
    for (const auto& p : patterns) {
        pattern_json.push_back({{"pattern", p.describe()}, {"count", p.count}});
    }
    j["error_patterns"] = pattern_json;

    json errors_json = json::array();
    for (const auto& e : errors) {
        errors_json.push_back(e.toJson());
    }
    j["errors"] = errors_json;
    return j;
}

void EvaluationReport::save(const std::string& directory) const {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + directory + ": " + ec.message());
    }

    ModelSaver::saveJson((fs::path(directory) / "evaluation_metrics.json").string(), toJson());

    const auto& names = labels.getLabels();

    // One row per example
    std::string pred_path = (fs::path(directory) / "detailed_predictions.csv").string();
    std::ofstream pred_file(pred_path);
    if (!pred_file.is_open()) {
        throw std::runtime_error("Cannot write " + pred_path);
    }
    pred_file << "text,true_label,predicted_label,correct";
    for (const auto& name : names) {
        pred_file << ",prob_" << name;
    }
    pred_file << "\n" << std::setprecision(6);
    for (size_t i = 0; i < true_ids.size(); ++i) {
        pred_file << csvEscape(texts[i]) << ","
                  << labels.decode(true_ids[i]) << ","
                  << labels.decode(predicted_ids[i]) << ","
                  << (true_ids[i] == predicted_ids[i] ? "True" : "False");
        for (size_t c = 0; c < names.size(); ++c) {
            pred_file << "," << probabilities(i, c);
        }
        pred_file << "\n";
    }

    // Rows = true intent, columns = predicted intent
    std::string cm_path = (fs::path(directory) / "confusion_matrix.csv").string();
    std::ofstream cm_file(cm_path);
    if (!cm_file.is_open()) {
        throw std::runtime_error("Cannot write " + cm_path);
    }
    for (const auto& name : names) {
        cm_file << "," << name;
    }
    cm_file << "\n";
    for (size_t r = 0; r < names.size(); ++r) {
        cm_file << names[r];
        for (size_t c = 0; c < names.size(); ++c) {
            cm_file << "," << confusion[r][c];
        }
        cm_file << "\n";
    }
}

void EvaluationReport::printSummary(std::ostream& os) const {
    os << INTENTNN_BOLD << "\nEvaluation Results" << INTENTNN_RESET << "\n";
    os << std::string(60, '=') << "\n";
    os << std::fixed << std::setprecision(4);
    os << "  Examples:  " << overall.total << "\n";
    os << "  Accuracy:  " << overall.accuracy << "\n";
    os << "  Precision: " << overall.precision << "\n";
    os << "  Recall:    " << overall.recall << "\n";
    os << "  F1-Score:  " << overall.f1 << "\n\n";

    os << std::left << std::setw(24) << "Intent"
       << std::right << std::setw(10) << "Precision"
       << std::setw(10) << "Recall"
       << std::setw(10) << "F1"
       << std::setw(10) << "Support" << "\n";
    os << std::string(64, '-') << "\n";
    for (const auto& m : per_class) {
        os << std::left << std::setw(24) << m.intent
           << std::right << std::setw(10) << m.precision
           << std::setw(10) << m.recall
           << std::setw(10) << m.f1
           << std::setw(10) << m.support << "\n";
    }
    os << std::string(64, '-') << "\n";
    os << std::left << std::setw(24) << "weighted avg"
       << std::right << std::setw(10) << overall.precision
       << std::setw(10) << overall.recall
       << std::setw(10) << overall.f1
       << std::setw(10) << overall.total << "\n";
    os << std::defaultfloat;
}

void EvaluationReport::printErrorAnalysis(size_t top_k, std::ostream& os) const {
    os << "\nError Analysis: " << errors.size() << " misclassified samples\n";
    os << std::string(80, '=') << "\n";

    size_t shown = std::min(top_k, errors.size());
    os << "Top " << shown << " High-Confidence Errors:\n";
    os << std::string(80, '-') << "\n";
    os << std::fixed << std::setprecision(3);
    for (size_t i = 0; i < shown; ++i) {
        const auto& e = errors[i];
        os << "\n" << (i + 1) << ". Text: \"" << e.text << "\"\n";
        os << "   True Intent: " << e.true_intent << "\n";
        os << "   Predicted: " << INTENTNN_RED << e.predicted_intent << INTENTNN_RESET
           << " (confidence: " << e.predicted_confidence << ")\n";
        os << "   True confidence: " << e.true_confidence << "\n";
    }

    os << "\nMost Common Error Patterns:\n";
    os << std::string(40, '-') << "\n";
    for (size_t i = 0; i < std::min<size_t>(5, patterns.size()); ++i) {
        os << "  " << patterns[i].describe() << ": " << patterns[i].count << " times\n";
    }
    os << std::defaultfloat;
}

// ===== Evaluator =====

Evaluator::Evaluator(const SequenceClassifier& model, const LabelCodec& labels)
    : model(model), labels(labels)
{
    if (labels.size() != model.numLabels()) {
        throw ConfigurationError("Label set has " + std::to_string(labels.size())
                                 + " intents but the model head has "
                                 + std::to_string(model.numLabels()));
    }
}

EvaluationReport Evaluator::evaluate(const std::vector<std::string>& texts,
                                     const std::vector<std::string>& true_labels,
                                     size_t batch_size) const {
    EncodedDataset dataset(texts, true_labels, model.tokenizer(), model.maxLength(), labels);
    return evaluate(dataset, batch_size);
}

EvaluationReport Evaluator::evaluate(const EncodedDataset& dataset, size_t batch_size) const {
    const size_t n = dataset.size();
    std::vector<int> true_ids(n);
    std::vector<int> predicted_ids(n);
    Matrix probabilities(n, labels.size());

    DataLoader loader(dataset, batch_size, false);
    for (const Batch& batch : loader) {
        Matrix probs = softmax(model.predictLogits(batch));
        for (size_t r = 0; r < batch.size(); ++r) {
            size_t idx = batch.indices[r];
            true_ids[idx] = batch.label_ids[r];
            predicted_ids[idx] = static_cast<int>(probs.argmaxRow(r));
            for (size_t c = 0; c < labels.size(); ++c) {
                probabilities(idx, c) = probs(r, c);
            }
        }
    }

    return EvaluationReport::build(labels, dataset.getTexts(), true_ids, predicted_ids, probabilities);
}
