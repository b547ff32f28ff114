// EvaluationReport and Evaluator tests

#include "intentnn/errors.h"
#include "intentnn/evaluator.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using json = nlohmann::json;

namespace {

// true [A, A, B], predicted [A, B, B]
EvaluationReport threeExampleReport() {
    LabelCodec labels({"A", "B", "C"});
    Matrix probs(std::vector<std::vector<double>>{
        {0.7, 0.2, 0.1},
        {0.3, 0.6, 0.1},
        {0.1, 0.8, 0.1}
    });
    return EvaluationReport::build(labels, {"first", "second", "third"},
                                   {0, 0, 1}, {0, 1, 1}, probs);
}

std::string firstLine(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::string line;
    std::getline(file, line);
    return line;
}

} // namespace

// Test 1: confusion matrix counts (true, predicted) pairs
bool test_confusion_matrix() {
    EvaluationReport report = threeExampleReport();
    const auto& cm = report.getConfusionMatrix();

    std::vector<std::vector<size_t>> expected = {{1, 1, 0}, {0, 1, 0}, {0, 0, 0}};
    if (cm != expected) {
        std::cerr << "confusion_matrix: unexpected counts" << std::endl;
        return false;
    }

    size_t total = 0;
    for (size_t r = 0; r < cm.size(); ++r) {
        size_t row = 0;
        for (size_t c = 0; c < cm[r].size(); ++c) row += cm[r][c];
        if (row != report.getClassMetrics(report.getLabels().decode(static_cast<int>(r))).support) {
            std::cerr << "confusion_matrix: row " << r << " does not sum to support" << std::endl;
            return false;
        }
        total += row;
    }
    if (total != report.size()) {
        std::cerr << "confusion_matrix: total " << total << std::endl;
        return false;
    }

    std::cout << "test_confusion_matrix: PASSED" << std::endl;
    return true;
}

// Test 2: per-class and weighted metrics
bool test_metrics() {
    EvaluationReport report = threeExampleReport();
    const OverallMetrics& overall = report.getOverall();

    if (!float_eq(overall.accuracy, 2.0 / 3.0) || overall.total != 3) {
        std::cerr << "metrics: accuracy " << overall.accuracy << std::endl;
        return false;
    }

    const ClassMetrics& a = report.getClassMetrics("A");
    const ClassMetrics& b = report.getClassMetrics("B");
    const ClassMetrics& c = report.getClassMetrics("C");
    if (!float_eq(a.precision, 1.0) || !float_eq(a.recall, 0.5) || !float_eq(a.f1, 2.0 / 3.0)) {
        std::cerr << "metrics: class A wrong" << std::endl;
        return false;
    }
    if (!float_eq(b.precision, 0.5) || !float_eq(b.recall, 1.0) || b.support != 1) {
        std::cerr << "metrics: class B wrong" << std::endl;
        return false;
    }
    // Never predicted, never present: every ratio defaults to zero
    if (c.precision != 0.0 || c.recall != 0.0 || c.f1 != 0.0 || c.support != 0) {
        std::cerr << "metrics: class C should be all zero" << std::endl;
        return false;
    }

    if (!float_eq(overall.precision, 2.5 / 3.0) || !float_eq(overall.recall, 2.0 / 3.0)
        || !float_eq(overall.f1, 2.0 / 3.0)) {
        std::cerr << "metrics: weighted averages wrong" << std::endl;
        return false;
    }

    std::cout << "test_metrics: PASSED" << std::endl;
    return true;
}

// Test 3: errors ranked by predicted confidence, patterns by count
bool test_error_ranking() {
    LabelCodec labels({"A", "B"});
    Matrix probs(std::vector<std::vector<double>>{
        {0.40, 0.60},
        {0.10, 0.90},
        {0.70, 0.30},
        {0.45, 0.55}
    });
    EvaluationReport report = EvaluationReport::build(labels, {"t0", "t1", "t2", "t3"},
                                                      {0, 0, 1, 0}, {1, 1, 0, 1}, probs);

    const auto& errors = report.getErrors();
    std::vector<size_t> order;
    for (const auto& e : errors) order.push_back(e.index);
    if (order != std::vector<size_t>{1, 2, 0, 3}) {
        std::cerr << "error_ranking: wrong error order" << std::endl;
        return false;
    }
    if (errors[0].true_intent != "A" || errors[0].predicted_intent != "B"
        || !float_eq(errors[0].confidence_diff, 0.8)) {
        std::cerr << "error_ranking: error record fields wrong" << std::endl;
        return false;
    }

    const auto& patterns = report.getErrorPatterns();
    if (patterns.size() != 2 || patterns[0].describe() != "A -> B" || patterns[0].count != 3
        || patterns[1].describe() != "B -> A" || patterns[1].count != 1) {
        std::cerr << "error_ranking: patterns wrong" << std::endl;
        return false;
    }
    if (report.totalErrors() != 4 || !float_eq(report.errorRate(), 1.0)) {
        std::cerr << "error_ranking: error totals wrong" << std::endl;
        return false;
    }

    // Equal counts keep first-seen order
    Matrix tie_probs(std::vector<std::vector<double>>{{0.4, 0.6}, {0.6, 0.4}});
    EvaluationReport tie = EvaluationReport::build(labels, {"x", "y"}, {1, 0}, {0, 1}, tie_probs);
    if (tie.getErrorPatterns()[0].describe() != "B -> A") {
        std::cerr << "error_ranking: tie did not keep first-seen order" << std::endl;
        return false;
    }

    std::cout << "test_error_ranking: PASSED" << std::endl;
    return true;
}

// Test 4: misaligned inputs are rejected
bool test_build_rejects_misaligned() {
    LabelCodec labels({"A", "B"});
    Matrix probs(2, 2, 0.5);

    bool threw = false;
    try {
        EvaluationReport::build(labels, {"x", "y"}, {0, 1}, {0}, probs);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "build_rejects_misaligned: accepted short predictions" << std::endl;
        return false;
    }

    std::cout << "test_build_rejects_misaligned: PASSED" << std::endl;
    return true;
}

// Test 5: report files and their layout
bool test_save_report() {
    namespace fs = std::filesystem;
    EvaluationReport report = threeExampleReport();
    std::string dir = makeTempDir("evaluation");
    report.save(dir);

    bool ok = true;
    std::string header = firstLine(fs::path(dir) / "detailed_predictions.csv");
    if (header != "text,true_label,predicted_label,correct,prob_A,prob_B,prob_C") {
        std::cerr << "save_report: predictions header '" << header << "'" << std::endl;
        ok = false;
    }

    std::ifstream cm_file(fs::path(dir) / "confusion_matrix.csv");
    std::string cm_header, cm_row;
    std::getline(cm_file, cm_header);
    std::getline(cm_file, cm_row);
    if (cm_header != ",A,B,C" || cm_row != "A,1,1,0") {
        std::cerr << "save_report: confusion csv '" << cm_header << "' / '" << cm_row << "'" << std::endl;
        ok = false;
    }

    std::ifstream metrics_file(fs::path(dir) / "evaluation_metrics.json");
    json metrics = json::parse(metrics_file);
    if (!float_eq(metrics["overall_metrics"]["accuracy"].get<double>(), 2.0 / 3.0)
        || metrics["per_class_metrics"]["B"]["support"] != 1
        || !metrics["per_class_metrics"]["A"].contains("f1-score")
        || metrics["total_errors"] != 1) {
        std::cerr << "save_report: metrics json wrong" << std::endl;
        ok = false;
    }

    fs::remove_all(dir);
    if (!ok) return false;

    std::cout << "test_save_report: PASSED" << std::endl;
    return true;
}

// Test 6: end to end through a classifier
bool test_evaluator_end_to_end() {
    std::vector<std::string> texts, labels;
    officeExamples(texts, labels);
    LabelCodec codec = LabelCodec::officeIntents();
    // Index 2 (leave_request) always wins
    FixedLogitClassifier model(texts, 12, {0.1, 0.2, 0.9, 0.0, -0.1, 0.05, 0.0});

    Evaluator evaluator(model, codec);
    EvaluationReport report = evaluator.evaluate(texts, labels, 4);

    if (report.size() != 14 || !float_eq(report.getOverall().accuracy, 2.0 / 14.0)) {
        std::cerr << "evaluator_end_to_end: accuracy " << report.getOverall().accuracy << std::endl;
        return false;
    }
    const auto& cm = report.getConfusionMatrix();
    for (size_t r = 0; r < cm.size(); ++r) {
        if (cm[r][2] != 2) {
            std::cerr << "evaluator_end_to_end: row " << r << " not all predicted as leave_request"
                      << std::endl;
            return false;
        }
    }
    // Equal confidences keep dataset order
    if (report.totalErrors() != 12 || report.getErrors()[0].index != 0) {
        std::cerr << "evaluator_end_to_end: error list wrong" << std::endl;
        return false;
    }
    std::ostringstream out;
    report.printSummary(out);
    report.printErrorAnalysis(3, out);
    if (out.str().find("salary_inquiry -> leave_request") == std::string::npos) {
        std::cerr << "evaluator_end_to_end: error analysis missing pattern" << std::endl;
        return false;
    }

    LabelCodec two_labels({"a", "b"});
    bool threw = false;
    try {
        Evaluator wrong(model, two_labels);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "evaluator_end_to_end: label count mismatch accepted" << std::endl;
        return false;
    }

    std::cout << "test_evaluator_end_to_end: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Evaluator Tests ===" << std::endl;

    int failures = 0;

    if (!test_confusion_matrix()) ++failures;
    if (!test_metrics()) ++failures;
    if (!test_error_ranking()) ++failures;
    if (!test_build_rejects_misaligned()) ++failures;
    if (!test_save_report()) ++failures;
    if (!test_evaluator_end_to_end()) ++failures;

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All Evaluator tests passed (6/6) ===" << std::endl;
    return 0;
}
