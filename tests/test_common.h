#ifndef INTENTNN_TEST_COMMON_H
#define INTENTNN_TEST_COMMON_H

#include "intentnn/label_codec.h"
#include "intentnn/sequence_classifier.h"
#include "intentnn/tokenizer.h"
#include <chrono>
#include <cmath>
#include <filesystem>
#include <string>
#include <vector>

inline bool float_eq(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

/**
 * @brief Two utterances for each of the seven office intents
 */
inline void officeExamples(std::vector<std::string>& texts, std::vector<std::string>& labels) {
    texts = {
        "what is my salary this month",
        "when will my paycheck arrive",
        "book meeting room b for 3pm",
        "reserve the conference room tomorrow",
        "i want to apply for leave next week",
        "request two days of vacation",
        "find the phone number of the hr desk",
        "search the directory for the it helpdesk",
        "tell me about the company history",
        "what is our company mission",
        "show me the profile of my manager",
        "what department does sarah work in",
        "find employees in the sales team",
        "search for an engineer named john"
    };
    labels = {
        "salary_inquiry", "salary_inquiry",
        "meeting_room_booking", "meeting_room_booking",
        "leave_request", "leave_request",
        "directory_search", "directory_search",
        "company_info", "company_info",
        "employee_info", "employee_info",
        "employee_search", "employee_search"
    };
}

/**
 * @brief Fresh scratch directory under the system temp dir
 */
inline std::string makeTempDir(const std::string& name) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path dir = std::filesystem::temp_directory_path()
                                / ("intentnn_" + name + "_" + std::to_string(stamp));
    std::filesystem::create_directories(dir);
    return dir.string();
}

/**
 * @brief Classifier whose logits never change
 *
 * Every row gets the same logits, so validation loss is identical across
 * epochs. A single "drift" parameter receives a constant gradient of 1 so
 * the optimizer still moves weights and restoring a checkpoint is visible.
 */
class FixedLogitClassifier : public SequenceClassifier {
private:
    WordTokenizer word_tokenizer;
    size_t max_length;
    Matrix row_logits;
    size_t drift;

public:
    FixedLogitClassifier(const std::vector<std::string>& corpus, size_t max_length,
                         const std::vector<double>& logits)
        : word_tokenizer(WordTokenizer::build(corpus)),
          max_length(max_length),
          row_logits(std::vector<std::vector<double>>{logits})
    {
        drift = registerParameter("drift", Matrix(1, 1, 0.0));
    }

    const TextTokenizer& tokenizer() const override { return word_tokenizer; }
    size_t maxLength() const override { return max_length; }
    size_t numLabels() const override { return row_logits.getCols(); }

    Matrix forward(const Batch& batch) override { return predictLogits(batch); }

    void backward(const Matrix&) override { grad(drift)(0, 0) += 1.0; }

    Matrix predictLogits(const Batch& batch) const override {
        Matrix out(batch.size(), row_logits.getCols());
        for (size_t i = 0; i < batch.size(); ++i) {
            for (size_t j = 0; j < row_logits.getCols(); ++j) {
                out(i, j) = row_logits(0, j);
            }
        }
        return out;
    }

    nlohmann::json getConfig() const override { return {{"max_length", max_length}}; }
    std::string getName() const override { return "fixed_logit"; }

    double driftValue() const { return param(drift)(0, 0); }
};

#endif // INTENTNN_TEST_COMMON_H
