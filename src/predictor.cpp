#include "intentnn/predictor.h"
#include "intentnn/console.h"
#include "intentnn/data_io.h"
#include "intentnn/data_loader.h"
#include "intentnn/errors.h"
#include "intentnn/loss.h"
#include "intentnn/model_saver.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>

using json = nlohmann::json;

json IntentPrediction::toJson() const {
    json probs = json::array();
    for (const auto& [intent, p] : probabilities) {
        probs.push_back(json{{"intent", intent}, {"probability", p}});
    }
    return {
        {"text", text},
        {"predicted_intent", predicted_intent},
        {"confidence", confidence},
        {"below_threshold", below_threshold},
        {"probabilities", probs}
    };
}

double IntentPrediction::probabilityOf(const std::string& intent) const {
    for (const auto& [name, p] : probabilities) {
        if (name == intent) return p;
    }
    return 0.0;
}

IntentPredictor::IntentPredictor(std::unique_ptr<SequenceClassifier> model,
                                 const LabelCodec& labels, double threshold)
    : model(std::move(model)), labels(labels), threshold(0.0)
{
    if (!this->model) {
        throw ConfigurationError("IntentPredictor requires a model");
    }
    if (labels.size() != this->model->numLabels()) {
        throw ConfigurationError("Label mapping has " + std::to_string(labels.size())
                                 + " intents but the model head has "
                                 + std::to_string(this->model->numLabels()));
    }
    setThreshold(threshold);
}

IntentPredictor IntentPredictor::fromCheckpoint(const std::string& dir, double threshold) {
    LoadedCheckpoint checkpoint = ModelSaver::loadCheckpoint(dir);
    return IntentPredictor(std::move(checkpoint.model), checkpoint.labels, threshold);
}

void IntentPredictor::setThreshold(double value) {
    if (!(value >= 0.0 && value <= 1.0)) {
        throw ConfigurationError("Confidence threshold must be within [0, 1]");
    }
    threshold = value;
}

IntentPrediction IntentPredictor::predictSingle(const std::string& text) const {
    return predictBatch({text}, 1).front();
}

std::vector<IntentPrediction> IntentPredictor::predictBatch(const std::vector<std::string>& texts,
                                                            size_t batch_size) const {
    if (batch_size == 0) {
        throw ConfigurationError("batch_size must be positive");
    }

    std::vector<IntentPrediction> results;
    results.reserve(texts.size());

    for (size_t start = 0; start < texts.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, texts.size());
        std::vector<std::string> chunk(texts.begin() + start, texts.begin() + end);

        Batch batch = collateTexts(chunk, model->tokenizer(), model->maxLength());
        Matrix probs = softmax(model->predictLogits(batch));

        for (size_t r = 0; r < chunk.size(); ++r) {
            size_t best = probs.argmaxRow(r);

            IntentPrediction prediction;
            prediction.text = chunk[r];
            prediction.confidence = probs(r, best);
            prediction.below_threshold = prediction.confidence < threshold;
            prediction.predicted_intent = prediction.below_threshold
                                          ? UNKNOWN_INTENT : labels.decode(static_cast<int>(best));

            for (size_t c = 0; c < labels.size(); ++c) {
                prediction.probabilities.emplace_back(labels.decode(static_cast<int>(c)), probs(r, c));
            }
            std::stable_sort(prediction.probabilities.begin(), prediction.probabilities.end(),
                             [](const auto& a, const auto& b) { return a.second > b.second; });

            results.push_back(std::move(prediction));
        }
    }
    return results;
}

void IntentPredictor::interactive(std::istream& in, std::ostream& out) const {
    out << "\n" << std::string(60, '=') << "\n";
    out << "INTERACTIVE INTENT PREDICTION MODE\n";
    out << std::string(60, '=') << "\n";
    out << "Enter text to predict intent (type 'quit' to exit)\n";
    out << "  'intents' - Show supported intents\n";
    out << std::string(60, '-') << "\n";

    std::string line;
    while (true) {
        out << "\nEnter text: " << std::flush;
        if (!std::getline(in, line)) break;

        size_t first = line.find_first_not_of(" \t\r");
        std::string text = first == std::string::npos ? "" : line.substr(first);
        text.erase(text.find_last_not_of(" \t\r") + 1);

        std::string command = text;
        std::transform(command.begin(), command.end(), command.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (command == "quit" || command == "exit") {
            out << "Goodbye!\n";
            break;
        }
        if (command == "intents") {
            out << "\nSupported intents:\n";
            for (const auto& intent : labels.getLabels()) {
                out << "  - " << intent << "\n";
            }
            continue;
        }
        if (text.empty()) {
            out << "Please enter some text.\n";
            continue;
        }

        IntentPrediction result;
        try {
            result = predictSingle(text);
        } catch (const EncodingError& e) {
            printError(e.what(), out);
            continue;
        }

        out << "\n" << std::string(50, '=') << "\n";
        out << "Text: \"" << text << "\"\n";
        out << "Predicted Intent: " << INTENTNN_GREEN << result.predicted_intent << INTENTNN_RESET << "\n";
        out << std::fixed << std::setprecision(3);
        out << "Confidence: " << result.confidence << "\n";
        out << "\nAll probabilities:\n";
        for (const auto& [intent, p] : result.probabilities) {
            out << "  " << intent << ": " << p << "\n";
        }
        out << std::defaultfloat;
    }
}

void IntentPredictor::savePredictions(const std::vector<IntentPrediction>& predictions,
                                      const std::string& path) const {
    std::string ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") {
        json j = json::array();
        for (const auto& p : predictions) {
            j.push_back(p.toJson());
        }
        ModelSaver::saveJson(path, j);
        return;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + path);
    }
    const auto& names = labels.getLabels();
    file << "text,predicted_intent,confidence,below_threshold";
    for (const auto& name : names) {
        file << ",prob_" << name;
    }
    file << "\n";
    for (const auto& p : predictions) {
        file << csvEscape(p.text) << "," << p.predicted_intent << ","
             << p.confidence << "," << (p.below_threshold ? "True" : "False");
        for (const auto& name : names) {
            file << "," << p.probabilityOf(name);
        }
        file << "\n";
    }
}
