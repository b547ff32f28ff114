#include "intentnn/config.h"
#include "intentnn/errors.h"
#include <fstream>

using json = nlohmann::json;

json loadJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("Cannot parse " + path + ": " + e.what());
    }
    return j;
}

namespace {

std::string requireString(const json& j, const char* section, const char* key) {
    if (!j.contains(key) || !j[key].is_string() || j[key].get<std::string>().empty()) {
        throw ConfigurationError(std::string("run config is missing '") + section + "." + key + "'");
    }
    return j[key].get<std::string>();
}

} // namespace

TokenizerConfig TokenizerConfig::fromJson(const json& j) {
    TokenizerConfig config;
    if (j.is_null()) {
        return config;
    }
    try {
        config.type = j.value("type", config.type);
        config.min_frequency = j.value("min_frequency", config.min_frequency);
        config.model_path = j.value("model_path", config.model_path);
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid tokenizer config: ") + e.what());
    }

    if (config.type == "sentencepiece") {
        if (config.model_path.empty()) {
            throw ConfigurationError("tokenizer.model_path is required for sentencepiece");
        }
    } else if (config.type != "word") {
        throw ConfigurationError("tokenizer.type must be 'word' or 'sentencepiece', got '"
                                 + config.type + "'");
    }
    return config;
}

std::unique_ptr<TextTokenizer> TokenizerConfig::create(const std::vector<std::string>& train_texts) const {
    if (type == "sentencepiece") {
        return std::make_unique<SentencePieceTokenizer>(model_path);
    }
    return std::make_unique<WordTokenizer>(WordTokenizer::build(train_texts, min_frequency));
}

RunConfig RunConfig::fromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("run config must be a JSON object");
    }

    std::vector<std::string> intent_labels;
    if (j.contains("intent_labels")) {
        try {
            intent_labels = j["intent_labels"].get<std::vector<std::string>>();
        } catch (const json::exception& e) {
            throw ConfigurationError(std::string("intent_labels must be a list of strings: ") + e.what());
        }
    } else {
        intent_labels = LabelCodec::officeIntents().getLabels();
    }

    if (!j.contains("data") || !j["data"].is_object()) {
        throw ConfigurationError("run config is missing the 'data' section");
    }
    const json& data = j["data"];
    std::string test_path;
    if (data.contains("test")) {
        test_path = requireString(data, "data", "test");
    }

    if (!j.contains("training")) {
        throw ConfigurationError("run config is missing the 'training' section");
    }

    EmbeddingPoolConfig model = EmbeddingPoolConfig::fromJson(j.value("model", json::object()));
    model.num_labels = intent_labels.size();

    RunConfig config{
        intent_labels,
        requireString(data, "data", "train"),
        requireString(data, "data", "validation"),
        test_path,
        TokenizerConfig::fromJson(j.contains("tokenizer") ? j["tokenizer"] : json()),
        model,
        TrainingConfig::fromJson(j["training"]),
        j.value("output_dir", std::string("models/intent_classifier"))
    };

    // Validates names and duplicates up front
    config.labelCodec();
    return config;
}

RunConfig RunConfig::load(const std::string& path) {
    return fromJson(loadJsonFile(path));
}
