// Run configuration tests

#include "intentnn/config.h"
#include "intentnn/errors.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace {

json minimalRunConfig() {
    return {
        {"data", {{"train", "data/train.csv"}, {"validation", "data/val.csv"}}},
        {"training", {
            {"batch_size", 16}, {"learning_rate", 2e-5}, {"num_epochs", 3},
            {"warmup_steps", 0}, {"weight_decay", 0.01}, {"early_stopping_patience", 2}
        }}
    };
}

bool rejects(const json& j, const std::string& what) {
    try {
        RunConfig::fromJson(j);
    } catch (const ConfigurationError&) {
        return true;
    }
    std::cerr << "run config with " << what << " was accepted" << std::endl;
    return false;
}

} // namespace

// Test 1: defaults fill everything but data and training
bool test_minimal_config() {
    RunConfig config = RunConfig::fromJson(minimalRunConfig());

    if (config.labelCodec() != LabelCodec::officeIntents() || config.model.num_labels != 7) {
        std::cerr << "minimal_config: default labels wrong" << std::endl;
        return false;
    }
    if (config.tokenizer.type != "word" || !config.test_path.empty()
        || config.output_dir != "models/intent_classifier") {
        std::cerr << "minimal_config: defaults wrong" << std::endl;
        return false;
    }
    if (config.training.batch_size != 16 || config.train_path != "data/train.csv") {
        std::cerr << "minimal_config: values not carried" << std::endl;
        return false;
    }

    std::cout << "test_minimal_config: PASSED" << std::endl;
    return true;
}

// Test 2: custom intents size the classification head
bool test_custom_intents() {
    json j = minimalRunConfig();
    j["intent_labels"] = {"greet", "bye", "thanks"};
    j["model"] = {{"d_model", 32}, {"max_length", 24}, {"num_labels", 99}};
    j["data"]["test"] = "data/test.csv";

    RunConfig config = RunConfig::fromJson(j);
    if (config.model.num_labels != 3 || config.model.d_model != 32 || config.model.max_length != 24) {
        std::cerr << "custom_intents: model section wrong" << std::endl;
        return false;
    }
    if (config.test_path != "data/test.csv" || config.labelCodec().decode(2) != "thanks") {
        std::cerr << "custom_intents: labels or test path wrong" << std::endl;
        return false;
    }

    std::cout << "test_custom_intents: PASSED" << std::endl;
    return true;
}

// Test 3: invalid configurations
bool test_invalid_configs() {
    json no_train = minimalRunConfig();
    no_train["data"].erase("train");

    json no_training = minimalRunConfig();
    no_training.erase("training");

    json bad_tokenizer = minimalRunConfig();
    bad_tokenizer["tokenizer"] = {{"type", "bpe"}};

    json spm_without_model = minimalRunConfig();
    spm_without_model["tokenizer"] = {{"type", "sentencepiece"}};

    json duplicate_labels = minimalRunConfig();
    duplicate_labels["intent_labels"] = {"a", "b", "a"};

    json bad_patience = minimalRunConfig();
    bad_patience["training"]["early_stopping_patience"] = "two";

    if (!rejects(no_train, "no data.train")) return false;
    if (!rejects(no_training, "no training section")) return false;
    if (!rejects(bad_tokenizer, "an unknown tokenizer")) return false;
    if (!rejects(spm_without_model, "sentencepiece without model_path")) return false;
    if (!rejects(duplicate_labels, "duplicate intents")) return false;
    if (!rejects(bad_patience, "a string patience")) return false;

    std::cout << "test_invalid_configs: PASSED" << std::endl;
    return true;
}

// Test 4: loading from disk
bool test_load_file() {
    std::string dir = makeTempDir("config");
    std::string good = (std::filesystem::path(dir) / "run.json").string();
    std::string broken = (std::filesystem::path(dir) / "broken.json").string();
    {
        std::ofstream good_file(good);
        good_file << minimalRunConfig().dump(2);
        std::ofstream broken_file(broken);
        broken_file << "{\"data\": ";
    }

    RunConfig config = RunConfig::load(good);
    bool threw = false;
    try {
        RunConfig::load(broken);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    std::filesystem::remove_all(dir);

    if (config.validation_path != "data/val.csv") {
        std::cerr << "load_file: loaded config wrong" << std::endl;
        return false;
    }
    if (!threw) {
        std::cerr << "load_file: malformed JSON accepted" << std::endl;
        return false;
    }

    std::cout << "test_load_file: PASSED" << std::endl;
    return true;
}

// Test 5: integers built in code and integers parsed from text are both counts
bool test_integer_encodings() {
    json literal = minimalRunConfig();
    literal["training"]["shuffle_seed"] = 7;
    json parsed = json::parse(literal.dump());

    TrainingConfig from_literal = RunConfig::fromJson(literal).training;
    TrainingConfig from_text = RunConfig::fromJson(parsed).training;
    if (from_literal.early_stopping_patience != 2 || from_literal.shuffle_seed != 7
        || from_text.early_stopping_patience != 2 || from_text.shuffle_seed != 7
        || from_text.batch_size != from_literal.batch_size) {
        std::cerr << "integer_encodings: signed and unsigned integers parsed differently" << std::endl;
        return false;
    }

    json negative_seed = minimalRunConfig();
    negative_seed["training"]["shuffle_seed"] = -3;
    json fractional_epochs = minimalRunConfig();
    fractional_epochs["training"]["num_epochs"] = 2.5;
    if (!rejects(negative_seed, "a negative shuffle_seed")) return false;
    if (!rejects(fractional_epochs, "a fractional num_epochs")) return false;

    std::cout << "test_integer_encodings: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Config Tests ===" << std::endl;

    int failures = 0;

    if (!test_minimal_config()) ++failures;
    if (!test_custom_intents()) ++failures;
    if (!test_invalid_configs()) ++failures;
    if (!test_load_file()) ++failures;
    if (!test_integer_encodings()) ++failures;

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All Config tests passed (5/5) ===" << std::endl;
    return 0;
}
