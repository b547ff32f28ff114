// Checkpoint persistence and IntentPredictor tests

#include "intentnn/data_io.h"
#include "intentnn/data_loader.h"
#include "intentnn/embedding_pool_classifier.h"
#include "intentnn/errors.h"
#include "intentnn/model_saver.h"
#include "intentnn/predictor.h"
#include "test_common.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::unique_ptr<EmbeddingPoolClassifier> makeOfficeModel() {
    std::vector<std::string> texts, labels;
    officeExamples(texts, labels);
    auto tokenizer = std::make_unique<WordTokenizer>(WordTokenizer::build(texts));
    EmbeddingPoolConfig config;
    config.vocab_size = tokenizer->getVocabSize() + 3;
    config.d_model = 8;
    config.max_length = 16;
    config.num_labels = 7;
    config.seed = 5;
    return std::make_unique<EmbeddingPoolClassifier>(config, std::move(tokenizer));
}

const std::vector<std::string> PROBES = {
    "book meeting room b", "what is my salary", "completely unseen words here"
};

} // namespace

// Test 1: a reloaded checkpoint reproduces logits and the label order
bool test_save_load_roundtrip() {
    auto model = makeOfficeModel();
    LabelCodec codec = LabelCodec::officeIntents();
    std::string dir = makeTempDir("checkpoint");

    ModelSaver::saveCheckpoint(dir, *model, codec);
    LoadedCheckpoint loaded = ModelSaver::loadCheckpoint(dir);

    json config = ModelSaver::loadConfig(dir);
    fs::remove_all(dir);

    if (loaded.labels != codec || loaded.model->getName() != "embedding_pool") {
        std::cerr << "save_load_roundtrip: labels or model type changed" << std::endl;
        return false;
    }
    if (config["max_length"] != 16 || config["tokenizer"]["type"] != "word") {
        std::cerr << "save_load_roundtrip: config.json wrong: " << config.dump() << std::endl;
        return false;
    }

    Batch original = collateTexts(PROBES, model->tokenizer(), model->maxLength());
    Batch reloaded = collateTexts(PROBES, loaded.model->tokenizer(), loaded.model->maxLength());
    if (original.token_ids != reloaded.token_ids) {
        std::cerr << "save_load_roundtrip: tokenizer encodes differently" << std::endl;
        return false;
    }

    Matrix a = model->predictLogits(original);
    Matrix b = loaded.model->predictLogits(reloaded);
    for (size_t i = 0; i < a.getRows(); ++i) {
        for (size_t j = 0; j < a.getCols(); ++j) {
            if (a(i, j) != b(i, j)) {
                std::cerr << "save_load_roundtrip: logits differ at (" << i << "," << j << ")" << std::endl;
                return false;
            }
        }
    }

    std::cout << "test_save_load_roundtrip: PASSED" << std::endl;
    return true;
}

// Test 2: a checkpoint without its label mapping is unusable
bool test_missing_label_mapping() {
    auto model = makeOfficeModel();
    std::string dir = makeTempDir("no_labels");
    ModelSaver::saveCheckpoint(dir, *model, LabelCodec::officeIntents());
    fs::remove(fs::path(dir) / ModelSaver::LABELS_FILE);

    bool threw = false;
    try {
        ModelSaver::loadCheckpoint(dir);
    } catch (const CheckpointError&) {
        threw = true;
    }
    fs::remove_all(dir);
    if (!threw) {
        std::cerr << "missing_label_mapping: load succeeded" << std::endl;
        return false;
    }

    threw = false;
    try {
        ModelSaver::loadCheckpoint(dir + "_does_not_exist");
    } catch (const CheckpointError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "missing_label_mapping: missing directory accepted" << std::endl;
        return false;
    }

    std::cout << "test_missing_label_mapping: PASSED" << std::endl;
    return true;
}

// Test 3: label count must match the classification head
bool test_label_count_mismatch() {
    auto model = makeOfficeModel();
    std::string dir = makeTempDir("label_mismatch");
    ModelSaver::saveCheckpoint(dir, *model, LabelCodec::officeIntents());
    LabelCodec({"a", "b", "c"}).save((fs::path(dir) / ModelSaver::LABELS_FILE).string());

    bool threw = false;
    try {
        ModelSaver::loadCheckpoint(dir);
    } catch (const CheckpointError&) {
        threw = true;
    }
    fs::remove_all(dir);
    if (!threw) {
        std::cerr << "label_count_mismatch: load succeeded" << std::endl;
        return false;
    }

    std::string save_dir = makeTempDir("label_mismatch_save");
    threw = false;
    try {
        ModelSaver::saveCheckpoint(save_dir, *model, LabelCodec({"a", "b"}));
    } catch (const CheckpointError&) {
        threw = true;
    }
    bool wrote_weights = fs::exists(fs::path(save_dir) / ModelSaver::WEIGHTS_FILE);
    fs::remove_all(save_dir);
    if (!threw || wrote_weights) {
        std::cerr << "label_count_mismatch: save accepted a wrong label set" << std::endl;
        return false;
    }

    std::cout << "test_label_count_mismatch: PASSED" << std::endl;
    return true;
}

// Test 4: truncated weights are reported, not half-loaded
bool test_truncated_weights() {
    auto model = makeOfficeModel();
    std::string dir = makeTempDir("truncated");
    ModelSaver::saveCheckpoint(dir, *model, LabelCodec::officeIntents());

    fs::path weights = fs::path(dir) / ModelSaver::WEIGHTS_FILE;
    fs::resize_file(weights, fs::file_size(weights) / 2);

    bool threw = false;
    try {
        ModelSaver::loadCheckpoint(dir);
    } catch (const CheckpointError&) {
        threw = true;
    }
    fs::remove_all(dir);
    if (!threw) {
        std::cerr << "truncated_weights: load succeeded" << std::endl;
        return false;
    }

    std::cout << "test_truncated_weights: PASSED" << std::endl;
    return true;
}

// Test 5: a corrupt tensor shape is reported before anything is allocated
bool test_corrupt_tensor_shape() {
    std::string dir = makeTempDir("corrupt_shape");
    {
        std::ofstream file((fs::path(dir) / ModelSaver::WEIGHTS_FILE).string(), std::ios::binary);
        const std::string name = "classifier.weight";
        size_t count = 1;
        size_t len = name.size();
        size_t rows = size_t(1) << 40;
        size_t cols = size_t(1) << 40;
        file.write("INN1", 4);
        file.write(reinterpret_cast<const char*>(&count), sizeof(size_t));
        file.write(reinterpret_cast<const char*>(&len), sizeof(size_t));
        file.write(name.data(), static_cast<std::streamsize>(len));
        file.write(reinterpret_cast<const char*>(&rows), sizeof(size_t));
        file.write(reinterpret_cast<const char*>(&cols), sizeof(size_t));
        double value = 1.0;
        file.write(reinterpret_cast<const char*>(&value), sizeof(double));
    }

    bool threw = false;
    try {
        ModelSaver::loadWeights(dir);
    } catch (const CheckpointError&) {
        threw = true;
    }
    fs::remove_all(dir);
    if (!threw) {
        std::cerr << "corrupt_tensor_shape: oversized shape accepted" << std::endl;
        return false;
    }

    std::cout << "test_corrupt_tensor_shape: PASSED" << std::endl;
    return true;
}

// Test 6: probabilities are a sorted distribution over every intent
bool test_predictor_distribution() {
    IntentPredictor predictor(makeOfficeModel(), LabelCodec::officeIntents());
    std::vector<IntentPrediction> results = predictor.predictBatch(PROBES, 2);

    if (results.size() != PROBES.size()) {
        std::cerr << "predictor_distribution: wrong result count" << std::endl;
        return false;
    }
    for (const auto& r : results) {
        if (r.probabilities.size() != 7 || r.below_threshold) {
            std::cerr << "predictor_distribution: bad result for '" << r.text << "'" << std::endl;
            return false;
        }
        double sum = 0.0;
        for (size_t i = 0; i < r.probabilities.size(); ++i) {
            sum += r.probabilities[i].second;
            if (i > 0 && r.probabilities[i].second > r.probabilities[i - 1].second) {
                std::cerr << "predictor_distribution: probabilities not sorted" << std::endl;
                return false;
            }
        }
        if (!float_eq(sum, 1.0) || r.probabilities[0].first != r.predicted_intent
            || r.probabilities[0].second != r.confidence) {
            std::cerr << "predictor_distribution: top intent inconsistent" << std::endl;
            return false;
        }
    }

    IntentPrediction single = predictor.predictSingle(PROBES[1]);
    if (single.predicted_intent != results[1].predicted_intent) {
        std::cerr << "predictor_distribution: single and batch disagree" << std::endl;
        return false;
    }

    std::cout << "test_predictor_distribution: PASSED" << std::endl;
    return true;
}

// Test 7: confidence threshold maps weak predictions to "unknown"
bool test_predictor_threshold() {
    IntentPredictor predictor(makeOfficeModel(), LabelCodec::officeIntents(), 1.0);

    for (const auto& r : predictor.predictBatch(PROBES)) {
        if (!r.below_threshold || r.predicted_intent != IntentPredictor::UNKNOWN_INTENT) {
            std::cerr << "predictor_threshold: '" << r.text << "' passed threshold 1.0" << std::endl;
            return false;
        }
    }

    bool threw = false;
    try {
        predictor.setThreshold(1.5);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    if (!threw || predictor.getThreshold() != 1.0) {
        std::cerr << "predictor_threshold: invalid threshold accepted" << std::endl;
        return false;
    }

    std::cout << "test_predictor_threshold: PASSED" << std::endl;
    return true;
}

// Test 8: predictor from a checkpoint, with JSON and CSV output
bool test_predictor_from_checkpoint() {
    auto model = makeOfficeModel();
    std::string dir = makeTempDir("predictor");
    ModelSaver::saveCheckpoint(dir, *model, LabelCodec::officeIntents());

    IntentPredictor predictor = IntentPredictor::fromCheckpoint(dir);
    std::vector<IntentPrediction> results = predictor.predictBatch(PROBES);

    std::string json_path = (fs::path(dir) / "predictions.json").string();
    std::string csv_path = (fs::path(dir) / "predictions.csv").string();
    predictor.savePredictions(results, json_path);
    predictor.savePredictions(results, csv_path);

    std::ifstream json_file(json_path);
    json saved = json::parse(json_file);
    std::ifstream csv_file(csv_path);
    std::string header, first_row;
    std::getline(csv_file, header);
    std::getline(csv_file, first_row);
    fs::remove_all(dir);

    if (!saved.is_array() || saved.size() != PROBES.size()
        || saved[0]["predicted_intent"] != results[0].predicted_intent) {
        std::cerr << "predictor_from_checkpoint: json output wrong" << std::endl;
        return false;
    }

    // Probabilities keep their highest-first order in the JSON output
    const json& probs = saved[0]["probabilities"];
    if (!probs.is_array() || probs.size() != 7
        || probs[0]["intent"] != results[0].probabilities[0].first) {
        std::cerr << "predictor_from_checkpoint: json probabilities lost their order" << std::endl;
        return false;
    }
    for (size_t i = 1; i < probs.size(); ++i) {
        if (probs[i]["probability"].get<double>() > probs[i - 1]["probability"].get<double>()) {
            std::cerr << "predictor_from_checkpoint: json probabilities not sorted" << std::endl;
            return false;
        }
    }

    std::string expected_header = "text,predicted_intent,confidence,below_threshold";
    for (const auto& intent : LabelCodec::officeIntents().getLabels()) {
        expected_header += ",prob_" + intent;
    }
    if (header != expected_header) {
        std::cerr << "predictor_from_checkpoint: csv header '" << header << "'" << std::endl;
        return false;
    }
    std::vector<std::string> fields = parseCsvLine(first_row);
    if (fields.size() != 11 || fields[0] != PROBES[0]) {
        std::cerr << "predictor_from_checkpoint: csv row has " << fields.size() << " fields" << std::endl;
        return false;
    }
    double row_sum = 0.0;
    for (size_t c = 4; c < fields.size(); ++c) {
        row_sum += std::stod(fields[c]);
    }
    if (std::abs(row_sum - 1.0) > 1e-3) {
        std::cerr << "predictor_from_checkpoint: csv probabilities sum to " << row_sum << std::endl;
        return false;
    }

    std::cout << "test_predictor_from_checkpoint: PASSED" << std::endl;
    return true;
}

// Test 9: interactive session commands
bool test_interactive_session() {
    IntentPredictor predictor(makeOfficeModel(), LabelCodec::officeIntents());
    std::istringstream in("intents\n\nbook meeting room b\nQUIT\nnever read\n");
    std::ostringstream out;

    predictor.interactive(in, out);
    std::string transcript = out.str();

    for (const char* expected : {"Supported intents", "  - employee_search", "Please enter some text",
                                 "Text: \"book meeting room b\"", "Goodbye!"}) {
        if (transcript.find(expected) == std::string::npos) {
            std::cerr << "interactive_session: transcript lacks '" << expected << "'" << std::endl;
            return false;
        }
    }
    if (transcript.find("never read") != std::string::npos) {
        std::cerr << "interactive_session: kept reading after quit" << std::endl;
        return false;
    }

    std::cout << "test_interactive_session: PASSED" << std::endl;
    return true;
}

int main() {
    std::cout << "=== Checkpoint / Predictor Tests ===" << std::endl;

    int failures = 0;

    if (!test_save_load_roundtrip()) ++failures;
    if (!test_missing_label_mapping()) ++failures;
    if (!test_label_count_mismatch()) ++failures;
    if (!test_truncated_weights()) ++failures;
    if (!test_corrupt_tensor_shape()) ++failures;
    if (!test_predictor_distribution()) ++failures;
    if (!test_predictor_threshold()) ++failures;
    if (!test_predictor_from_checkpoint()) ++failures;
    if (!test_interactive_session()) ++failures;

    if (failures > 0) {
        std::cerr << failures << " test(s) FAILED" << std::endl;
        return 1;
    }

    std::cout << "=== All Checkpoint / Predictor tests passed (9/9) ===" << std::endl;
    return 0;
}
