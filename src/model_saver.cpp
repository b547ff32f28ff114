#include "intentnn/model_saver.h"
#include "intentnn/embedding_pool_classifier.h"
#include "intentnn/errors.h"
#include <cstring>
#include <filesystem>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const char WEIGHTS_MAGIC[4] = {'I', 'N', 'N', '1'};

std::string joinPath(const std::string& dir, const char* file) {
    return (fs::path(dir) / file).string();
}

} // namespace

void ModelSaver::saveConfig(const std::string& dir, const json& config) {
    saveJson(joinPath(dir, CONFIG_FILE), config);
}

json ModelSaver::loadConfig(const std::string& dir) {
    std::string path = joinPath(dir, CONFIG_FILE);
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CheckpointError("Cannot open " + path);
    }
    json config;
    try {
        file >> config;
    } catch (const json::parse_error& e) {
        throw CheckpointError("Cannot parse " + path + ": " + e.what());
    }
    return config;
}

void ModelSaver::saveMatrix(std::ofstream& file, const Matrix& mat) {
    size_t rows = mat.getRows();
    size_t cols = mat.getCols();

    file.write(reinterpret_cast<const char*>(&rows), sizeof(size_t));
    file.write(reinterpret_cast<const char*>(&cols), sizeof(size_t));
    file.write(reinterpret_cast<const char*>(mat.raw()),
               static_cast<std::streamsize>(mat.size() * sizeof(double)));
}

Matrix ModelSaver::loadMatrix(std::ifstream& file) {
    size_t rows = 0, cols = 0;
    file.read(reinterpret_cast<char*>(&rows), sizeof(size_t));
    file.read(reinterpret_cast<char*>(&cols), sizeof(size_t));
    if (!file) {
        throw CheckpointError("Truncated tensor header in weights file");
    }

    // Shape must fit in what is left of the file before anything is allocated
    std::streamoff here = file.tellg();
    file.seekg(0, std::ios::end);
    std::streamoff end = file.tellg();
    file.seekg(here, std::ios::beg);
    if (here < 0 || end < here) {
        throw CheckpointError("Cannot determine weights file size");
    }
    size_t remaining = static_cast<size_t>(end - here);
    if (cols != 0 && rows > remaining / sizeof(double) / cols) {
        throw CheckpointError("Tensor shape " + std::to_string(rows) + "x" + std::to_string(cols)
                              + " exceeds the remaining " + std::to_string(remaining)
                              + " bytes of the weights file");
    }

    Matrix mat(rows, cols);
    file.read(reinterpret_cast<char*>(mat.raw()),
              static_cast<std::streamsize>(mat.size() * sizeof(double)));
    if (!file) {
        throw CheckpointError("Truncated tensor data in weights file");
    }
    return mat;
}

void ModelSaver::saveWeights(const std::string& dir, const WeightSnapshot& weights) {
    std::string path = joinPath(dir, WEIGHTS_FILE);
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CheckpointError("Cannot write " + path);
    }

    file.write(WEIGHTS_MAGIC, sizeof(WEIGHTS_MAGIC));
    size_t count = weights.size();
    file.write(reinterpret_cast<const char*>(&count), sizeof(size_t));

    for (const auto& [name, mat] : weights) {
        size_t len = name.size();
        file.write(reinterpret_cast<const char*>(&len), sizeof(size_t));
        file.write(name.data(), static_cast<std::streamsize>(len));
        saveMatrix(file, mat);
    }

    if (!file) {
        throw CheckpointError("Failed while writing " + path);
    }
}

WeightSnapshot ModelSaver::loadWeights(const std::string& dir) {
    std::string path = joinPath(dir, WEIGHTS_FILE);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw CheckpointError("Cannot open " + path);
    }

    char magic[sizeof(WEIGHTS_MAGIC)];
    file.read(magic, sizeof(magic));
    if (!file || std::memcmp(magic, WEIGHTS_MAGIC, sizeof(magic)) != 0) {
        throw CheckpointError("Not an IntentNN weights file: " + path);
    }

    size_t count = 0;
    file.read(reinterpret_cast<char*>(&count), sizeof(size_t));
    if (!file) {
        throw CheckpointError("Truncated weights file: " + path);
    }

    WeightSnapshot weights;
    for (size_t i = 0; i < count; ++i) {
        size_t len = 0;
        file.read(reinterpret_cast<char*>(&len), sizeof(size_t));
        if (!file || len > 4096) {
            throw CheckpointError("Corrupt tensor name in " + path);
        }
        std::string name(len, '\0');
        file.read(&name[0], static_cast<std::streamsize>(len));
        if (!file) {
            throw CheckpointError("Truncated tensor name in " + path);
        }
        weights[name] = loadMatrix(file);
    }
    return weights;
}

void ModelSaver::saveCheckpoint(const std::string& dir,
                                const SequenceClassifier& model,
                                const LabelCodec& labels) {
    if (labels.size() != model.numLabels()) {
        throw CheckpointError("Label mapping has " + std::to_string(labels.size())
                              + " intents but the model head has " + std::to_string(model.numLabels()));
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw CheckpointError("Cannot create checkpoint directory " + dir + ": " + ec.message());
    }

    json config;
    config["model_type"] = model.getName();
    config["model"] = model.getConfig();
    config["tokenizer"] = {{"type", model.tokenizer().getName()}};
    config["max_length"] = model.maxLength();
    config["num_labels"] = model.numLabels();

    saveConfig(dir, config);
    saveWeights(dir, model.snapshot());
    labels.save(joinPath(dir, LABELS_FILE));
    model.tokenizer().save(dir);
}

LoadedCheckpoint ModelSaver::loadCheckpoint(const std::string& dir) {
    if (!fs::is_directory(dir)) {
        throw CheckpointError("Checkpoint directory not found: " + dir);
    }

    // The label mapping must be present before any weights are trusted
    std::string labels_path = joinPath(dir, LABELS_FILE);
    if (!fs::exists(labels_path)) {
        throw CheckpointError("Checkpoint " + dir + " has no " + LABELS_FILE);
    }
    LabelCodec labels = LabelCodec::load(labels_path);

    json config = loadConfig(dir);
    std::string model_type = config.value("model_type", "");
    std::string tokenizer_type = config.contains("tokenizer")
                                 ? config["tokenizer"].value("type", "") : "";

    std::unique_ptr<SequenceClassifier> model;
    if (model_type == "embedding_pool") {
        try {
            EmbeddingPoolConfig model_config = EmbeddingPoolConfig::fromJson(config.at("model"));
            model = std::make_unique<EmbeddingPoolClassifier>(model_config,
                                                              loadTokenizer(tokenizer_type, dir));
        } catch (const json::exception& e) {
            throw CheckpointError(std::string("config.json has no model section: ") + e.what());
        } catch (const ConfigurationError& e) {
            throw CheckpointError(std::string("Checkpoint config is invalid: ") + e.what());
        }
    } else {
        throw CheckpointError("Unknown model type in checkpoint: '" + model_type + "'");
    }

    if (labels.size() != model->numLabels()) {
        throw CheckpointError("Label mapping has " + std::to_string(labels.size())
                              + " intents but the model head has " + std::to_string(model->numLabels()));
    }

    model->restore(loadWeights(dir));
    return {std::move(model), labels};
}

void ModelSaver::saveJson(const std::string& path, const json& j) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write " + path);
    }
    file << j.dump(2);
}
