#include "intentnn/trainer.h"
#include "intentnn/console.h"
#include "intentnn/errors.h"
#include "intentnn/model_saver.h"
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

// ===== TrainingConfig =====

TrainingConfig::TrainingConfig(size_t batch_size, double learning_rate, size_t num_epochs,
                               size_t warmup_steps, double weight_decay,
                               size_t early_stopping_patience)
    : batch_size(batch_size), learning_rate(learning_rate), num_epochs(num_epochs),
      warmup_steps(warmup_steps), weight_decay(weight_decay),
      early_stopping_patience(early_stopping_patience) {}

void TrainingConfig::validate() const {
    if (batch_size == 0) {
        throw ConfigurationError("batch_size must be positive");
    }
    if (!std::isfinite(learning_rate) || learning_rate <= 0.0) {
        throw ConfigurationError("learning_rate must be a positive finite number");
    }
    if (!std::isfinite(weight_decay) || weight_decay < 0.0) {
        throw ConfigurationError("weight_decay must be a non-negative finite number");
    }
}

json TrainingConfig::toJson() const {
    return {
        {"batch_size", batch_size},
        {"learning_rate", learning_rate},
        {"num_epochs", num_epochs},
        {"warmup_steps", warmup_steps},
        {"weight_decay", weight_decay},
        {"early_stopping_patience", early_stopping_patience},
        {"shuffle_seed", shuffle_seed},
        {"max_grad_norm", MAX_GRAD_NORM}
    };
}

namespace {

const json& requireKey(const json& j, const char* key) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigurationError(std::string("training config is missing '") + key + "'");
    }
    return j.at(key);
}

// Literals built in code are stored signed, parsed text unsigned; accept both
bool isCount(const json& value) {
    return value.is_number_integer() && value.get<long long>() >= 0;
}

size_t requireCount(const json& j, const char* key) {
    const json& value = requireKey(j, key);
    if (!isCount(value)) {
        throw ConfigurationError(std::string("training.") + key + " must be a non-negative integer");
    }
    return static_cast<size_t>(value.get<long long>());
}

double requireNumber(const json& j, const char* key) {
    const json& value = requireKey(j, key);
    if (!value.is_number()) {
        throw ConfigurationError(std::string("training.") + key + " must be a number");
    }
    return value.get<double>();
}

} // namespace

TrainingConfig TrainingConfig::fromJson(const json& j) {
    TrainingConfig config(requireCount(j, "batch_size"),
                          requireNumber(j, "learning_rate"),
                          requireCount(j, "num_epochs"),
                          requireCount(j, "warmup_steps"),
                          requireNumber(j, "weight_decay"),
                          requireCount(j, "early_stopping_patience"));

    if (j.contains("shuffle_seed")) {
        if (!isCount(j["shuffle_seed"])) {
            throw ConfigurationError("training.shuffle_seed must be a non-negative integer");
        }
        config.shuffle_seed = static_cast<unsigned int>(j["shuffle_seed"].get<long long>());
    }
    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) {
            throw ConfigurationError("training.verbose must be true or false");
        }
        config.verbose = j["verbose"].get<bool>();
    }
    config.validate();
    return config;
}

// ===== History =====

json EpochRecord::toJson() const {
    return {
        {"epoch", epoch},
        {"train_loss", train_loss},
        {"val_loss", val_loss},
        {"val_accuracy", val_accuracy},
        {"learning_rate", learning_rate}
    };
}

json TrainingHistory::toJson() const {
    json j;
    j["epochs"] = json::array();
    for (const auto& record : records) {
        j["epochs"].push_back(record.toJson());
    }
    j["best_epoch"] = best_epoch;
    // JSON has no infinity
    j["best_val_loss"] = std::isfinite(best_val_loss) ? json(best_val_loss) : json(nullptr);
    j["stopped_early"] = stopped_early;
    j["num_epochs_completed"] = records.size();
    return j;
}

void TrainingHistory::save(const std::string& path) const {
    ModelSaver::saveJson(path, toJson());
}

std::string toString(TrainerState state) {
    switch (state) {
        case TrainerState::Idle: return "Idle";
        case TrainerState::TrainingEpoch: return "TrainingEpoch";
        case TrainerState::Validating: return "Validating";
        case TrainerState::CheckpointUpdate: return "CheckpointUpdate";
        case TrainerState::PatienceIncrement: return "PatienceIncrement";
        case TrainerState::Stopped: return "Stopped";
    }
    return "Unknown";
}

// ===== Trainer =====

namespace {

const TrainingConfig& validated(const TrainingConfig& config) {
    config.validate();
    return config;
}

} // namespace

Trainer::Trainer(SequenceClassifier& model,
                 const LabelCodec& labels,
                 const EncodedDataset& train_data,
                 const EncodedDataset& val_data,
                 const TrainingConfig& cfg)
    : model(model),
      labels(labels),
      config(validated(cfg)),
      train_loader(train_data, cfg.batch_size, true, cfg.shuffle_seed),
      val_loader(val_data, cfg.batch_size, false),
      optimizer(cfg.learning_rate, cfg.weight_decay),
      // Fixed once here; early stopping leaves the tail unvisited
      scheduler(optimizer, cfg.learning_rate, cfg.warmup_steps,
                train_loader.numBatches() * cfg.num_epochs),
      state(TrainerState::Idle),
      patience_counter(0),
      global_step(0),
      total_steps(train_loader.numBatches() * cfg.num_epochs)
{
    if (train_data.empty()) {
        throw ConfigurationError("Training set is empty");
    }
    if (val_data.empty()) {
        throw ConfigurationError("Validation set is empty");
    }
    if (labels.size() != model.numLabels()) {
        throw ConfigurationError("Label set has " + std::to_string(labels.size())
                                 + " intents but the model head has "
                                 + std::to_string(model.numLabels()));
    }
    if (train_data.getMaxLength() != model.maxLength() || val_data.getMaxLength() != model.maxLength()) {
        throw ConfigurationError("Dataset max_length does not match the model's max_length");
    }
}

void Trainer::logConfig(size_t train_size, size_t val_size) const {
    printHeader("Training Intent Classifier");
    std::cout << "  Training examples:   " << train_size << "\n";
    std::cout << "  Validation examples: " << val_size << "\n";
    std::cout << "  Intents:             " << labels.size() << "\n";
    std::cout << "  Parameters:          " << model.numParameters() << "\n";
    std::cout << "  Batch size:          " << config.batch_size << "\n";
    std::cout << "  Epochs:              " << config.num_epochs << "\n";
    std::cout << "  Learning rate:       " << config.learning_rate << "\n";
    std::cout << "  Warmup steps:        " << config.warmup_steps << "\n";
    std::cout << "  Total steps:         " << total_steps << "\n";
    std::cout << "  Weight decay:        " << config.weight_decay << "\n";
    std::cout << "  Patience:            " << config.early_stopping_patience << "\n\n";
}

double Trainer::trainEpoch() {
    std::vector<Parameter*> params = model.parameters();
    double total_loss = 0.0;
    size_t num_batches = 0;

    for (const Batch& batch : train_loader) {
        model.zeroGrad();

        Matrix logits = model.forward(batch);
        double loss = loss_fn.calculate(logits, batch.label_ids);
        if (!std::isfinite(loss)) {
            throw NumericalDivergenceError("Non-finite training loss at step "
                                           + std::to_string(global_step + 1));
        }

        model.backward(loss_fn.gradient(logits, batch.label_ids));

        double norm = clipGradNorm(params, TrainingConfig::MAX_GRAD_NORM);
        if (!std::isfinite(norm)) {
            throw NumericalDivergenceError("Non-finite gradient norm at step "
                                           + std::to_string(global_step + 1));
        }

        optimizer.step(params);
        scheduler.step();
        ++global_step;

        total_loss += loss;
        ++num_batches;
    }

    return total_loss / static_cast<double>(num_batches);
}

ValidationResult Trainer::validate() const {
    double total_loss = 0.0;
    size_t num_batches = 0;
    size_t correct = 0;
    size_t total = 0;

    // Validation never shuffles, so a local copy iterates in dataset order
    DataLoader loader = val_loader;
    for (const Batch& batch : loader) {
        Matrix logits = model.predictLogits(batch);
        double loss = loss_fn.calculate(logits, batch.label_ids);
        if (!std::isfinite(loss)) {
            throw NumericalDivergenceError("Non-finite validation loss");
        }
        total_loss += loss;
        ++num_batches;

        for (size_t i = 0; i < batch.size(); ++i) {
            if (static_cast<int>(logits.argmaxRow(i)) == batch.label_ids[i]) {
                ++correct;
            }
        }
        total += batch.size();
    }

    return {total_loss / static_cast<double>(num_batches),
            static_cast<double>(correct) / static_cast<double>(total)};
}

TrainingHistory Trainer::train(const std::string& save_path) {
    if (state != TrainerState::Idle) {
        throw std::runtime_error("Trainer::train can only run once per Trainer (state: "
                                 + toString(state) + ")");
    }

    if (config.verbose) {
        logConfig(train_loader.order().size(), val_loader.order().size());
    }

    if (config.num_epochs == 0) {
        if (config.verbose) {
            printWarning("num_epochs is 0, keeping the initial weights");
        }
        state = TrainerState::Stopped;
        if (!save_path.empty()) {
            ModelSaver::saveCheckpoint(save_path, model, labels);
            history.save((std::filesystem::path(save_path) / "training_history.json").string());
        }
        return history;
    }

    for (size_t epoch = 1; epoch <= config.num_epochs; ++epoch) {
        state = TrainerState::TrainingEpoch;
        double train_loss = trainEpoch();

        state = TrainerState::Validating;
        ValidationResult val = validate();

        EpochRecord record{epoch, train_loss, val.loss, val.accuracy, scheduler.getLastLr()};
        history.append(record);

        if (config.verbose) {
            std::ostringstream line;
            line << std::fixed << std::setprecision(4)
                 << "Epoch " << epoch << "/" << config.num_epochs
                 << " | train_loss " << train_loss
                 << " | val_loss " << val.loss
                 << " | val_acc " << val.accuracy
                 << std::scientific << std::setprecision(2)
                 << " | lr " << record.learning_rate;
            std::cout << INTENTNN_BOLD << line.str() << INTENTNN_RESET << "\n";
        }

        // Strict comparison: a tie keeps the earlier checkpoint
        if (val.loss < history.best_val_loss) {
            state = TrainerState::CheckpointUpdate;
            history.best_val_loss = val.loss;
            history.best_epoch = epoch;
            best_checkpoint = Checkpoint{model.snapshot(), labels, epoch, val.loss};
            patience_counter = 0;
            if (config.verbose) {
                printProgress("New best model (val_loss " + std::to_string(val.loss) + ")");
            }
        } else {
            state = TrainerState::PatienceIncrement;
            ++patience_counter;
            if (config.verbose) {
                printWarning("No improvement (patience " + std::to_string(patience_counter)
                             + "/" + std::to_string(config.early_stopping_patience) + ")",
                             std::cout);
            }
            if (patience_counter >= config.early_stopping_patience) {
                history.stopped_early = true;
            }
        }

        if (on_epoch_end) {
            on_epoch_end(record);
        }

        if (history.stopped_early) {
            if (config.verbose) {
                printWarning("Early stopping after epoch " + std::to_string(epoch), std::cout);
            }
            break;
        }
    }

    state = TrainerState::Stopped;

    if (best_checkpoint) {
        model.restore(best_checkpoint->weights);
        if (config.verbose) {
            printProgress("Restored best model from epoch " + std::to_string(best_checkpoint->epoch));
        }
    }

    if (!save_path.empty()) {
        ModelSaver::saveCheckpoint(save_path, model, best_checkpoint ? best_checkpoint->labels : labels);
        history.save((std::filesystem::path(save_path) / "training_history.json").string());
        if (config.verbose) {
            printProgress("Saved checkpoint to " + save_path);
        }
    }

    return history;
}
