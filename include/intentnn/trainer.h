#ifndef INTENTNN_TRAINER_H
#define INTENTNN_TRAINER_H

#include "data_loader.h"
#include "dataset.h"
#include "label_codec.h"
#include "loss.h"
#include "lr_scheduler.h"
#include "optimizer.h"
#include "sequence_classifier.h"
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Fine-tuning hyper-parameters
 *
 * The six training fields have no defaults; every caller states them.
 */
struct TrainingConfig {
    size_t batch_size;
    double learning_rate;
    size_t num_epochs;
    size_t warmup_steps;
    double weight_decay;
    size_t early_stopping_patience;

    unsigned int shuffle_seed = 42;
    bool verbose = true;

    // Global gradient-norm ceiling applied before every update
    static constexpr double MAX_GRAD_NORM = 1.0;

    TrainingConfig(size_t batch_size, double learning_rate, size_t num_epochs,
                   size_t warmup_steps, double weight_decay, size_t early_stopping_patience);

    /**
     * @throws ConfigurationError on zero batch size, non-positive or
     *         non-finite learning rate, negative or non-finite weight decay
     */
    void validate() const;

    nlohmann::json toJson() const;

    /**
     * @brief Parse the "training" section of a run config
     * @throws ConfigurationError naming the first missing or invalid key
     */
    static TrainingConfig fromJson(const nlohmann::json& j);
};

struct EpochRecord {
    size_t epoch;           // 1-based
    double train_loss;
    double val_loss;
    double val_accuracy;
    double learning_rate;   // Rate after the epoch's last step

    nlohmann::json toJson() const;
};

/**
 * @brief Append-only per-epoch log of one training run
 */
class TrainingHistory {
private:
    std::vector<EpochRecord> records;

public:
    size_t best_epoch = 0;
    double best_val_loss = std::numeric_limits<double>::infinity();
    bool stopped_early = false;

    void append(const EpochRecord& record) { records.push_back(record); }

    const std::vector<EpochRecord>& getRecords() const { return records; }
    size_t size() const { return records.size(); }
    bool empty() const { return records.empty(); }
    const EpochRecord& operator[](size_t i) const { return records.at(i); }

    nlohmann::json toJson() const;
    void save(const std::string& path) const;
};

/**
 * @brief Best weights seen so far, owned by the Trainer
 */
struct Checkpoint {
    WeightSnapshot weights;
    LabelCodec labels;
    size_t epoch;
    double val_loss;
};

enum class TrainerState {
    Idle,
    TrainingEpoch,
    Validating,
    CheckpointUpdate,
    PatienceIncrement,
    Stopped
};

std::string toString(TrainerState state);

struct ValidationResult {
    double loss;
    double accuracy;
};

/**
 * @brief Epoch loop with validation, best-checkpoint retention and early stopping
 *
 * Per epoch:
 *   1. TrainingEpoch: shuffled batches, zero grad → forward → cross-entropy →
 *      backward → clip to MAX_GRAD_NORM → AdamW step → scheduler step
 *   2. Validating: unshuffled batches through the inference path
 *   3. CheckpointUpdate if val loss < best (strict), else PatienceIncrement;
 *      patience reaching early_stopping_patience stops the run
 *
 * At the end the best checkpoint is restored into the model and, when a
 * save path is given, persisted with the label mapping and the history.
 *
 * The model, label codec and datasets must outlive the Trainer.
 */
class Trainer {
private:
    SequenceClassifier& model;
    const LabelCodec& labels;
    TrainingConfig config;

    DataLoader train_loader;
    DataLoader val_loader;

    CrossEntropyLoss loss_fn;
    AdamW optimizer;
    LinearWarmupScheduler scheduler;

    TrainerState state;
    TrainingHistory history;
    std::optional<Checkpoint> best_checkpoint;
    size_t patience_counter;
    size_t global_step;
    size_t total_steps;

    double trainEpoch();
    void logConfig(size_t train_size, size_t val_size) const;

public:
    /**
     * @throws ConfigurationError on invalid config, empty datasets, or
     *         datasets / label codec that do not fit the model
     */
    Trainer(SequenceClassifier& model,
            const LabelCodec& labels,
            const EncodedDataset& train_data,
            const EncodedDataset& val_data,
            const TrainingConfig& config);

    /**
     * @brief Run the full training loop once
     * @param save_path Checkpoint directory, empty to skip persistence
     * @return Per-epoch history
     * @throws NumericalDivergenceError if a loss or gradient norm is non-finite
     */
    TrainingHistory train(const std::string& save_path = "");

    /**
     * @brief Mean batch loss and accuracy over the validation set
     */
    ValidationResult validate() const;

    // Invoked after every epoch, including the one that triggers early stopping
    std::function<void(const EpochRecord&)> on_epoch_end;

    TrainerState getState() const { return state; }
    const std::optional<Checkpoint>& getBestCheckpoint() const { return best_checkpoint; }
    bool stoppedEarly() const { return history.stopped_early; }
    size_t getPatienceCounter() const { return patience_counter; }
    size_t getGlobalStep() const { return global_step; }
    size_t getTotalSteps() const { return total_steps; }
};

#endif // INTENTNN_TRAINER_H
