/**
 * @file intent_train.cpp
 * @brief Fine-tune the intent classifier from a run config
 *
 * Usage: intent_train <run_config.json>
 *
 * Loads train/validation data, builds the tokenizer and model, trains with
 * early stopping, writes the best checkpoint to output_dir and, when a test
 * file is configured, evaluates it into output_dir/evaluation.
 */

#include <iostream>
#include <filesystem>
#include <memory>
#include <string>

#include "intentnn/config.h"
#include "intentnn/console.h"
#include "intentnn/data_io.h"
#include "intentnn/dataset.h"
#include "intentnn/embedding_pool_classifier.h"
#include "intentnn/evaluator.h"
#include "intentnn/trainer.h"

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <run_config.json>\n";
        return 2;
    }

    try {
        RunConfig config = RunConfig::load(argv[1]);
        LabelCodec labels = config.labelCodec();

        printHeader("Intent Classifier Training");

        LabeledData train = loadLabeledData(config.train_path);
        LabeledData val = loadLabeledData(config.validation_path);
        printProgress("Loaded " + std::to_string(train.size()) + " training samples");
        printProgress("Loaded " + std::to_string(val.size()) + " validation samples");

        std::unique_ptr<TextTokenizer> tokenizer = config.tokenizer.create(train.texts);
        printProgress("Tokenizer '" + tokenizer->getName() + "' with vocabulary of "
                      + std::to_string(tokenizer->getVocabSize()));

        EmbeddingPoolConfig model_config = config.model;
        if (model_config.vocab_size < tokenizer->getVocabSize()) {
            model_config.vocab_size = tokenizer->getVocabSize();
        }
        EmbeddingPoolClassifier model(model_config, std::move(tokenizer));
        if (config.training.verbose) {
            model.printSummary();
        }

        EncodedDataset train_data(train.texts, train.labels, model.tokenizer(),
                                  model.maxLength(), labels);
        EncodedDataset val_data(val.texts, val.labels, model.tokenizer(),
                                model.maxLength(), labels);

        Trainer trainer(model, labels, train_data, val_data, config.training);
        TrainingHistory history = trainer.train(config.output_dir);

        std::cout << "\n";
        printProgress("Best epoch: " + std::to_string(history.best_epoch)
                      + " (val_loss " + std::to_string(history.best_val_loss) + ")");
        if (history.stopped_early) {
            printWarning("Training stopped early", std::cout);
        }

        if (!config.test_path.empty()) {
            LabeledData test = loadLabeledData(config.test_path);
            Evaluator evaluator(model, labels);
            EvaluationReport report = evaluator.evaluate(test.texts, test.labels,
                                                         config.training.batch_size);
            report.printSummary();
            report.printErrorAnalysis();

            std::string eval_dir = (std::filesystem::path(config.output_dir) / "evaluation").string();
            report.save(eval_dir);
            printProgress("Evaluation results saved to " + eval_dir);
        }

        printProgress("Model saved to " + config.output_dir);
    } catch (const std::exception& e) {
        printError(e.what());
        return 1;
    }

    return 0;
}
