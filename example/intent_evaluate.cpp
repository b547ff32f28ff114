/**
 * @file intent_evaluate.cpp
 * @brief Evaluate a trained checkpoint on a labeled test file
 *
 * Usage: intent_evaluate <checkpoint_dir> <test_file> [output_dir]
 */

#include <iostream>
#include <string>

#include "intentnn/console.h"
#include "intentnn/data_io.h"
#include "intentnn/evaluator.h"
#include "intentnn/model_saver.h"

int main(int argc, char** argv) {
    if (argc < 3 || argc > 4) {
        std::cerr << "Usage: " << argv[0] << " <checkpoint_dir> <test_file> [output_dir]\n";
        return 2;
    }
    const std::string checkpoint_dir = argv[1];
    const std::string test_path = argv[2];
    const std::string output_dir = argc == 4 ? argv[3] : "evaluation_results";

    try {
        printHeader("Intent Classifier Evaluation");

        LoadedCheckpoint checkpoint = ModelSaver::loadCheckpoint(checkpoint_dir);
        printProgress("Loaded checkpoint from " + checkpoint_dir + " ("
                      + std::to_string(checkpoint.labels.size()) + " intents)");

        LabeledData test = loadLabeledData(test_path);
        printProgress("Loaded " + std::to_string(test.size()) + " test samples");

        Evaluator evaluator(*checkpoint.model, checkpoint.labels);
        EvaluationReport report = evaluator.evaluate(test.texts, test.labels);

        report.printSummary();
        report.printErrorAnalysis();
        report.save(output_dir);
        printProgress("Detailed results saved to " + output_dir);
    } catch (const std::exception& e) {
        printError(e.what());
        return 1;
    }

    return 0;
}
