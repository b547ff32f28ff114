/**
 * @file intent_predict.cpp
 * @brief Predict intents with a trained checkpoint
 *
 * Usage:
 *   intent_predict <checkpoint_dir> [--threshold T] [text ...]
 *   intent_predict <checkpoint_dir> [--threshold T] --file input.txt [--output out.json|out.csv]
 *
 * With no texts and no input file, starts an interactive prompt.
 */

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

#include "intentnn/console.h"
#include "intentnn/data_io.h"
#include "intentnn/predictor.h"

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <checkpoint_dir> [--threshold T] [text ...]\n"
              << "       " << prog << " <checkpoint_dir> [--threshold T] --file input.txt"
              << " [--output out.json|out.csv]\n";
}

void printPrediction(size_t i, const IntentPrediction& p) {
    std::cout << std::setw(2) << i << ". \"" << p.text << "\"\n";
    std::cout << "    -> " << (p.below_threshold ? INTENTNN_YELLOW : INTENTNN_GREEN)
              << p.predicted_intent << INTENTNN_RESET
              << std::fixed << std::setprecision(3)
              << " (confidence: " << p.confidence << ")" << std::defaultfloat << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 2;
    }

    const std::string checkpoint_dir = argv[1];
    double threshold = 0.0;
    std::string input_file;
    std::string output_file;
    std::vector<std::string> texts;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if ((arg == "--threshold" || arg == "--file" || arg == "--output") && i + 1 >= argc) {
                printUsage(argv[0]);
                return 2;
            }
            if (arg == "--threshold") {
                threshold = std::stod(argv[++i]);
            } else if (arg == "--file") {
                input_file = argv[++i];
            } else if (arg == "--output") {
                output_file = argv[++i];
            } else {
                texts.push_back(arg);
            }
        }

        IntentPredictor predictor = IntentPredictor::fromCheckpoint(checkpoint_dir, threshold);

        if (!input_file.empty()) {
            std::vector<std::string> lines = loadTextLines(input_file);
            texts.insert(texts.end(), lines.begin(), lines.end());
            printProgress("Read " + std::to_string(lines.size()) + " texts from " + input_file);
        }

        if (texts.empty()) {
            predictor.interactive(std::cin, std::cout);
            return 0;
        }

        std::vector<IntentPrediction> results = predictor.predictBatch(texts);
        for (size_t i = 0; i < results.size(); ++i) {
            printPrediction(i + 1, results[i]);
        }

        if (!output_file.empty()) {
            predictor.savePredictions(results, output_file);
            printProgress("Results saved to " + output_file);
        }
    } catch (const std::exception& e) {
        printError(e.what());
        return 1;
    }

    return 0;
}
