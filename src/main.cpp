#include <iostream>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "Classifier.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Shell.hpp"
#include "TrainingGrounds.hpp"


static void printUsage(const char* prog) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << prog << " [--config <file>] [--data-dir <dir>] [--corpus <file>] [--seed <n>] [--no-corpus]\n";
}


int main(int argc, char* argv[]) {
    Config config;

    // Config file first, so command-line values override it
    std::string config_file;
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[i + 1];
        }
    }
    if (!config_file.empty() && !config.loadFromFile(config_file)) {
        return 1;
    }

    // Basic Argument Parsing
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            ++i;
        } else if (arg == "--data-dir" && has_value) {
            config.data_dir = argv[++i];
        } else if (arg == "--corpus" && has_value) {
            config.corpus_file = argv[++i];
        } else if (arg == "--seed" && has_value) {
            if (!config.set("seed", argv[++i])) {
                std::cerr << "Invalid seed: " << argv[i] << "\n";
                return 1;
            }
        } else if (arg == "--no-corpus") {
            config.replay_corpus = false;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    Logger::setLogFile(config.log_file);
    Logger logger("Main");

    try {
        Classifier classifier(config.classifierConfig());

        if (classifier.load() == MemoryFile::LoadStatus::CORRUPT) {
            std::cerr << "Warning: saved memory was unreadable, starting empty.\n";
        }

        // Pre-train from the bundled corpus; the network itself is not persisted
        if (config.replay_corpus) {
            TrainingGrounds grounds;
            if (std::filesystem::exists(config.corpus_file) && grounds.loadFromFile(config.corpus_file)) {
                size_t applied = grounds.replay(classifier);
                logger.logInfo("Replayed " + std::to_string(applied) + " training examples");
            } else {
                logger.logWarning("No training corpus at " + config.corpus_file);
            }
        }

        Shell shell(classifier, std::cin, std::cout, config.default_category);
        shell.run();
    } catch (const std::exception& e) {
        logger.logError(e.what());
        return 1;
    }

    return 0;
}
