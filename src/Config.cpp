#include "Config.hpp"
#include "Logger.hpp"
#include "StringUtils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

using namespace utils;

// Largest accepted network dimension
static constexpr unsigned long MAX_DIMENSION = 4096;

// Whole-string unsigned parse: no sign, no trailing text, value <= max
static bool parseUnsigned(const std::string& value, unsigned long max, unsigned long& out) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value[0]))) {
        return false;
    }
    size_t pos = 0;
    unsigned long parsed = std::stoul(value, &pos);
    if (pos != value.size() || parsed > max) {
        return false;
    }
    out = parsed;
    return true;
}

static bool parseDimension(const std::string& value, size_t& out) {
    unsigned long parsed = 0;
    if (!parseUnsigned(value, MAX_DIMENSION, parsed) || parsed == 0) {
        return false;
    }
    out = parsed;
    return true;
}

// Whole-string finite real parse
static bool parseReal(const std::string& value, double& out) {
    if (value.empty() || std::isspace(static_cast<unsigned char>(value[0]))) {
        return false;
    }
    size_t pos = 0;
    double parsed = std::stod(value, &pos);
    if (pos != value.size() || !std::isfinite(parsed)) {
        return false;
    }
    out = parsed;
    return true;
}

// ====================================================================================================
// Public Methods
// ====================================================================================================

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open " << filename << "\n";
        return false;
    }

    Logger logger("Config");
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);

        // Skip empty lines and comments
        if (entry.empty() || entry[0] == '#') {
            continue;
        }

        size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            logger.logWarning(filename + ":" + std::to_string(line_no) + ": expected key = value");
            continue;
        }

        std::string key = trim(entry.substr(0, eq));
        std::string value = trim(entry.substr(eq + 1));
        if (!set(key, value)) {
            logger.logWarning(filename + ":" + std::to_string(line_no) + ": ignoring '" + key + "'");
        }
    }

    return true;
}

bool Config::set(const std::string& key, const std::string& value) {
    try {
        if (key == "input_size") {
            return parseDimension(value, classifier.input_size);
        } else if (key == "hidden_size") {
            return parseDimension(value, classifier.hidden_size);
        } else if (key == "output_size") {
            return parseDimension(value, classifier.output_size);
        } else if (key == "learning_rate") {
            double rate = 0.0;
            if (!parseReal(value, rate) || rate <= 0.0) return false;
            classifier.learning_rate = rate;
        } else if (key == "ban_threshold") {
            return parseReal(value, classifier.ban_threshold);
        } else if (key == "weight_stddev") {
            double stddev = 0.0;
            if (!parseReal(value, stddev) || stddev < 0.0) return false;
            classifier.weight_stddev = stddev;
        } else if (key == "seed") {
            unsigned long seed = 0;
            if (!parseUnsigned(value, UINT32_MAX, seed)) return false;
            classifier.seed = static_cast<uint32_t>(seed);
        } else if (key == "data_dir") {
            data_dir = value;
        } else if (key == "memory_file") {
            memory_file = value;
        } else if (key == "corpus_file") {
            corpus_file = value;
        } else if (key == "log_file") {
            log_file = value;
        } else if (key == "default_category") {
            return parseCategory(value, default_category);
        } else {
            return false;
        }
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

std::string Config::memoryPath() const {
    return (std::filesystem::path(data_dir) / memory_file).string();
}

ClassifierConfig Config::classifierConfig() const {
    ClassifierConfig cfg = classifier;
    cfg.memory_file = memoryPath();
    return cfg;
}
