#include "TrainingGrounds.hpp"
#include "Classifier.hpp"
#include "Logger.hpp"
#include "StringUtils.hpp"

#include <fstream>
#include <iostream>

using namespace utils;

// ====================================================================================================
// Public Methods
// ====================================================================================================

bool TrainingGrounds::loadFromFile(const std::string& filename) {
    examples.clear();

    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[TrainingGrounds] Failed to open " << filename << "\n";
        return false;
    }

    Logger logger("TrainingGrounds");
    std::string line;
    size_t line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        std::string entry = trim(line);

        // Skip empty lines and comment lines
        if (entry.empty() || entry[0] == '#') {
            continue;
        }

        Example example;
        if (!parseLine(entry, example)) {
            logger.logWarning(filename + ":" + std::to_string(line_no) + ": malformed example skipped");
            continue;
        }
        examples.push_back(example);
    }

    logger.logInfo("Loaded " + std::to_string(examples.size()) + " examples from " + filename);
    return true;
}

bool TrainingGrounds::parseLine(const std::string& line, Example& out) {
    size_t bar = line.find('|');
    if (bar == std::string::npos) {
        return false;
    }

    std::string label = toLower(trim(line.substr(0, bar)));
    if (label == "safe") {
        out.safe = true;
    } else if (label == "bad") {
        out.safe = false;
    } else {
        return false;
    }

    // Optional category field; otherwise the remainder is the text
    std::string rest = line.substr(bar + 1);
    out.category = Category::PHRASES;
    size_t second = rest.find('|');
    if (second != std::string::npos) {
        Category category;
        if (parseCategory(trim(rest.substr(0, second)), category)) {
            out.category = category;
            rest = rest.substr(second + 1);
        }
    }

    out.text = trim(rest);
    return !out.text.empty();
}

size_t TrainingGrounds::replay(Classifier& classifier) const {
    for (const Example& example : examples) {
        classifier.setLabel(example.text, example.safe, example.category);
    }
    return examples.size();
}
