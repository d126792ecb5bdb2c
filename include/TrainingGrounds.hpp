#ifndef TRAINING_GROUNDS_HPP
#define TRAINING_GROUNDS_HPP

#include <string>
#include <vector>

#include "Category.hpp"

class Classifier;

/**
 * TrainingGrounds - Labeled example corpus used to pre-train a Classifier
 *
 * File format, one example per line:
 *   safe|<category>|<text>
 *   bad|<category>|<text>
 *   safe|<text>              (category defaults to phrases)
 * Blank lines and lines starting with '#' are skipped.
 */
class TrainingGrounds {
public:
    struct Example {
        std::string text;
        bool safe;
        Category category;
    };

    /**
     * Load (or reload) examples from file
     * @param filename Path to corpus file
     * @return true on success, false if the file could not be opened
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Parse a single corpus line
     * @param line Line without trailing newline
     * @param out Parsed example
     * @return false if the line is malformed
     */
    static bool parseLine(const std::string& line, Example& out);

    void add(const Example& example) { examples.push_back(example); }

    /**
     * Apply every example, in order, through Classifier::setLabel
     * @return Number of examples applied
     */
    size_t replay(Classifier& classifier) const;

    const std::vector<Example>& getExamples() const { return examples; }
    size_t getExampleCount() const { return examples.size(); }
    bool isEmpty() const { return examples.empty(); }
    void clear() { examples.clear(); }

private:
    std::vector<Example> examples;
};

#endif // TRAINING_GROUNDS_HPP
