#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "Category.hpp"

/**
 * Per-classifier settings, fixed for the life of a Classifier
 */
struct ClassifierConfig {
    size_t input_size = 64;
    size_t hidden_size = 32;
    size_t output_size = 8;
    double learning_rate = 0.15;
    double ban_threshold = 0.7;
    double weight_stddev = 0.5;
    std::optional<uint32_t> seed;       // Non-deterministic when empty
    std::string memory_file = "data/pyx_memory.json";
};

/**
 * Config - Application settings
 *
 * Loaded from a "key = value" file; '#' starts a comment line.
 *
 * Keys: input_size, hidden_size, output_size, learning_rate, ban_threshold,
 * weight_stddev, seed, data_dir, memory_file, corpus_file, log_file,
 * default_category
 */
struct Config {
    ClassifierConfig classifier;
    std::string data_dir = "data";
    std::string memory_file = "pyx_memory.json";
    std::string corpus_file = "data/training_grounds.txt";
    std::string log_file = "logs/pyx.log";
    Category default_category = Category::PHRASES;
    bool replay_corpus = true;

    /**
     * Load (or overlay) settings from file
     *
     * Unknown keys and bad values are reported and skipped.
     *
     * @param filename Path to config file
     * @return true if the file was read, false if it could not be opened
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Apply one setting
     *
     * Numbers must use the whole value: no sign on sizes or the seed, no
     * trailing text. Sizes are 1..4096, the seed fits 32 bits, the learning
     * rate is positive, the weight spread is not negative.
     *
     * @return false if the key is unknown or the value is rejected (the
     *         current setting is kept)
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * Snapshot path: data_dir / memory_file
     */
    std::string memoryPath() const;

    /**
     * Classifier settings with the resolved snapshot path
     */
    ClassifierConfig classifierConfig() const;
};

#endif // CONFIG_HPP
