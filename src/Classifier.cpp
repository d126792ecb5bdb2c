#include "Classifier.hpp"
#include "Encoder.hpp"

#include <fmt/format.h>

// ====================================================================================================
// Constructor
// ====================================================================================================
Classifier::Classifier(const ClassifierConfig& config)
    : cfg(config),
      brain(config.input_size, config.hidden_size, config.output_size,
            config.learning_rate, config.weight_stddev, config.seed),
      store(config.ban_threshold),
      logger("Classifier") {}

// ====================================================================================================
// Scoring and Training
// ====================================================================================================

double Classifier::score(const std::string& text) const {
    return brain.predict(textToInput(text))[0];
}

double Classifier::train(const std::string& text, bool safe, Category category, int epochs) {
    const std::vector<double> inputs = textToInput(text);
    const std::vector<double> targets = feedbackToTarget(safe);

    double loss = 1.0;
    for (int epoch = 0; epoch < epochs; ++epoch) {
        loss = brain.trainStep(inputs, targets);
    }
    logger.logTraining(text, safe, loss);

    const double pred = brain.predict(inputs)[0];
    if (safe && !store.isBanned(pred)) {
        store.add(category, text, pred);
    }
    return loss;
}

double Classifier::train(const std::string& text, bool safe, std::string_view category, int epochs) {
    return train(text, safe, requireCategory(category), epochs);
}

// ====================================================================================================
// Labeling Workflows
// ====================================================================================================

void Classifier::addItem(const std::string& text, bool safe, Category category) {
    train(text, safe, category);
    if (safe) {
        store.add(category, text, score(text));
    } else {
        // Operator says bad: record the override score regardless of the network
        store.forceAdd(category, text, UNSAFE_OVERRIDE_SCORE);
    }
}

void Classifier::addItem(const std::string& text, bool safe, std::string_view category) {
    addItem(text, safe, requireCategory(category));
}

Classifier::Decision Classifier::aiDecide(const std::string& text, Category category) {
    const double s = score(text);
    const bool safe = !store.isBanned(s);
    logger.logDecision(text, safe, s);

    if (safe) {
        store.add(category, text, s);
        train(text, true, category, REINFORCE_EPOCHS);
    }
    return {safe, s};
}

Classifier::Decision Classifier::aiDecide(const std::string& text, std::string_view category) {
    return aiDecide(text, requireCategory(category));
}

std::string Classifier::setLabel(const std::string& text, bool safe, Category category) {
    store.remove(category, text);

    if (safe) {
        train(text, true, category);
        const double pred = score(text);
        if (!store.isBanned(pred)) {
            store.add(category, text, pred);
        }
        logger.logInfo(fmt::format("Labeled '{}' SAFE in {}", text, categoryName(category)));
        return "Marked SAFE and added.";
    }

    train(text, false, category);
    logger.logInfo(fmt::format("Labeled '{}' BAD in {}", text, categoryName(category)));
    return "Marked BAD and removed.";
}

std::string Classifier::setLabel(const std::string& text, bool safe, std::string_view category) {
    return setLabel(text, safe, requireCategory(category));
}

// ====================================================================================================
// Retrieval
// ====================================================================================================

std::optional<std::string> Classifier::respond(const std::string& prompt, Category category) const {
    const Memory::Entries allowed = store.getAllowed(category);
    if (allowed.empty()) {
        return std::nullopt;
    }

    const std::vector<double> inputs = textToInput(prompt);
    std::optional<std::string> best_match;
    double best_score = -1.0;

    // Strict '>' keeps the first (lexicographically smallest) of equal matches
    for (const auto& [item, stored] : allowed) {
        const double s = Encoder::similarity(inputs, textToInput(item));
        if (s > best_score && !store.isBanned(score(item))) {
            best_score = s;
            best_match = item;
        }
    }

    if (best_score > MATCH_THRESHOLD) {
        return best_match;
    }
    return std::nullopt;
}

std::optional<std::string> Classifier::respond(const std::string& prompt, std::string_view category) const {
    return respond(prompt, requireCategory(category));
}

std::vector<std::string> Classifier::getAllowed(Category category) const {
    std::vector<std::string> texts;
    for (const auto& [text, s] : store.getAllowed(category)) {
        texts.push_back(text);
    }
    return texts;
}

// ====================================================================================================
// Persistence
// ====================================================================================================

MemoryFile::LoadStatus Classifier::load() {
    return MemoryFile::load(cfg.memory_file, store);
}

bool Classifier::save() const {
    return MemoryFile::save(cfg.memory_file, store);
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::vector<double> Classifier::textToInput(const std::string& text) const {
    return Encoder::encode(text, brain.inputSize());
}

std::vector<double> Classifier::feedbackToTarget(bool safe) const {
    return std::vector<double>(brain.outputSize(), safe ? 0.0 : 1.0);
}
