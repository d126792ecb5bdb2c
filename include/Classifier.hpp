#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "Category.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "Memory.hpp"
#include "MemoryFile.hpp"
#include "Network.hpp"

/**
 * Classifier - Trainable content filter
 *
 * Scores text on a 0-1 scale (higher = more likely inappropriate) and keeps
 * the texts it considers safe in a Memory store, one partition per category.
 *
 * Workflow components:
 * - Encoder: text -> feature vector
 * - Network: feature vector -> score (output unit 0)
 * - Memory: ban-line gated storage
 *
 * Operations taking a category name throw UnknownCategoryError for names
 * outside words / phrases / game_ideas.
 *
 * A Classifier has a single owner; none of its operations are thread-safe.
 */
class Classifier {
public:
    static constexpr int DEFAULT_EPOCHS = 5;
    static constexpr int REINFORCE_EPOCHS = 2;
    static constexpr double UNSAFE_OVERRIDE_SCORE = 0.9;
    static constexpr double MATCH_THRESHOLD = 0.3;

    struct Decision {
        bool safe;
        double score;
    };

    /**
     * Constructor - builds a freshly randomized network and an empty store
     * @param config Dimensions, learning rate, ban threshold, snapshot path
     */
    explicit Classifier(const ClassifierConfig& config = ClassifierConfig{});

    /**
     * Score text (0-1). At or above the ban threshold = inappropriate.
     */
    double score(const std::string& text) const;

    /**
     * Train on a labeled text
     *
     * Runs `epochs` training steps towards all-zero (safe) or all-one (bad)
     * targets. A safe text whose new score is below the ban line is stored.
     *
     * @return Loss of the last step (1.0 if epochs is 0)
     */
    double train(const std::string& text, bool safe, Category category, int epochs = DEFAULT_EPOCHS);
    double train(const std::string& text, bool safe, std::string_view category, int epochs = DEFAULT_EPOCHS);

    /**
     * Train, then store with the new score (safe) or with the fixed
     * UNSAFE_OVERRIDE_SCORE (bad), whatever the network says.
     */
    void addItem(const std::string& text, bool safe, Category category);
    void addItem(const std::string& text, bool safe, std::string_view category);

    /**
     * Let the network decide on its own
     *
     * Safe texts are stored and lightly reinforced. Texts at or above the
     * ban line are left alone for a human to override.
     */
    Decision aiDecide(const std::string& text, Category category);
    Decision aiDecide(const std::string& text, std::string_view category);

    /**
     * Manual label or override
     *
     * Always removes the existing entry first. Safe: retrain and re-add if
     * below the ban line. Bad: retrain and leave removed.
     *
     * @return Status message for the user
     */
    std::string setLabel(const std::string& text, bool safe, Category category);
    std::string setLabel(const std::string& text, bool safe, std::string_view category);

    /**
     * Closest allowed item to the prompt, by encoded-vector similarity
     *
     * Ties go to the lexicographically smallest text. Items whose current
     * score has crossed the ban line are skipped.
     *
     * @return Matched text, or nothing if the best similarity is not above
     *         MATCH_THRESHOLD
     */
    std::optional<std::string> respond(const std::string& prompt, Category category) const;
    std::optional<std::string> respond(const std::string& prompt, std::string_view category) const;

    std::vector<std::string> getAllowed(Category category) const;
    std::vector<std::string> getWords() const { return getAllowed(Category::WORDS); }
    std::vector<std::string> getPhrases() const { return getAllowed(Category::PHRASES); }
    std::vector<std::string> getGameIdeas() const { return getAllowed(Category::GAME_IDEAS); }

    bool isBanned(double score) const { return store.isBanned(score); }

    /**
     * Restore the store from the configured snapshot
     */
    MemoryFile::LoadStatus load();

    /**
     * Write the store to the configured snapshot
     */
    bool save() const;

    const Memory& memory() const { return store; }
    const Network& network() const { return brain; }
    const ClassifierConfig& config() const { return cfg; }

private:
    ClassifierConfig cfg;
    Network brain;
    Memory store;
    Logger logger;

    std::vector<double> textToInput(const std::string& text) const;
    std::vector<double> feedbackToTarget(bool safe) const;
};

#endif // CLASSIFIER_HPP
