#ifndef MEMORY_HPP
#define MEMORY_HPP

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <utility>

#include "Category.hpp"

/**
 * Memory - Learned content store with ban-line filtering
 *
 * Responsibilities:
 * - Keep one (text -> score) mapping per category
 * - Refuse any entry whose score is at or above the ban threshold
 * - Remove entries when a decision is overridden
 *
 * Keys are exact texts; iteration is in lexicographic key order.
 */
class Memory {
public:
    using Entries = std::map<std::string, double>;

    /** Stored scores are clamped to at most ban_threshold - CLAMP_MARGIN */
    static constexpr double CLAMP_MARGIN = 0.01;

    /**
     * Constructor
     * @param ban_threshold Scores at or above this are banned
     */
    explicit Memory(double ban_threshold = 0.7);

    /**
     * Above (or on) the line = banned. Below = allowed.
     */
    bool isBanned(double score) const { return score >= ban_threshold; }

    /**
     * Add or overwrite an entry
     *
     * @param category Target partition
     * @param text Exact text key
     * @param score Score to store (clamped below the ban line)
     * @return false if the score is banned or not finite, true if stored
     */
    bool add(Category category, const std::string& text, double score);

    /**
     * Add by category name
     * @return false for an unknown category name (nothing is changed)
     */
    bool add(std::string_view category, const std::string& text, double score);

    /**
     * Operator override: store the score as given, without the ban-line check
     *
     * A banned score stored this way stays out of getAllowed().
     */
    void forceAdd(Category category, const std::string& text, double score);

    /**
     * Entries of a category that are below the ban line
     */
    Entries getAllowed(Category category) const;

    /**
     * getAllowed by category name; empty for an unknown name
     */
    Entries getAllowed(std::string_view category) const;

    /**
     * Remove an entry. Absent texts are ignored.
     */
    void remove(Category category, const std::string& text);

    /**
     * Remove by category name
     * @return false for an unknown category name
     */
    bool remove(std::string_view category, const std::string& text);

    bool contains(Category category, const std::string& text) const;

    /**
     * Raw mapping of a category, including force-added entries
     */
    const Entries& get(Category category) const { return stores[index(category)]; }

    /**
     * Replace a whole category (used when restoring a snapshot)
     */
    void set(Category category, Entries entries) { stores[index(category)] = std::move(entries); }

    size_t size(Category category) const { return stores[index(category)].size(); }

    void clear();

    double banThreshold() const { return ban_threshold; }

private:
    double ban_threshold;
    std::array<Entries, ALL_CATEGORIES.size()> stores;

    static size_t index(Category category) { return static_cast<size_t>(category); }
};

#endif // MEMORY_HPP
