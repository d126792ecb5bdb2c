#ifndef CATEGORY_HPP
#define CATEGORY_HPP

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

/**
 * Content partitions of the memory store. The set is closed.
 */
enum class Category {
    WORDS,
    PHRASES,
    GAME_IDEAS
};

constexpr std::array<Category, 3> ALL_CATEGORIES = {
    Category::WORDS, Category::PHRASES, Category::GAME_IDEAS
};

/**
 * Thrown when a category name does not name one of the fixed partitions
 */
class UnknownCategoryError : public std::invalid_argument {
public:
    explicit UnknownCategoryError(std::string_view name);

    const std::string& name() const { return category_name; }

private:
    std::string category_name;
};

/**
 * Parse a category name ("words", "phrases", "game_ideas")
 *
 * Matching is exact; no case folding.
 *
 * @param name Category name
 * @param out Parsed category
 * @return true if the name is a known category
 */
bool parseCategory(std::string_view name, Category& out);

/**
 * Parse a category name or throw UnknownCategoryError
 */
Category requireCategory(std::string_view name);

/**
 * Persisted / user-facing name of a category
 */
const char* categoryName(Category category);

#endif // CATEGORY_HPP
