#include "Category.hpp"

UnknownCategoryError::UnknownCategoryError(std::string_view name)
    : std::invalid_argument("Unknown category: '" + std::string{name} + "'"),
      category_name(name) {}

bool parseCategory(std::string_view name, Category& out) {
    if (name == "words") {
        out = Category::WORDS;
    } else if (name == "phrases") {
        out = Category::PHRASES;
    } else if (name == "game_ideas") {
        out = Category::GAME_IDEAS;
    } else {
        return false;
    }
    return true;
}

Category requireCategory(std::string_view name) {
    Category category;
    if (!parseCategory(name, category)) {
        throw UnknownCategoryError(name);
    }
    return category;
}

const char* categoryName(Category category) {
    switch (category) {
        case Category::WORDS:      return "words";
        case Category::PHRASES:    return "phrases";
        case Category::GAME_IDEAS: return "game_ideas";
    }
    return "unknown";
}
