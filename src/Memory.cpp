#include "Memory.hpp"

#include <algorithm>
#include <cmath>

Memory::Memory(double ban_threshold)
    : ban_threshold(ban_threshold) {}

bool Memory::add(Category category, const std::string& text, double score) {
    if (!std::isfinite(score) || isBanned(score)) {
        return false;
    }
    stores[index(category)][text] = std::min(score, ban_threshold - CLAMP_MARGIN);
    return true;
}

bool Memory::add(std::string_view category, const std::string& text, double score) {
    Category parsed;
    if (!parseCategory(category, parsed)) {
        return false;
    }
    return add(parsed, text, score);
}

void Memory::forceAdd(Category category, const std::string& text, double score) {
    stores[index(category)][text] = score;
}

Memory::Entries Memory::getAllowed(Category category) const {
    Entries allowed;
    for (const auto& [text, score] : stores[index(category)]) {
        if (!isBanned(score)) {
            allowed.emplace(text, score);
        }
    }
    return allowed;
}

Memory::Entries Memory::getAllowed(std::string_view category) const {
    Category parsed;
    if (!parseCategory(category, parsed)) {
        return {};
    }
    return getAllowed(parsed);
}

void Memory::remove(Category category, const std::string& text) {
    stores[index(category)].erase(text);
}

bool Memory::remove(std::string_view category, const std::string& text) {
    Category parsed;
    if (!parseCategory(category, parsed)) {
        return false;
    }
    remove(parsed, text);
    return true;
}

bool Memory::contains(Category category, const std::string& text) const {
    return stores[index(category)].count(text) > 0;
}

void Memory::clear() {
    for (auto& store : stores) {
        store.clear();
    }
}
