#include "Shell.hpp"
#include "Classifier.hpp"
#include "StringUtils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>

using namespace utils;

// ANSI Color Codes for Terminal Output
#define RESET "\033[0m"
#define RED "\033[31m"     /* Red */
#define GREEN "\033[32m"   /* Green */
#define MAGENTA "\033[35m" /* Magenta */
#define PRINT_ERROR RED << "[ERROR]" << RESET << " "
#define PRINT_PROMPT MAGENTA << ">" << RESET << " "


Shell::Shell(Classifier& classifier, std::istream& in, std::ostream& out, Category category)
    : classifier(classifier), in(in), out(out), category(category) {}


void Shell::run() {
    out << "Pyx AI - Kid-friendly filter\n";
    out << "Enter a phrase, then: [s]afe  [b]ad  [a]i decide  [os] override safe  [ob] override bad\n";
    out << "Commands: list | score <text> | respond <text> | category <name> | quit\n\n";

    // Main Command-Handling Loop
    std::string input;
    while (true) {
        out << "Phrase (" << categoryName(category) << ") " << PRINT_PROMPT;
        if (!std::getline(in, input)) {
            save();
            break;
        }
        if (!handleLine(input)) break;
    }
}


bool Shell::handleLine(const std::string& line) {
    std::string text = trim(line);
    if (text.empty()) return true;

    std::string lower = toLower(text);

    // Exit Case
    if (lower == "quit") {
        save();
        return false;
    }

    if (lower == "list") {
        listAll();
        return true;
    }
    if (lower.rfind("score ", 0) == 0) {
        printScore(trim(text.substr(6)));
        return true;
    }
    if (lower.rfind("respond ", 0) == 0) {
        printResponse(trim(text.substr(8)));
        return true;
    }
    if (lower.rfind("category ", 0) == 0) {
        selectCategory(trim(text.substr(9)));
        return true;
    }

    return labelText(text);
}


bool Shell::labelText(const std::string& text) {
    out << "  Safe [s] / Bad [b] / AI decide [a] / Override Safe [os] / Override Bad [ob]: ";

    std::string choice;
    if (!std::getline(in, choice)) {
        save();
        return false;
    }
    choice = toLower(trim(choice));

    if (choice == "s" || choice == "safe" || choice == "os" || choice == "override safe") {
        out << classifier.setLabel(text, true, category) << "\n";
    } else if (choice == "b" || choice == "bad" || choice == "ob" || choice == "override bad") {
        out << classifier.setLabel(text, false, category) << "\n";
    } else if (choice == "a" || choice == "ai") {
        auto decision = classifier.aiDecide(text, category);
        out << fmt::format("AI says: {} (score {:.3f}). {}\n",
                           decision.safe ? "SAFE" : "INAPPROPRIATE",
                           decision.score,
                           decision.safe ? "Added." : "Not added (override with Safe if wrong).");
    } else {
        out << "Use s, b, a, os, or ob.\n";
    }

    save();
    return true;
}


void Shell::listAll() {
    out << fmt::format("Words: {}\n", classifier.getWords());
    out << fmt::format("Phrases: {}\n", classifier.getPhrases());
    out << fmt::format("Game ideas: {}\n", classifier.getGameIdeas());
}


void Shell::printScore(const std::string& text) {
    if (text.empty()) {
        out << PRINT_ERROR << "Missing text.\n";
        return;
    }
    double s = classifier.score(text);
    out << fmt::format("Score: {:.3f} ({})\n", s, classifier.isBanned(s) ? "INAPPROPRIATE" : "SAFE");
}


void Shell::printResponse(const std::string& text) {
    if (text.empty()) {
        out << PRINT_ERROR << "Missing text.\n";
        return;
    }
    auto match = classifier.respond(text, category);
    if (match) {
        out << "Pyx: " << *match << "\n";
    } else {
        out << "No match.\n";
    }
}


void Shell::selectCategory(const std::string& name) {
    if (!parseCategory(name, category)) {
        out << PRINT_ERROR << "Unknown category '" << name << "'. Use words, phrases, or game_ideas.\n";
        return;
    }
    out << "Category: " << categoryName(category) << "\n";
}


void Shell::save() {
    if (!classifier.save()) {
        out << PRINT_ERROR << "Could not save memory to " << classifier.config().memory_file << "\n";
    }
}
