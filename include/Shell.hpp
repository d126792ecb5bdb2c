#ifndef SHELL_HPP
#define SHELL_HPP

#include <iosfwd>
#include <string>

#include "Category.hpp"

class Classifier;

/**
 * Shell - Interactive front end for a Classifier
 *
 * Enter a text, then label it: [s]afe, [b]ad, [a]i decide, [os] override
 * safe, [ob] override bad. Other commands: list, score <text>,
 * respond <text>, category <name>, quit.
 *
 * The store is saved after every labeled text and on exit.
 */
class Shell {
public:
    Shell(Classifier& classifier, std::istream& in, std::ostream& out,
          Category category = Category::PHRASES);

    /**
     * Run until "quit" or end of input
     */
    void run();

    Category getCategory() const { return category; }

private:
    Classifier& classifier;
    std::istream& in;
    std::ostream& out;
    Category category;

    /**
     * Handle one top-level line
     * @return false when the shell should stop
     */
    bool handleLine(const std::string& line);

    /**
     * Prompt for and apply a label to text
     * @return false on end of input
     */
    bool labelText(const std::string& text);

    void listAll();
    void printScore(const std::string& text);
    void printResponse(const std::string& text);
    void selectCategory(const std::string& name);
    void save();
};

#endif // SHELL_HPP
