#include <exception>
#include <iostream>
#include <string_view>

#include "solver.hpp"
#include "src/config.hpp"
#include "stats.hpp"

namespace {

void printUsage() {
    std::cerr << "Usage: wordhint <solve|stats> [dictionary file]\n"
              << "  solve  interactively suggest guesses for a word you are playing\n"
              << "  stats  simulate a game against every dictionary word\n"
              << "The dictionary defaults to " << wordhint::config::DICTIONARY_FILE << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Argument error: invalid command\n";
        printUsage();
        return 1;
    }

    std::string_view command{argv[1]};
    std::string_view dictionaryFile = argc == 3 ? std::string_view{argv[2]} : std::string_view{wordhint::config::DICTIONARY_FILE};

    try {
        if (command == "solve") {
            solve(dictionaryFile);
            return 0;
        }

        if (command == "stats") {
            stats(dictionaryFile);
            return 0;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Argument error: unknown command " << command << "\n";
    printUsage();
    return 1;
}
