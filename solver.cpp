#include "solver.hpp"

#include <format>
#include <iostream>
#include <memory>
#include <string>

#include <boost/algorithm/string.hpp>

#include "src/clue.hpp"
#include "src/config.hpp"
#include "src/dictionary.hpp"
#include "src/session.hpp"
#include "src/vocab.hpp"

namespace {

void printFeedbackKey() {
    std::cout << "Feedback Key:\n"
              << wordhint::feedback::code::CORRECT << ": correct letter in the correct location\n"
              << wordhint::feedback::code::WRONG_POSITION << ": correct letter in the wrong location\n"
              << wordhint::feedback::code::ABSENT << ": incorrect letter (also accepted: " << wordhint::feedback::code::ABSENT_CODES << ")\n"
              << "-----------------------------------------\n";
}

// Reads one lowercased token. Returns false on end of input
bool readToken(std::string& buff) {
    if (!(std::cin >> buff)) return false;
    boost::trim(buff);
    boost::to_lower(buff);
    return true;
}

bool getSeedLetter(wordhint::Session& session, wordhint::Suggestion& suggestion, std::string& buff) {
    while (true) {
        std::cout << "What is the first letter? ";
        if (!readToken(buff)) return false;

        if (buff.size() == 1) {
            suggestion = session.reset(buff[0]);
            if (suggestion.status != wordhint::Status::INVALID_CHARACTER) return true;
        }
        std::cout << "Please enter a single letter (a-z)\n";
    }
}

bool getFeedback(wordhint::Session& session, wordhint::Suggestion& suggestion, std::string& buff) {
    const std::string guess = suggestion.guess;
    while (true) {
        std::cout << "Please enter feedback: ";
        if (!readToken(buff)) return false;

        suggestion = session.submitFeedback(guess, buff);
        switch (suggestion.status) {
            case wordhint::Status::LENGTH_MISMATCH:
                std::cout << std::format("Please enter {} feedback characters\n", wordhint::config::WORD_LENGTH);
                continue;
            case wordhint::Status::INVALID_CHARACTER:
                std::cout << std::format("Invalid feedback provided: {}\n", buff);
                printFeedbackKey();
                continue;
            default:
                return true;
        }
    }
}

}  // namespace

void solve(std::string_view dictionaryFile) {
    std::cout << "Loading dictionary " << dictionaryFile << "\n";
    auto source = std::make_shared<const wordhint::Dictionary>(wordhint::vocab::constructVocab(dictionaryFile));
    std::cout << source->size() << " candidate words loaded\n\n";

    wordhint::Session session{source};
    wordhint::Suggestion suggestion{};
    std::string buff;

    while (true) {
        printFeedbackKey();
        if (!getSeedLetter(session, suggestion, buff)) return;

        while (suggestion.status == wordhint::Status::GUESS) {
            std::cout << std::format("Best guess: {}. Number of solutions remaining: {}\n", suggestion.guess, suggestion.remaining);
            if (!getFeedback(session, suggestion, buff)) return;
        }

        if (suggestion.status == wordhint::Status::SOLVED) {
            std::cout << "I got it! Your word is: " << suggestion.guess << "\n";
        } else {
            std::cout << "No more possible words! Did you make a mistake?\n";
        }
        std::cout << "Play again? (Enter y for yes, anything else for no): ";
        if (!readToken(buff) || buff != "y") break;
    }
}
