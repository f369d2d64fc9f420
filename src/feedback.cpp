#include "feedback.hpp"
#include "guard.hpp"
#include "util.hpp"

std::string wordhint::feedback::Encoder::operator()(std::string_view guess, std::string_view solution) {
    guard::hybridGuard<std::invalid_argument>(util::isValidWord(guess) && util::isValidWord(solution), "guess and solution must be valid words");

    std::string fbString(config::WORD_LENGTH, code::ABSENT);
    unmatchedCounts.fill(0);

    // Step 1: Mark CORRECT and count solution letters left unmatched
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        if (guess[i] == solution[i]) {
            fbString[i] = code::CORRECT;
        } else {
            ++getCount(solution[i]);
        }
    }

    // Step 2: Mark WRONG_POSITION while unmatched copies remain
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        if (fbString[i] == code::CORRECT) continue;
        Count& count = getCount(guess[i]);
        if (count == 0) continue;
        fbString[i] = code::WRONG_POSITION;
        --count;
    }
    return fbString;
}
