#include <optional>

#include "clue.hpp"
#include "guard.hpp"

namespace wordhint::feedback {

namespace {
    // A clue under construction. An empty slot is a position the guess says nothing about yet
    struct ClueBuilder {
        char letter;
        std::array<std::optional<Verdict>, config::WORD_LENGTH> slots{};
        Count correct = 0;
        Count wrongPlace = 0;
        Count wrong = 0;

        void report(size_t position, char code) {
            if (code == code::CORRECT) {
                ++correct;
                slots[position] = Verdict::MATCH;
            } else if (code == code::WRONG_POSITION) {
                ++wrongPlace;
                slots[position] = Verdict::ABSENT;
            } else {
                ++wrong;
                slots[position] = Verdict::ABSENT;
            }
        }

        Clue build() const {
            // A letter reported absent somewhere cannot appear at any unguessed position either
            const Verdict fill = wrong > 0 ? Verdict::ABSENT : Verdict::ELSEWHERE;

            Clue clue{letter, static_cast<Count>(correct + (wrongPlace > 0 ? 1 : 0)), {}};
            for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
                clue.verdicts[i] = slots[i].value_or(fill);
            }
            return clue;
        }
    };
}

Status validate(std::string_view guess, std::string_view fbString) noexcept {
    if (guess.size() != config::WORD_LENGTH || fbString.size() != config::WORD_LENGTH) return Status::LENGTH_MISMATCH;
    if (!util::isValidWord(guess)) return Status::INVALID_CHARACTER;
    if (!std::all_of(fbString.begin(), fbString.end(), code::isValid)) return Status::INVALID_CHARACTER;
    return Status::GUESS;
}

std::vector<Clue> decode(std::string_view guess, std::string_view fbString) {
    guard::hybridGuard<std::invalid_argument>(validate(guess, fbString) == Status::GUESS, "guess or fbString is malformed");

    // Distinct letters, ascending
    util::LetterSet letters{};
    for (char c : guess) letters.set(c);

    std::vector<Clue> clues;
    clues.reserve(letters.size());

    for (char letter : letters) {
        ClueBuilder builder{letter};
        for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
            if (guess[i] == letter) builder.report(i, fbString[i]);
        }
        clues.push_back(builder.build());
    }
    return clues;
}

}  // namespace wordhint::feedback
