#include "word.hpp"

namespace wordhint {

bool Word::satisfies(const Clue& clue) const noexcept {
    size_t occur = 0;
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        const bool isLetter = letters[i] == clue.letter;
        occur += static_cast<size_t>(isLetter);

        switch (clue.verdicts[i]) {
            case Verdict::MATCH: if (!isLetter) return false; break;
            case Verdict::ABSENT: if (isLetter) return false; break;
            case Verdict::ELSEWHERE: break;
        }
    }
    return occur >= clue.minOccurrences;
}

Score Word::score(const LetterFrequency& freq) const {
    util::LetterSet distinct{};
    for (char c : letters) distinct.set(c);

    Score total = 0;
    for (char letter : distinct) {
        const PositionCounts& counts = freq[letter];
        for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
            total += letters[i] == letter ? counts[i] * config::EXACT_MATCH_WEIGHT : counts[i];
        }
    }
    return total;
}

}  // namespace wordhint
