#include <algorithm>
#include <utility>

#include "dictionary.hpp"
#include "guard.hpp"

namespace wordhint {

Dictionary::Dictionary(const vocab::Vocab& vocab) {
    words.reserve(vocab.size());
    for (const auto& word : vocab) {
        words.emplace_back(word);
    }
}

bool Dictionary::contains(std::string_view word) const noexcept {
    return std::any_of(words.begin(), words.end(), [word](const Word& w) noexcept { return w.view() == word; });
}

void Dictionary::filter(const Clue& clue) {
    if (clue.isResolved()) resolvedLetters.set(clue.letter);

    words.erase(
        std::remove_if(words.begin(), words.end(),
            [&clue](const Word& w) noexcept { return !w.satisfies(clue); }),
        words.end()
    );
}

LetterFrequency Dictionary::charFrequency() const noexcept {
    LetterFrequency freq{};
    for (const Word& word : words) {
        for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
            ++freq[word[i]][i];
        }
    }

    for (char letter : resolvedLetters) {
        freq.clear(letter);
    }
    return freq;
}

const Word& Dictionary::rankBest(const LetterFrequency& freq) {
    guard::hybridGuard<std::out_of_range>(!words.empty(), "rankBest() called on an empty dictionary");

    // Score once per word, then sort the (score, word) pairs
    std::vector<std::pair<Score, Word>> scored;
    scored.reserve(words.size());
    for (Word& word : words) {
        scored.emplace_back(word.score(freq), std::move(word));
    }

    std::stable_sort(scored.begin(), scored.end(),
        [](const auto& left, const auto& right) noexcept { return left.first > right.first; });

    for (size_t i = 0; i < scored.size(); ++i) {
        words[i] = std::move(scored[i].second);
    }
    return words.front();
}

}  // namespace wordhint
