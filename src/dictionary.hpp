#pragma once

#include <vector>

#include "clue.hpp"
#include "util.hpp"
#include "vocab.hpp"
#include "word.hpp"

namespace wordhint {

/*
Ordered set of candidate words plus the letters whose position is fully known.
Copies are deep.
*/
class Dictionary {
    std::vector<Word> words;
    util::LetterSet resolvedLetters{};

public:
    Dictionary() noexcept = default;
    explicit Dictionary(const vocab::Vocab& vocab);

    size_t size() const noexcept {
        return words.size();
    }

    bool empty() const noexcept {
        return words.empty();
    }

    const std::vector<Word>& getWords() const noexcept {
        return words;
    }

    const util::LetterSet& getResolvedLetters() const noexcept {
        return resolvedLetters;
    }

    bool contains(std::string_view word) const noexcept;

    // Drops every word that violates clue. Registers clue.letter as resolved if the clue is fully resolved
    void filter(const Clue& clue);

    // Per-position letter counts over the remaining words, with resolved letters zeroed
    [[nodiscard]] LetterFrequency charFrequency() const noexcept;

    /*
    Stable sorts words by descending score and returns the best.
    The established order is kept and breaks ties on the next call.
    Throws std::out_of_range if empty.
    */
    const Word& rankBest(const LetterFrequency& freq);
};

}  // namespace wordhint
