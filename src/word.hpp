#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "clue.hpp"
#include "config.hpp"
#include "guard.hpp"
#include "util.hpp"

namespace wordhint {

using Score = uint32_t;
using PositionCounts = std::array<uint32_t, config::WORD_LENGTH>;

/*
Letter -> number of words holding that letter at each position.
Letters never counted read as all zeros.
*/
struct LetterFrequency {
private:
    std::array<PositionCounts, config::ALPHABET_SIZE> rows{};

public:
    constexpr LetterFrequency() noexcept = default;

    [[nodiscard]] constexpr PositionCounts& operator[](char letter) noexcept {
        return rows[util::letterIndex(letter)];
    }

    [[nodiscard]] constexpr const PositionCounts& operator[](char letter) const noexcept {
        return rows[util::letterIndex(letter)];
    }

    // Sets every position count of letter to zero
    constexpr void clear(char letter) noexcept {
        (*this)[letter].fill(0);
    }

    constexpr bool operator==(const LetterFrequency&) const noexcept = default;
};

class Word {
    std::array<char, config::WORD_LENGTH> letters{};

public:
    // word must pass util::isValidWord
    explicit Word(std::string_view word) {
        guard::runtimeGuard<std::invalid_argument>(util::isValidWord(word), "\"{}\" is not a {}-letter lowercase word", word, config::WORD_LENGTH);
        std::copy(word.begin(), word.end(), letters.begin());
    }

    [[nodiscard]] char operator[](size_t position) const noexcept {
        return letters[position];
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {letters.data(), letters.size()};
    }

    [[nodiscard]] std::string str() const {
        return std::string{view()};
    }

    bool operator==(const Word&) const noexcept = default;

    // True if this word could still be the answer given clue
    [[nodiscard]] bool satisfies(const Clue& clue) const noexcept;

    // Frequency heuristic: exact-position hits weigh config::EXACT_MATCH_WEIGHT, anywhere else weighs 1
    [[nodiscard]] Score score(const LetterFrequency& freq) const;
};

}  // namespace wordhint
