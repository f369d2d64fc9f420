#pragma once

#include <array>
#include <bit>
#include <cstdint>
#include <string_view>
#include <vector>

#include <boost/integer.hpp>

#include "config.hpp"
#include "util.hpp"

namespace wordhint::feedback::code {
    constexpr inline char CORRECT = 'c';         // Letter is in word at correct position
    constexpr inline char WRONG_POSITION = 'w';  // Letter is in word, but is at wrong position
    constexpr inline char ABSENT = '-';          // Letter is not at this position (canonical form)

    // Every code accepted as "absent at this position"
    constexpr inline std::string_view ABSENT_CODES = "-_.a";

    constexpr inline bool isAbsent(char c) noexcept {
        return ABSENT_CODES.find(c) != std::string_view::npos;
    }

    constexpr inline bool isValid(char c) noexcept {
        return c == CORRECT || c == WRONG_POSITION || isAbsent(c);
    }
}  // namespace wordhint::feedback::code

namespace wordhint {

// Result of every session operation, and of input validation
enum class Status : uint8_t {
    GUESS = 0,            // guess holds the next word to play
    SOLVED,               // exactly one candidate left, guess holds it
    NO_CANDIDATES,        // feedback is inconsistent with every candidate
    LENGTH_MISMATCH,      // guess or feedback is not WORD_LENGTH long
    INVALID_CHARACTER     // letter outside [a-z] or unknown feedback code
};

enum class Verdict : uint8_t {
    MATCH = 0,  // letter is at this position
    ABSENT,     // letter is not at this position
    ELSEWHERE   // nothing known about this position
};

using Count = boost::uint_t<std::bit_width(config::WORD_LENGTH)>::least;
using Verdicts = std::array<Verdict, config::WORD_LENGTH>;

struct Clue {
    char letter;
    Count minOccurrences;
    Verdicts verdicts;

    // True once every position holds MATCH or ABSENT
    [[nodiscard]] constexpr bool isResolved() const noexcept {
        for (Verdict v : verdicts) {
            if (v == Verdict::ELSEWHERE) return false;
        }
        return true;
    }

    // Anchors a session: letter at position 0, anything allowed elsewhere
    [[nodiscard]] static constexpr Clue seed(char letter) noexcept {
        Clue clue{letter, Count{1}, {}};
        clue.verdicts.fill(Verdict::ELSEWHERE);
        clue.verdicts[0] = Verdict::MATCH;
        return clue;
    }

    constexpr bool operator==(const Clue&) const noexcept = default;
};

namespace feedback {

    // Checks guess and fbString without side effects. Returns Status::GUESS when both are usable
    [[nodiscard]] Status validate(std::string_view guess, std::string_view fbString) noexcept;

    /*
    Turns a guess and its feedback string into one clue per distinct letter of guess, in ascending letter order.
    Throws std::invalid_argument if validate() would reject the input.

    minOccurrences is a lower bound only: correct reports plus one if any wrong-position report was seen.
    */
    [[nodiscard]] std::vector<Clue> decode(std::string_view guess, std::string_view fbString);

}  // namespace feedback

}  // namespace wordhint
