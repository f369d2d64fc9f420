#pragma once

#include <array>
#include <string>
#include <string_view>

#include "clue.hpp"
#include "config.hpp"

namespace wordhint::feedback {

    /*
    Produces the feedback string a game would report for guess against solution:
    code::CORRECT, code::WRONG_POSITION or code::ABSENT per position.
    Repeated letters are only reported present as many times as solution holds them.
    */
    struct Encoder {
    private:
        std::array<Count, config::ALPHABET_SIZE> unmatchedCounts{};

        [[nodiscard]] Count& getCount(char letter) noexcept {
            return unmatchedCounts[util::letterIndex(letter)];
        }

    public:
        Encoder() noexcept = default;

        [[nodiscard]] std::string operator()(std::string_view guess, std::string_view solution);
    };

}  // namespace wordhint::feedback
