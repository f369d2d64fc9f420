#pragma once

#include <cstddef>
#include <cstdint>

namespace wordhint::config {

    enum class PoolPolicy : uint8_t { FIXED = 0, NARROWING };

    constexpr inline auto DICTIONARY_FILE = "words_alpha.txt";
    constexpr inline size_t ALPHABET_SIZE = 'z' - 'a' + 1;
    constexpr inline size_t WORD_LENGTH = 5;
    constexpr inline uint32_t EXACT_MATCH_WEIGHT = 4;          // Weight of a letter counted at its own position
    constexpr inline size_t HARDWARE_CONCURRENCY = 8ul;        // I have 8 cores on my machine
    constexpr inline size_t MAX_GUESSES = 100;                 // Loop guard for simulated games
    constexpr inline PoolPolicy DEFAULT_POOL_POLICY = PoolPolicy::FIXED;
}
