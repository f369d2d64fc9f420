#pragma once

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string_view>

#include <boost/integer.hpp>

#include "config.hpp"
#include "guard.hpp"

namespace wordhint::util {

inline void showProgressBar(size_t current, size_t total, size_t barWidth = 50) {
    double progress = static_cast<double>(current) / total;
    size_t pos = static_cast<size_t>(barWidth * progress);

    std::cout << "\r[";
    for (size_t i = 0; i < barWidth; ++i) {
        if (i < pos) std::cout << "=";
        else if (i == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] "
              << std::fixed << std::setprecision(2)
              << std::setw(6) << (progress * 100.0) << "%   "
              << std::flush;
}

/*
Efficiently maps a bounded integral domain to vector indices without storing a map or sorting.
*/
template <std::integral T, T minVal, T maxVal>
requires (minVal < maxVal)
struct BitIndexMap {
private:
    static constexpr unsigned BITS = static_cast<unsigned>(maxVal - minVal) + 1u;
    static_assert(BITS <= 64u, "BitIndexMap domain does not fit in 64 bits");

public:
    using Encoding = typename boost::uint_t<BITS>::least;

private:
    // Returns true if val is within range
    constexpr bool isValidVal(T val) const noexcept {
        return (minVal <= val && val <= maxVal);
    }

    // Returns bit of val. Undefined behavior if val is not in range
    constexpr Encoding unsafeBit(T val) const noexcept {
        return Encoding{1} << static_cast<unsigned>(val - minVal);
    }

    // Returns bit of val. Errors if val is not in range
    constexpr Encoding safeBit(T val) const {
        guard::hybridGuard<std::out_of_range>(isValidVal(val), "val is out of range");
        return unsafeBit(val);
    }

    Encoding bits = 0;  // Underlying bits

public:
    constexpr BitIndexMap() noexcept = default;

    constexpr bool operator==(const BitIndexMap& other) const noexcept { return bits == other.bits; }

    // Adds val
    constexpr void set(T val) {
        bits |= safeBit(val);
    }

    // Removes val
    constexpr void unset(T val) {
        bits &= ~safeBit(val);
    }

    // Returns true if val is contained
    constexpr bool contains(T val) const noexcept {
        return isValidVal(val) && (bits & unsafeBit(val));
    }

    // Returns index of val among the contained values.
    constexpr size_t index(T val) const {
        guard::hybridGuard<std::out_of_range>(isValidVal(val), "Invalid val passed");
        guard::hybridGuard<std::out_of_range>(contains(val), "val is not in bitmap");
        auto mask = static_cast<Encoding>(unsafeBit(val) - Encoding{1});
        return static_cast<size_t>(std::popcount(static_cast<Encoding>(bits & mask)));
    }

    // Returns number of contained values
    constexpr size_t size() const noexcept {
        return static_cast<size_t>(std::popcount(bits));
    }

    constexpr bool empty() const noexcept {
        return bits == 0;
    }

    // Removes all values
    constexpr void reset() noexcept {
        bits = 0;
    }

    // Returns underlying bits
    constexpr Encoding raw() const noexcept {
        return bits;
    }

    // Value iterator, ascending order
    struct Iterator {
    private:
        Encoding bits;
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = T;

        constexpr Iterator(Encoding bits) noexcept : bits{bits} {}

        constexpr T operator*() const {
            guard::hybridGuard(bits != 0, "Stopped attempt to dereference exhausted iterator");
            auto bit = std::countr_zero(bits);    // Find least significant bit
            return static_cast<T>(static_cast<T>(bit) + minVal);
        }

        constexpr Iterator& operator++() {
            guard::hybridGuard<std::out_of_range>(bits != 0, "Stopped attempt to increment exhausted iterator");
            bits &= static_cast<Encoding>(bits - 1);  // Clear the least significant bit
            return *this;
        }

        constexpr Iterator operator++(int) {
            Iterator retVal = *this;
            ++(*this);
            return retVal;
        }

        constexpr bool operator==(const Iterator& other) const noexcept { return bits == other.bits; }
    };

    constexpr Iterator begin() const noexcept {
        return Iterator{bits};
    }

    constexpr Iterator end() const noexcept {
        return Iterator{0};
    }
};

using LetterSet = BitIndexMap<char, 'a', 'z'>;

constexpr inline bool isValidLetter(char c) noexcept {
    return 'a' <= c && c <= 'z';
}

// Checks size and letters
constexpr inline bool isValidWord(std::string_view word) noexcept {
    if (word.size() != config::WORD_LENGTH) return false;
    return std::all_of(word.begin(), word.end(), isValidLetter);
}

constexpr inline size_t letterIndex(char c) noexcept {
    return static_cast<size_t>(c - 'a');
}

}
