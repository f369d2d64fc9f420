#include <catch2/catch_test_macros.hpp>

#include "../src/word.hpp"

using namespace wordhint;

namespace {
    constexpr Verdict M = Verdict::MATCH;
    constexpr Verdict A = Verdict::ABSENT;
    constexpr Verdict E = Verdict::ELSEWHERE;
}

TEST_CASE("Word: construction validates its input", "[word]") {
    Word word{"crane"};
    REQUIRE(word.view() == "crane");
    REQUIRE(word.str() == "crane");
    REQUIRE(word[0] == 'c');
    REQUIRE(word[4] == 'e');

    REQUIRE_THROWS_AS(Word{"cran"}, std::invalid_argument);
    REQUIRE_THROWS_AS(Word{"Crane"}, std::invalid_argument);
    REQUIRE_THROWS_AS(Word{"cr-ne"}, std::invalid_argument);
}

TEST_CASE("Word: satisfies() per-position verdicts", "[word]") {
    const Word crane{"crane"};

    REQUIRE(crane.satisfies({'a', 1, {E, E, M, E, E}}));
    REQUIRE_FALSE(crane.satisfies({'a', 1, {E, E, A, E, E}}));
    REQUIRE_FALSE(crane.satisfies({'a', 1, {M, E, E, E, E}}));
    REQUIRE(crane.satisfies({'a', 1, {A, A, E, A, A}}));
    REQUIRE(crane.satisfies({'z', 0, {A, A, A, A, A}}));
    REQUIRE_FALSE(crane.satisfies({'c', 0, {A, A, A, A, A}}));
}

TEST_CASE("Word: satisfies() minimum occurrences", "[word]") {
    const Clue twoEs{'e', 2, {E, E, E, E, E}};
    REQUIRE(Word{"speed"}.satisfies(twoEs));
    REQUIRE(Word{"geese"}.satisfies(twoEs));
    REQUIRE_FALSE(Word{"spade"}.satisfies(twoEs));
    REQUIRE_FALSE(Word{"spade"}.satisfies({'z', 1, {E, E, E, E, E}}));
}

TEST_CASE("Word: score() weighs exact positions four times", "[word]") {
    // Counts over {crane, crate, trace}
    LetterFrequency freq{};
    freq['c'] = {2, 0, 0, 1, 0};
    freq['t'] = {1, 0, 0, 1, 0};
    freq['r'] = {0, 3, 0, 0, 0};
    freq['a'] = {0, 0, 3, 0, 0};
    freq['n'] = {0, 0, 0, 1, 0};
    freq['e'] = {0, 0, 0, 0, 3};

    REQUIRE(Word{"crane"}.score(freq) == 49);
    REQUIRE(Word{"crate"}.score(freq) == 50);
    REQUIRE(Word{"trace"}.score(freq) == 47);
}

TEST_CASE("Word: score() counts each distinct letter once", "[word]") {
    LetterFrequency freq{};
    freq['e'] = {1, 1, 1, 1, 1};

    // e at positions 2 and 3: 4 + 4 for those, 1 + 1 + 1 for the rest
    REQUIRE(Word{"speed"}.score(freq) == 11);
    REQUIRE(Word{"steep"}.score(freq) == 11);
    REQUIRE(Word{"crane"}.score(freq) == 8);
    REQUIRE(Word{"shout"}.score(freq) == 0);
}

TEST_CASE("Word: score() of an empty table is zero", "[word]") {
    REQUIRE(Word{"crane"}.score(LetterFrequency{}) == 0);
}
