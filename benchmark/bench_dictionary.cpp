#include <benchmark/benchmark.h>

#include <memory>

#include "../src/dictionary.hpp"
#include "../src/session.hpp"
#include "../src/vocab.hpp"

static inline const auto source{std::make_shared<const wordhint::Dictionary>(wordhint::vocab::constructVocab())};

static void BM_filterSeed(benchmark::State& state) {
    const auto clue = wordhint::Clue::seed('s');
    for (auto _ : state) {
        wordhint::Dictionary words{*source};
        words.filter(clue);
        benchmark::DoNotOptimize(words);
    }
}
BENCHMARK(BM_filterSeed);

static void BM_charFrequency(benchmark::State& state) {
    for (auto _ : state) {
        auto freq = source->charFrequency();
        benchmark::DoNotOptimize(freq);
    }
}
BENCHMARK(BM_charFrequency);

static void BM_rankBest(benchmark::State& state) {
    wordhint::Dictionary words{*source};
    const auto freq = words.charFrequency();
    for (auto _ : state) {
        const auto& best = words.rankBest(freq);
        benchmark::DoNotOptimize(best);
    }
}
BENCHMARK(BM_rankBest);

static void BM_sessionReset(benchmark::State& state) {
    wordhint::Session session{source};
    char seed = 'a';
    for (auto _ : state) {
        auto suggestion = session.reset(seed);
        benchmark::DoNotOptimize(suggestion);
        seed = seed == 'z' ? 'a' : static_cast<char>(seed + 1);
    }
}
BENCHMARK(BM_sessionReset);
