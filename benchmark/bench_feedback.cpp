#include <benchmark/benchmark.h>

#include <string>

#include "../src/clue.hpp"
#include "../src/feedback.hpp"
#include "../src/vocab.hpp"

static inline const auto vocab{wordhint::vocab::constructVocab()};

static void BM_encodeFeedback(benchmark::State& state) {
    wordhint::feedback::Encoder encoder{};
    const std::string& guess = vocab.front();
    for (auto _ : state) {
        for (const auto& solution : vocab) {
            auto fbString = encoder(guess, solution);
            benchmark::DoNotOptimize(fbString);
        }
    }
}
BENCHMARK(BM_encodeFeedback);

static void BM_decodeFeedback(benchmark::State& state) {
    wordhint::feedback::Encoder encoder{};
    const std::string& guess = vocab.front();
    const auto fbString = encoder(guess, vocab.back());
    for (auto _ : state) {
        auto clues = wordhint::feedback::decode(guess, fbString);
        benchmark::DoNotOptimize(clues);
    }
}
BENCHMARK(BM_decodeFeedback);
