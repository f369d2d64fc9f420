#include <benchmark/benchmark.h>

#include "../src/dictionary.hpp"
#include "../src/vocab.hpp"

static void BM_constructVocab(benchmark::State& state) {
    for (auto _ : state) {
        auto x = wordhint::vocab::constructVocab();
        benchmark::DoNotOptimize(x);
    }
}
BENCHMARK(BM_constructVocab);

static void BM_constructDictionary(benchmark::State& state) {
    const auto vocab = wordhint::vocab::constructVocab();
    for (auto _ : state) {
        wordhint::Dictionary dictionary{vocab};
        benchmark::DoNotOptimize(dictionary);
    }
}
BENCHMARK(BM_constructDictionary);

BENCHMARK_MAIN();
