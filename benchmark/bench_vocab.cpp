#include <benchmark/benchmark.h>

#include <string>

#include "../src/vocab.hpp"

static const std::string guessFile{std::string{GUESSWORK_BENCH_DATA_DIR} + "/guesses.txt"};
static const std::string answerFile{std::string{GUESSWORK_BENCH_DATA_DIR} + "/answers.txt"};

static void BM_readWordList(benchmark::State& state) {
    for (auto _ : state) {
        auto x = guesswork::vocab::readWordList(answerFile);
        benchmark::DoNotOptimize(x);
    }
}
BENCHMARK(BM_readWordList);

static void BM_loadLexicon(benchmark::State& state) {
    for (auto _ : state) {
        auto x = guesswork::vocab::loadLexicon(guessFile, answerFile);
        benchmark::DoNotOptimize(x);
    }
}
BENCHMARK(BM_loadLexicon);

BENCHMARK_MAIN();
