#include <benchmark/benchmark.h>

#include <string>

#include "../src/letterFrequencyStrategy.hpp"
#include "../src/minimaxStrategy.hpp"
#include "../src/parallelTaskQueue.hpp"

static const auto lexicon{guesswork::vocab::loadLexicon(std::string{GUESSWORK_BENCH_DATA_DIR} + "/guesses.txt",
                                                        std::string{GUESSWORK_BENCH_DATA_DIR} + "/answers.txt")};

static guesswork::cache::PatternCache& warmCache() {
    static guesswork::cache::PatternCache cache{lexicon};
    if (!cache.isComplete()) {
        guesswork::parallel::TaskQueue queue{};
        cache.bulkPrecompute(queue);
    }
    return cache;
}

static void BM_minimaxOpening(benchmark::State& state) {
    size_t numThreads = state.range(0);
    guesswork::strategy::MinimaxStrategy strategy{warmCache(), guesswork::strategy::Mode::EASY, numThreads};
    for (auto _ : state) {
        auto suggestion = strategy.select(lexicon.answers(), lexicon.guesses());
        benchmark::DoNotOptimize(suggestion);
    }
}

BENCHMARK(BM_minimaxOpening)
    ->Arg(1ul)
    ->Arg(2ul)
    ->Arg(4ul);

static void BM_letterFrequencyOpening(benchmark::State& state) {
    guesswork::strategy::LetterFrequencyStrategy strategy{warmCache(), guesswork::strategy::Mode::EASY, 1};
    for (auto _ : state) {
        auto suggestion = strategy.select(lexicon.answers(), lexicon.guesses());
        benchmark::DoNotOptimize(suggestion);
    }
}
BENCHMARK(BM_letterFrequencyOpening);
