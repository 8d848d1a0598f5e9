#include <benchmark/benchmark.h>

#include <string>

#include "../src/feedback.hpp"
#include "../src/patternCache.hpp"
#include "../src/vocab.hpp"

static const auto lexicon{guesswork::vocab::loadLexicon(std::string{GUESSWORK_BENCH_DATA_DIR} + "/guesses.txt",
                                                        std::string{GUESSWORK_BENCH_DATA_DIR} + "/answers.txt")};

static void BM_encode(benchmark::State& state) {
    for (auto _ : state) {
        for (auto secret : lexicon.answers()) {
            auto pattern = guesswork::feedback::encode("geese", lexicon.word(secret));
            benchmark::DoNotOptimize(pattern);
        }
    }
}
BENCHMARK(BM_encode);

static void BM_lookupOrCompute(benchmark::State& state) {
    guesswork::cache::PatternCache cache{lexicon};
    for (auto _ : state) {
        for (auto guess : lexicon.guesses()) {
            for (auto secret : lexicon.answers()) {
                auto pattern = cache.lookupOrCompute(secret, guess);
                benchmark::DoNotOptimize(pattern);
            }
        }
    }
}
BENCHMARK(BM_lookupOrCompute);

static void BM_bulkPrecompute(benchmark::State& state) {
    size_t numThreads = state.range(0);
    guesswork::parallel::TaskQueue queue{numThreads};
    for (auto _ : state) {
        guesswork::cache::PatternCache cache{lexicon};
        cache.bulkPrecompute(queue, numThreads);
        benchmark::DoNotOptimize(cache.filledCount());
    }
}

BENCHMARK(BM_bulkPrecompute)
    ->Arg(1ul)
    ->Arg(2ul)
    ->Arg(4ul)
    ->Arg(8ul);
