#pragma once

#include <array>
#include <cstddef>
#include <ostream>
#include <string>

#include "config.hpp"
#include "selector.hpp"

namespace guesswork::sim {

using vocab::WordId;
using vocab::WordIds;

struct BatchReport {
    size_t games = 0;
    size_t totalRounds = 0;
    double average = 0.0;
    size_t wins = 0;
    size_t losses = 0;
    std::array<size_t, config::FAILED_ROUNDS> histogram{};  // histogram[r - 1] = games taking r rounds
    double elapsed = 0.0;                                   // Seconds

    double winRate() const noexcept { return games ? static_cast<double>(wins) / static_cast<double>(games) : 0.0; }
};

/*
Plays one game against secretId with automatic feedback. Returns the round the secret was
guessed in, or FAILED_ROUNDS when it was not found within MAX_ROUNDS.
*/
unsigned simulate(WordId secretId, strategy::Selector& selector, cache::PatternCache& cache);

unsigned simulate(WordId secretId, const strategy::SolverContext& ctx);

// Simulates every secret using up to numThreads games at once
BatchReport runBatch(const WordIds& secrets, const strategy::SolverContext& ctx, size_t numThreads);

// Average to four decimals and a newline. Returns false on failure.
bool writeReport(const BatchReport& report, const std::string& path);

void printSummary(const BatchReport& report, std::ostream& out);

}
