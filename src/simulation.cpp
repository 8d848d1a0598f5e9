#include "simulation.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <fstream>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "errors.hpp"
#include "game.hpp"
#include "log.hpp"
#include "parallelTaskQueue.hpp"
#include "timing.hpp"

namespace guesswork::sim {

unsigned simulate(WordId secretId, strategy::Selector& selector, cache::PatternCache& cache) {
    const auto& lexicon = cache.getLexicon();
    game::Game game{cache};

    try {
        while (!game.isOver()) {
            const auto suggestion = selector.select({game.candidates(), lexicon.guesses(), game.history()});
            game.record(suggestion.guess, cache.lookupOrCompute(secretId, suggestion.guess));
        }
    } catch (const NoCandidatesError& e) {
        log::warn("Game for {} ran out of candidates after {} rounds: {}", lexicon.word(secretId), game.round(), e.what());
        return config::FAILED_ROUNDS;
    }

    if (game.state() != game::State::SOLVED) return config::FAILED_ROUNDS;
    return static_cast<unsigned>(game.round());
}

unsigned simulate(WordId secretId, const strategy::SolverContext& ctx) {
    auto selector = ctx.makeSelector();
    return simulate(secretId, selector, ctx.cache);
}

BatchReport runBatch(const WordIds& secrets, const strategy::SolverContext& ctx, size_t numThreads) {
    BatchReport report;
    report.games = secrets.size();
    if (secrets.empty()) return report;

    numThreads = std::clamp<size_t>(numThreads, 1, secrets.size());
    std::vector<unsigned> rounds(secrets.size(), 0);
    std::vector<std::exception_ptr> failures(numThreads);
    std::atomic<size_t> nextIndex{0};
    std::atomic<size_t> completed{0};
    std::atomic_bool stopping{false};

    timing::Timer timer{true};
    {
        parallel::TaskQueue queue{numThreads};
        for (size_t threadID = 0; threadID < numThreads; ++threadID) {
            queue.push([&, threadID]() {
                try {
                    // One game per worker at a time, so scoring stays on this thread
                    auto selector = ctx.makeSelector(1);
                    for (size_t i = nextIndex.fetch_add(1); i < secrets.size() && !stopping.load(); i = nextIndex.fetch_add(1)) {
                        rounds[i] = simulate(secrets[i], selector, ctx.cache);
                        const size_t done = completed.fetch_add(1) + 1;
                        if (done % config::BATCH_PROGRESS_INTERVAL == 0) log::info("Simulated {} games...", done);
                    }
                } catch (...) {
                    failures[threadID] = std::current_exception();
                    stopping.store(true);
                }
            });
        }
        queue.wait();
    }
    timer.stop();

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }

    for (unsigned r : rounds) {
        report.totalRounds += r;
        ++report.histogram[r - 1];
        if (r <= config::MAX_ROUNDS) {
            ++report.wins;
        } else {
            ++report.losses;
        }
    }
    report.average = static_cast<double>(report.totalRounds) / static_cast<double>(report.games);
    report.elapsed = timer.elapsed().count();
    return report;
}

bool writeReport(const BatchReport& report, const std::string& path) {
    std::ofstream file{path, std::ios::trunc};
    if (file) file << fmt::format("{:.4f}\n", report.average);
    if (!file) {
        log::warn("Could not write report to {}", path);
        return false;
    }
    return true;
}

void printSummary(const BatchReport& report, std::ostream& out) {
    fmt::print(out, "Games simulated: {}\n", report.games);
    fmt::print(out, "Average number of tries: {:.4f}\n", report.average);
    fmt::print(out, "Win Percentage: {:.2f}%\n", report.winRate() * 100.0);
    fmt::print(out, "Games lost: {}\n", report.losses);
    for (size_t r = 0; r < report.histogram.size(); ++r) {
        const bool failed = r + 1 == config::FAILED_ROUNDS;
        fmt::print(out, "  {}: {}\n", failed ? std::string{"X"} : std::to_string(r + 1), report.histogram[r]);
    }
    fmt::print(out, "Simulation Time: {:.2f} s\n", report.elapsed);
}

}
