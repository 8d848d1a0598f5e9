#include <exception>
#include <iostream>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "src/cli.hpp"
#include "src/interactive.hpp"
#include "src/history.hpp"
#include "src/log.hpp"
#include "src/openingBook.hpp"
#include "src/patternCache.hpp"
#include "src/selector.hpp"
#include "src/simulation.hpp"
#include "src/timing.hpp"
#include "src/vocab.hpp"

using namespace guesswork;

namespace {

void precompute(cache::PatternCache& cache, size_t threads) {
    if (cache.isComplete()) return;

    timing::Timer timer{true};
    parallel::TaskQueue queue{threads};
    cache.bulkPrecompute(queue, threads);
    log::info("Precomputed {} feedback patterns in {:.2f} s", cache.capacity(), timer.elapsed().count());
}

void flushCache(cache::PatternCache& cache, const std::string& path) {
    if (!cache.isDirty()) return;
    if (cache.flush(path)) log::info("Pattern cache written to {}", path);
}

void stats(const cli::Options& options, const strategy::SolverContext& ctx) {
    fmt::print(std::cout, "{} Mode Stats ({})\n", ctx.mode == strategy::Mode::HARD ? "Hard" : "Easy", strategy::bookKey(ctx.kind, ctx.mode));

    const History noHistory;
    auto selector = ctx.makeSelector();
    const auto opening = selector.select({ctx.lexicon.answers(), ctx.lexicon.guesses(), noHistory});
    fmt::print(std::cout, "First guess: {}{}\n", ctx.lexicon.word(opening.guess), opening.fromBook ? " (opening book)" : "");

    const auto report = sim::runBatch(ctx.lexicon.answers(), ctx, options.threads);
    sim::printSummary(report, std::cout);
    if (sim::writeReport(report, options.reportPath)) log::info("Average written to {}", options.reportPath);
}

void optimize(const cli::Options& options, const strategy::SolverContext& ctx) {
    strategy::OpeningBook book;
    if (!book.load(options.bookPath)) log::info("Starting a new opening book at {}", options.bookPath);

    timing::Timer timer{true};
    auto computing = strategy::makeStrategy(ctx.kind, ctx.cache, ctx.mode, options.threads);
    const auto opening = strategy::buildOpening(*computing, ctx.lexicon);
    const auto& word = ctx.lexicon.word(opening.guess);

    fmt::print(std::cout, "Best first guess for {}: {} (score {:.4f}, {:.2f} s)\n", computing->name(), word, opening.score.value_or(0.0), timer.elapsed().count());
    book.set(strategy::bookKey(ctx.kind, ctx.mode), word);
    if (!book.save(options.bookPath)) throw std::runtime_error("could not write the opening book to " + options.bookPath);
    log::info("Opening book written to {}", options.bookPath);
}

int run(const cli::Options& options) {
    log::setLevel(options.logLevel);

    const auto lexicon = vocab::loadLexicon(options.guessPath, options.answerPath);
    cache::PatternCache cache{lexicon};
    if (!cache.load(options.cachePath)) log::info("Starting with an empty pattern cache");

    if (options.precompute || options.command == cli::Command::PRECOMPUTE) precompute(cache, options.threads);
    flushCache(cache, options.cachePath);

    strategy::OpeningBook book;
    const bool useBook = options.command == cli::Command::SOLVE || options.command == cli::Command::STATS;
    if (useBook && !book.load(options.bookPath)) log::info("Opening move will be computed");

    const strategy::SolverContext ctx{lexicon, cache, useBook ? &book : nullptr, options.kind, options.mode, options.threads};

    switch (options.command) {
        case cli::Command::SOLVE:
            interactive::playSolver(ctx, std::cin, std::cout, options.cachePath);
            break;
        case cli::Command::HELPER:
            interactive::playHelper(ctx, std::cin, std::cout);
            break;
        case cli::Command::STATS:
            stats(options, ctx);
            break;
        case cli::Command::OPTIMIZE:
            optimize(options, ctx);
            break;
        case cli::Command::PRECOMPUTE:
            fmt::print(std::cout, "Pattern cache holds {} of {} patterns\n", cache.filledCount(), cache.capacity());
            break;
    }

    flushCache(cache, options.cachePath);
    return 0;
}

}

int main(int argc, char** argv) {
    cli::Options options;
    try {
        options = cli::parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Argument error: " << e.what() << "\n\n" << cli::usage(argv[0]);
        return 2;
    }

    if (options.showHelp) {
        std::cout << cli::usage(argv[0]);
        return 0;
    }

    try {
        return run(options);
    } catch (const std::exception& e) {
        log::error("{}", e.what());
        return 1;
    }
}
