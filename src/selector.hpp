#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "openingBook.hpp"
#include "strategyBase.hpp"

namespace guesswork::strategy {

enum class Kind : uint8_t { MINIMAX, LETTER_FREQ };

// "minimax" or "letter-freq". Throws std::invalid_argument otherwise.
Kind parseKind(std::string_view text);

std::unique_ptr<StrategyBase> makeStrategy(Kind kind, cache::PatternCache& cache, Mode mode, size_t threads);

// Name a strategy's opening is filed under in the book
std::string_view bookKey(Kind kind, Mode mode) noexcept;

// Ordered provider chain. The first provider to propose wins.
class Selector {
    std::vector<std::unique_ptr<Strategy>> providers;

public:
    Selector& then(std::unique_ptr<Strategy> provider);

    // Throws NoCandidatesError on an empty candidate set, std::logic_error if every provider declines
    Suggestion select(const Query& query);

    size_t size() const noexcept { return providers.size(); }
};

// Opening book (when given) followed by the computing strategy
Selector makeSelector(Kind kind, Mode mode, cache::PatternCache& cache, size_t threads, const OpeningBook* book = nullptr);

// Everything a driver needs to build selectors for its games
struct SolverContext {
    const vocab::Lexicon& lexicon;
    cache::PatternCache& cache;
    const OpeningBook* book = nullptr;
    Kind kind = Kind::MINIMAX;
    Mode mode = Mode::EASY;
    size_t threads = parallel::defaultConcurrency();

    Selector makeSelector(size_t numThreads) const {
        return strategy::makeSelector(kind, mode, cache, numThreads, book);
    }

    Selector makeSelector() const { return makeSelector(threads); }
};

}
