#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "feedback.hpp"
#include "history.hpp"
#include "parallelTaskQueue.hpp"
#include "patternCache.hpp"
#include "vocab.hpp"

namespace guesswork::strategy {

using vocab::WordId;
using vocab::WordIds;
using WordCountT = vocab::WordId;  // Bin counts never exceed the lexicon size
using Cost = int64_t;              // Lower is better

enum class Mode : uint8_t { EASY, HARD };

std::string_view toString(Mode mode) noexcept;

struct Suggestion {
    WordId guess{};
    std::optional<double> score;  // Strategy-specific; empty when taken from the opening book
    bool fromBook = false;
};

// What a provider may look at when proposing the next guess
struct Query {
    const WordIds& candidates;
    const WordIds& guessPool;
    const History& history;
};

// One provider in a selection chain. Returns nothing when it does not apply.
class Strategy {
public:
    virtual ~Strategy() = default;
    virtual std::string_view name() const noexcept = 0;
    virtual std::optional<Suggestion> propose(const Query& query) = 0;
};

/*
Shared machinery of the computing strategies: degenerate cases, pool construction, hard mode
restriction, parallel scoring and the tie-break.

Pool order is lexicographic by word. Among words sharing the minimum cost, the first that is
still a candidate wins; otherwise the first in pool order.

Not thread-safe: every concurrent game owns its own strategy object.
*/
class StrategyBase : public Strategy {
protected:
    using BinCounts = std::array<WordCountT, feedback::NUM_FEEDBACKS>;

    static constexpr size_t PARALLEL_MIN_POOL = 256;  // Smaller pools are scored on the calling thread

    cache::PatternCache& cache;
    const vocab::Lexicon& lexicon;
    const Mode mode;
    const size_t maxThreads;
    parallel::TaskQueue taskQueue;

    StrategyBase(cache::PatternCache& cache, Mode mode, size_t maxThreads);

    // Counts candidates per feedback pattern of guessId. Returns number of non-empty bins.
    size_t countBins(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const;

    // Called once per selection, before any cost()
    virtual void prepare(const WordIds& /*candidates*/) {}

    // Must be safe to call from several threads after prepare()
    virtual Cost cost(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const = 0;

    virtual double toScore(Cost cost, size_t numCandidates) const = 0;

    WordIds buildPool(const WordIds& candidates, const WordIds& guessPool, const History* history) const;

private:
    Suggestion selectFrom(const WordIds& candidates, const WordIds& guessPool, const History* history);

    std::vector<Cost> scorePool(const WordIds& pool, const WordIds& candidates);

    Suggestion choose(const WordIds& pool, const std::vector<Cost>& costs, const WordIds& candidates) const;

public:
    // Standard mode. Throws NoCandidatesError on an empty candidate set.
    Suggestion select(const WordIds& candidates, const WordIds& guessPool);

    // Hard mode: only guesses legal under history are scored, unless none is
    Suggestion select(const WordIds& candidates, const WordIds& guessPool, const History& history);

    std::optional<Suggestion> propose(const Query& query) override;
};

}
