#include "strategyBase.hpp"

#include <algorithm>
#include <limits>

#include "errors.hpp"
#include "guard.hpp"
#include "hardMode.hpp"
#include "log.hpp"

namespace guesswork::strategy {

std::string_view toString(Mode mode) noexcept {
    return mode == Mode::HARD ? "hard" : "easy";
}

StrategyBase::StrategyBase(cache::PatternCache& cache, Mode mode, size_t maxThreads)
: cache{cache},
  lexicon{cache.getLexicon()},
  mode{mode},
  maxThreads{std::max<size_t>(1, maxThreads)},
  taskQueue{std::max<size_t>(1, maxThreads)} {}

size_t StrategyBase::countBins(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const {
    binCounts.fill(0);
    size_t nonEmpty = 0;
    for (WordId secretId : candidates) {
        WordCountT& count = binCounts[cache.lookupOrCompute(secretId, guessId)];
        nonEmpty += static_cast<size_t>(count == 0);
        ++count;
    }
    return nonEmpty;
}

WordIds StrategyBase::buildPool(const WordIds& candidates, const WordIds& guessPool, const History* history) const {
    WordIds pool;

    // With one or two answers left, only a candidate can win this turn
    if (candidates.size() <= 2) {
        pool = candidates;
    } else {
        std::vector<bool> seen(lexicon.size(), false);
        pool.reserve(guessPool.size() + candidates.size());
        for (const WordIds* source : {&guessPool, &candidates}) {
            for (WordId id : *source) {
                if (seen[id]) continue;
                seen[id] = true;
                pool.push_back(id);
            }
        }

        if (history) {
            WordIds legal = hard::legalSubset(pool, *history, lexicon);
            if (legal.empty()) {
                log::debug("No legal hard mode guess among {} words, using the unrestricted pool", pool.size());
            } else {
                pool = std::move(legal);
            }
        }
    }

    std::sort(pool.begin(), pool.end(), [this](WordId i, WordId j) { return lexicon.rank(i) < lexicon.rank(j); });
    return pool;
}

std::vector<Cost> StrategyBase::scorePool(const WordIds& pool, const WordIds& candidates) {
    std::vector<Cost> costs(pool.size());

    auto worker = [this, &pool, &candidates, &costs](size_t, size_t start, size_t stop) {
        BinCounts binCounts{};
        for (size_t i = start; i < stop; ++i) {
            costs[i] = cost(pool[i], candidates, binCounts);
        }
    };

    if (maxThreads == 1 || pool.size() < PARALLEL_MIN_POOL) {
        worker(0, 0, pool.size());
    } else {
        taskQueue.pushChunked(pool.size(), maxThreads, worker);
        taskQueue.wait();
    }
    return costs;
}

Suggestion StrategyBase::choose(const WordIds& pool, const std::vector<Cost>& costs, const WordIds& candidates) const {
    std::vector<bool> isCandidate(lexicon.size(), false);
    for (WordId id : candidates) isCandidate[id] = true;

    size_t bestIndex = 0;
    Cost bestCost = std::numeric_limits<Cost>::max();
    bool bestIsCandidate = false;

    for (size_t i = 0; i < pool.size(); ++i) {
        const bool candidate = isCandidate[pool[i]];
        if (costs[i] < bestCost || (costs[i] == bestCost && candidate && !bestIsCandidate)) {
            bestCost = costs[i];
            bestIndex = i;
            bestIsCandidate = candidate;
        }
    }
    return {pool[bestIndex], toScore(bestCost, candidates.size()), false};
}

Suggestion StrategyBase::selectFrom(const WordIds& candidates, const WordIds& guessPool, const History* history) {
    if (candidates.empty()) throw NoCandidatesError("no candidates are consistent with the feedback so far");
    if (candidates.size() == 1) return {candidates.front(), 0.0, false};

    const WordIds pool = buildPool(candidates, guessPool, history);
    prepare(candidates);
    const auto costs = scorePool(pool, candidates);
    auto suggestion = choose(pool, costs, candidates);

    log::debug("{}: {} from {} guesses over {} candidates (score {:.3f})", name(), lexicon.word(suggestion.guess), pool.size(), candidates.size(), suggestion.score.value_or(0.0));
    return suggestion;
}

Suggestion StrategyBase::select(const WordIds& candidates, const WordIds& guessPool) {
    return selectFrom(candidates, guessPool, nullptr);
}

Suggestion StrategyBase::select(const WordIds& candidates, const WordIds& guessPool, const History& history) {
    return selectFrom(candidates, guessPool, &history);
}

std::optional<Suggestion> StrategyBase::propose(const Query& query) {
    if (mode == Mode::HARD) return select(query.candidates, query.guessPool, query.history);
    return select(query.candidates, query.guessPool);
}

}
