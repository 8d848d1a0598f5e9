#pragma once

#include "strategyBase.hpp"

namespace guesswork::strategy {

/*
Minimax-entropy: picks the guess minimising the expected number of candidates left after its
feedback, sum over patterns of (bucket / total) * bucket.
*/
class MinimaxStrategy : public StrategyBase {
protected:
    Cost cost(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const override;

    double toScore(Cost cost, size_t numCandidates) const override;

public:
    MinimaxStrategy(cache::PatternCache& cache, Mode mode = Mode::EASY, size_t maxThreads = parallel::defaultConcurrency());

    std::string_view name() const noexcept override;

    // Expected remaining candidates after playing guessId
    double expectedRemaining(WordId guessId, const WordIds& candidates) const;
};

}
