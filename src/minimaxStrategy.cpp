#include "minimaxStrategy.hpp"

#include "config.hpp"

namespace guesswork::strategy {

MinimaxStrategy::MinimaxStrategy(cache::PatternCache& cache, Mode mode, size_t maxThreads)
: StrategyBase{cache, mode, maxThreads} {}

std::string_view MinimaxStrategy::name() const noexcept {
    return mode == Mode::HARD ? config::strategy_name::MINIMAX_HARD : config::strategy_name::MINIMAX;
}

// Sum of squared bucket sizes. Dividing by the candidate count gives the expected remaining size,
// so integer costs compare exactly.
Cost MinimaxStrategy::cost(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const {
    countBins(guessId, candidates, binCounts);
    Cost sumOfSquares = 0;
    for (Cost count : binCounts) {
        sumOfSquares += count * count;
    }
    return sumOfSquares;
}

double MinimaxStrategy::toScore(Cost cost, size_t numCandidates) const {
    return static_cast<double>(cost) / static_cast<double>(numCandidates);
}

double MinimaxStrategy::expectedRemaining(WordId guessId, const WordIds& candidates) const {
    if (candidates.empty()) return 0.0;
    BinCounts binCounts{};
    return toScore(cost(guessId, candidates, binCounts), candidates.size());
}

}
