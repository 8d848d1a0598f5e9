#pragma once

#include <array>

#include "strategyBase.hpp"

namespace guesswork::strategy {

/*
Letter coverage heuristic: a guess scores the sum, over its distinct letters, of how many
candidates contain that letter. Highest coverage wins.
*/
class LetterFrequencyStrategy : public StrategyBase {
    std::array<Cost, config::ALPHABET_SIZE> letterCounts{};

protected:
    void prepare(const WordIds& candidates) override;

    Cost cost(WordId guessId, const WordIds& candidates, BinCounts& binCounts) const override;

    double toScore(Cost cost, size_t numCandidates) const override;

public:
    LetterFrequencyStrategy(cache::PatternCache& cache, Mode mode = Mode::EASY, size_t maxThreads = parallel::defaultConcurrency());

    std::string_view name() const noexcept override;
};

}
