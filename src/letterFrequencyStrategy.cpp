#include "letterFrequencyStrategy.hpp"

#include "config.hpp"
#include "util.hpp"

namespace guesswork::strategy {

LetterFrequencyStrategy::LetterFrequencyStrategy(cache::PatternCache& cache, Mode mode, size_t maxThreads)
: StrategyBase{cache, mode, maxThreads} {}

std::string_view LetterFrequencyStrategy::name() const noexcept {
    return mode == Mode::HARD ? config::strategy_name::LETTER_FREQ_HARD : config::strategy_name::LETTER_FREQ;
}

void LetterFrequencyStrategy::prepare(const WordIds& candidates) {
    letterCounts.fill(0);
    for (WordId id : candidates) {
        util::LetterSet letters{};
        for (char letter : lexicon.word(id)) letters.set(letter);
        for (char letter : letters) ++letterCounts[static_cast<size_t>(letter - 'a')];
    }
}

Cost LetterFrequencyStrategy::cost(WordId guessId, const WordIds& /*candidates*/, BinCounts& /*binCounts*/) const {
    util::LetterSet letters{};
    for (char letter : lexicon.word(guessId)) letters.set(letter);

    Cost coverage = 0;
    for (char letter : letters) coverage += letterCounts[static_cast<size_t>(letter - 'a')];
    return -coverage;
}

double LetterFrequencyStrategy::toScore(Cost cost, size_t /*numCandidates*/) const {
    return static_cast<double>(-cost);
}

}
