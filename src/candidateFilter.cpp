#include "candidateFilter.hpp"

#include <algorithm>

namespace guesswork::filter {

bool consistent(WordId secretId, const History& history, cache::PatternCache& cache) {
    return std::all_of(history.begin(), history.end(), [secretId, &cache](const Turn& turn) {
        return cache.lookupOrCompute(secretId, turn.guess) == turn.pattern;
    });
}

void refine(WordIds& candidates, WordId guessId, feedback::Encoding pattern, cache::PatternCache& cache) {
    candidates.erase(
        std::remove_if(candidates.begin(), candidates.end(),
            [guessId, pattern, &cache](WordId secretId) { return cache.lookupOrCompute(secretId, guessId) != pattern; }),
        candidates.end()
    );
}

WordIds filter(const WordIds& candidates, const History& history, cache::PatternCache& cache) {
    WordIds survivors{candidates};
    for (const Turn& turn : history) {
        if (survivors.empty()) break;
        refine(survivors, turn.guess, turn.pattern, cache);
    }
    return survivors;
}

}
