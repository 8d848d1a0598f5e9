#pragma once

#include "history.hpp"
#include "patternCache.hpp"

namespace guesswork::filter {

using vocab::WordId;
using vocab::WordIds;

// True iff secretId would have produced every pattern in history
bool consistent(WordId secretId, const History& history, cache::PatternCache& cache);

// Keeps the candidates that would answer guessId with pattern. Order is preserved.
void refine(WordIds& candidates, WordId guessId, feedback::Encoding pattern, cache::PatternCache& cache);

/*
Returns the candidates consistent with every turn of history, in their original order.
An empty result means the history is contradictory.
*/
WordIds filter(const WordIds& candidates, const History& history, cache::PatternCache& cache);

}
