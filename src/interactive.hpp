#pragma once

#include <cstddef>
#include <istream>
#include <ostream>
#include <string>

#include "selector.hpp"

namespace guesswork::interactive {

/*
Solver session: proposes a guess each round and reads the observed pattern from in. "quit" or
"exit" (or end of input) ends the session, malformed patterns re-prompt. A new game starts after
every solved or exhausted one, unless that game was played without asking for feedback. The
pattern cache is flushed to cachePath between games. Returns the number of games finished.
*/
size_t playSolver(const strategy::SolverContext& ctx, std::istream& in, std::ostream& out, const std::string& cachePath);

/*
Helper session: the user plays their own guesses and reports feedback; the remaining answers
are listed after each round. Ends on a solve, on contradictory feedback, after MAX_ROUNDS or
when the user declines to continue. Returns the number of answers left.
*/
size_t playHelper(const strategy::SolverContext& ctx, std::istream& in, std::ostream& out);

}
