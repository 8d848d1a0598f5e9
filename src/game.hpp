#pragma once

#include <cstdint>
#include <string_view>

#include "history.hpp"
#include "patternCache.hpp"

namespace guesswork::game {

using vocab::WordId;
using vocab::WordIds;

enum class State : uint8_t { NOT_STARTED, IN_PROGRESS, SOLVED, EXHAUSTED };

std::string_view toString(State state) noexcept;

/*
One game in progress: NOT_STARTED -> IN_PROGRESS (rounds 1..MAX_ROUNDS) -> SOLVED | EXHAUSTED.
Owns its candidate set and history; never shared between threads.
*/
class Game {
    const vocab::Lexicon& lexicon;
    cache::PatternCache& cache;
    WordIds aliveAnswers;
    History turns;
    State currentState = State::NOT_STARTED;

public:
    explicit Game(cache::PatternCache& cache);

    // Back to NOT_STARTED with the full Answer Set
    void reset();

    /*
    Plays guessId, narrows the candidates to those consistent with pattern and advances the
    state. Throws GameOverError once SOLVED or EXHAUSTED.
    */
    State record(WordId guessId, feedback::Encoding pattern);

    State state() const noexcept { return currentState; }

    bool isOver() const noexcept { return currentState == State::SOLVED || currentState == State::EXHAUSTED; }

    // Number of guesses recorded
    size_t round() const noexcept { return turns.size(); }

    const WordIds& candidates() const noexcept { return aliveAnswers; }

    const History& history() const noexcept { return turns; }

    const vocab::Lexicon& getLexicon() const noexcept { return lexicon; }
};

}
