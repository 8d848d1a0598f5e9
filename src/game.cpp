#include "game.hpp"

#include "candidateFilter.hpp"
#include "errors.hpp"
#include "guard.hpp"

namespace guesswork::game {

std::string_view toString(State state) noexcept {
    switch (state) {
        case State::NOT_STARTED: return "not started";
        case State::IN_PROGRESS: return "in progress";
        case State::SOLVED: return "solved";
        case State::EXHAUSTED: return "exhausted";
    }
    return "unknown";
}

Game::Game(cache::PatternCache& cache)
: lexicon{cache.getLexicon()},
  cache{cache} {
    reset();
}

void Game::reset() {
    aliveAnswers = lexicon.answers();
    turns.clear();
    currentState = State::NOT_STARTED;
}

State Game::record(WordId guessId, feedback::Encoding pattern) {
    guard::runtimeGuard<GameOverError>(!isOver(), "game is already {} after {} guesses", toString(currentState), turns.size());
    guard::runtimeGuard<InvalidFeedbackFormat>(pattern < feedback::NUM_FEEDBACKS, "{} is not a feedback encoding", static_cast<unsigned>(pattern));

    turns.push_back({guessId, pattern});
    filter::refine(aliveAnswers, guessId, pattern, cache);

    if (feedback::isSolved(pattern)) {
        currentState = State::SOLVED;
    } else if (turns.size() >= config::MAX_ROUNDS) {
        currentState = State::EXHAUSTED;
    } else {
        currentState = State::IN_PROGRESS;
    }
    return currentState;
}

}
