#include "selector.hpp"

#include <stdexcept>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "guard.hpp"
#include "letterFrequencyStrategy.hpp"
#include "minimaxStrategy.hpp"

namespace guesswork::strategy {

Kind parseKind(std::string_view text) {
    if (text == "minimax") return Kind::MINIMAX;
    if (text == "letter-freq") return Kind::LETTER_FREQ;
    guard::formatError<std::invalid_argument>("Unknown strategy \"{}\" (expected minimax or letter-freq)", text);
}

std::unique_ptr<StrategyBase> makeStrategy(Kind kind, cache::PatternCache& cache, Mode mode, size_t threads) {
    if (kind == Kind::LETTER_FREQ) return std::make_unique<LetterFrequencyStrategy>(cache, mode, threads);
    return std::make_unique<MinimaxStrategy>(cache, mode, threads);
}

std::string_view bookKey(Kind kind, Mode mode) noexcept {
    const bool hard = mode == Mode::HARD;
    if (kind == Kind::LETTER_FREQ) return hard ? config::strategy_name::LETTER_FREQ_HARD : config::strategy_name::LETTER_FREQ;
    return hard ? config::strategy_name::MINIMAX_HARD : config::strategy_name::MINIMAX;
}

Selector& Selector::then(std::unique_ptr<Strategy> provider) {
    providers.push_back(std::move(provider));
    return *this;
}

Suggestion Selector::select(const Query& query) {
    if (query.candidates.empty()) throw NoCandidatesError("no candidates are consistent with the feedback so far");

    for (auto& provider : providers) {
        if (auto suggestion = provider->propose(query)) return *suggestion;
    }
    throw std::logic_error("no strategy in the chain proposed a guess");
}

Selector makeSelector(Kind kind, Mode mode, cache::PatternCache& cache, size_t threads, const OpeningBook* book) {
    Selector selector;
    if (book) selector.then(std::make_unique<OpeningBookProvider>(*book, cache.getLexicon(), bookKey(kind, mode)));
    selector.then(makeStrategy(kind, cache, mode, threads));
    return selector;
}

}
