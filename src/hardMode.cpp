#include "hardMode.hpp"

#include <algorithm>
#include <iterator>

#include "errors.hpp"
#include "feedback.hpp"
#include "guard.hpp"

namespace guesswork::hard {

Constraints Constraints::fromHistory(const History& history, const vocab::Lexicon& lexicon) {
    Constraints constraints{};
    for (const Turn& turn : history) {
        constraints.add(lexicon.word(turn.guess), turn.pattern);
    }
    return constraints;
}

void Constraints::add(std::string_view guess, feedback::Encoding pattern) {
    guard::runtimeGuard<InvalidWordError>(util::isValidWord(guess), "'{}' is not a {}-letter word", guess, config::WORD_LENGTH);
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        const char letter = guess[i];
        switch (feedback::symbolAt(pattern, i)) {
            case feedback::symbol::EXACT:
                pinned[i] = letter;
                break;
            case feedback::symbol::MISPLACED:
                required.set(letter);
                forbidden[static_cast<size_t>(letter - 'a')].set(i);
                break;
            default:
                break;
        }
    }
}

bool Constraints::admits(std::string_view word) const {
    guard::runtimeGuard<InvalidWordError>(util::isValidWord(word), "'{}' is not a {}-letter word", word, config::WORD_LENGTH);
    util::LetterSet present{};
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        const char letter = word[i];
        if (pinned[i] && pinned[i] != letter) return false;
        if (forbidden[static_cast<size_t>(letter - 'a')].contains(i)) return false;
        present.set(letter);
    }
    return present.includes(required);
}

std::optional<char> Constraints::pinnedAt(size_t position) const {
    char letter = pinned.at(position);
    if (!letter) return std::nullopt;
    return letter;
}

bool Constraints::empty() const noexcept {
    return required.empty() && std::all_of(pinned.begin(), pinned.end(), [](char c) noexcept { return c == '\0'; });
}

bool isLegal(const History& history, std::string_view guess, const vocab::Lexicon& lexicon) {
    return Constraints::fromHistory(history, lexicon).admits(guess);
}

WordIds legalSubset(const WordIds& pool, const History& history, const vocab::Lexicon& lexicon) {
    const auto constraints = Constraints::fromHistory(history, lexicon);
    WordIds legal;
    legal.reserve(pool.size());
    std::copy_if(pool.begin(), pool.end(), std::back_inserter(legal), [&](vocab::WordId id) { return constraints.admits(lexicon.word(id)); });
    return legal;
}

}
