#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "config.hpp"
#include "history.hpp"
#include "util.hpp"
#include "vocab.hpp"

namespace guesswork::hard {

using vocab::WordIds;

/*
Constraints revealed by a game's feedback, folded over its history:
  EXACT at i      -> position i is pinned to that letter
  MISPLACED at i  -> the letter is required somewhere, and never again at position i
*/
class Constraints {
    std::array<char, config::WORD_LENGTH> pinned{};  // '\0' when the position is free
    util::LetterSet required{};
    std::array<util::PositionSet, config::ALPHABET_SIZE> forbidden{};

public:
    constexpr Constraints() noexcept = default;

    static Constraints fromHistory(const History& history, const vocab::Lexicon& lexicon);

    // Folds one (guess, pattern) pair into the constraints. Throws InvalidWordError.
    void add(std::string_view guess, feedback::Encoding pattern);

    // True iff word satisfies every pinned position, required letter and forbidden position
    bool admits(std::string_view word) const;

    std::optional<char> pinnedAt(size_t position) const;

    const util::LetterSet& requiredLetters() const noexcept { return required; }

    const util::PositionSet& forbiddenPositions(char letter) const { return forbidden.at(static_cast<size_t>(letter - 'a')); }

    bool empty() const noexcept;
};

bool isLegal(const History& history, std::string_view guess, const vocab::Lexicon& lexicon);

// Words of pool that are legal under history, in pool order
WordIds legalSubset(const WordIds& pool, const History& history, const vocab::Lexicon& lexicon);

}
