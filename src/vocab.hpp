#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/integer.hpp>

#include "config.hpp"

namespace guesswork::vocab {

using Words = std::vector<std::string>;
using WordId = boost::uint_t<16>::least;  // Index into a Lexicon
using WordIds = std::vector<WordId>;

/*
Reads a line-delimited word list. Lines are trimmed and lowercased, blank lines skipped and
repeated words dropped after their first occurrence. Order is otherwise preserved.
Throws std::runtime_error if the file cannot be opened, InvalidWordError on a malformed word.
*/
Words readWordList(const std::string& path);

/*
Immutable word table shared by every game. Answers occupy ids [0, answerCount()) in answer-file
order, followed by the guess-only words in guess-file order.
*/
class Lexicon {
    Words words;
    WordIds answerIds;
    WordIds guessIds;
    std::vector<WordId> ranks;  // Lexicographic rank of each id
    std::unordered_map<std::string, WordId> index;

    WordId add(const std::string& word);

public:
    // Throws InvalidWordError on an invalid word or an empty answer list
    Lexicon(const Words& guesses, const Words& answers);

    // Ids of the Answer Set, in file order
    const WordIds& answers() const noexcept { return answerIds; }

    // Ids of the Guess Set, in file order
    const WordIds& guesses() const noexcept { return guessIds; }

    const std::string& word(WordId id) const { return words.at(id); }

    std::optional<WordId> find(std::string_view word) const;

    // Like find, but throws InvalidWordError
    WordId require(std::string_view word) const;

    bool isAnswer(WordId id) const noexcept { return id < answerIds.size(); }

    size_t rank(WordId id) const { return ranks.at(id); }

    size_t size() const noexcept { return words.size(); }

    size_t answerCount() const noexcept { return answerIds.size(); }
};

Lexicon loadLexicon(const std::string& guessPath = config::GUESS_FILE, const std::string& answerPath = config::ANSWER_FILE);

}
