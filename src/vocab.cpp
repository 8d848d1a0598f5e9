#include "vocab.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <numeric>
#include <unordered_set>

#include <boost/algorithm/string.hpp>
#include <boost/range/join.hpp>

#include "errors.hpp"
#include "guard.hpp"
#include "log.hpp"
#include "util.hpp"

namespace guesswork::vocab {

Words readWordList(const std::string& path) {
    std::ifstream file{path};
    if (!file) guard::formatError("failed to open {}", path);

    Words words;
    std::unordered_set<std::string> seen;
    std::string buff;
    size_t lineNumber = 0;
    size_t repeats = 0;

    while (std::getline(file, buff)) {
        ++lineNumber;
        boost::trim(buff);
        if (buff.empty()) continue;
        boost::to_lower(buff);

        guard::runtimeGuard<InvalidWordError>(util::isValidWord(buff), "{}:{}: '{}' is not a {}-letter word", path, lineNumber, buff, config::WORD_LENGTH);
        if (!seen.insert(buff).second) {
            ++repeats;
            continue;
        }
        words.push_back(std::move(buff));
    }

    if (repeats) log::warn("{}: skipped {} repeated words", path, repeats);
    log::debug("Read {} words from {}", words.size(), path);
    return words;
}

WordId Lexicon::add(const std::string& word) {
    auto [it, inserted] = index.try_emplace(word, static_cast<WordId>(words.size()));
    if (inserted) {
        guard::runtimeGuard(words.size() < std::numeric_limits<WordId>::max(), "Lexicon cannot hold more than {} words", std::numeric_limits<WordId>::max());
        words.push_back(word);
    }
    return it->second;
}

Lexicon::Lexicon(const Words& guesses, const Words& answers) {
    guard::runtimeGuard<InvalidWordError>(!answers.empty(), "the answer list is empty");
    for (const auto& word : boost::range::join(answers, guesses)) {
        guard::runtimeGuard<InvalidWordError>(util::isValidWord(word), "'{}' is not a {}-letter word", word, config::WORD_LENGTH);
    }

    words.reserve(answers.size() + guesses.size());
    for (const auto& answer : answers) {
        WordId id = add(answer);
        if (id == answerIds.size()) answerIds.push_back(id);  // Skip repeated answers
    }

    std::unordered_set<WordId> seenGuesses;
    guessIds.reserve(guesses.size());
    for (const auto& guess : guesses) {
        WordId id = add(guess);
        if (seenGuesses.insert(id).second) guessIds.push_back(id);
    }

    std::vector<WordId> order(words.size());
    std::iota(order.begin(), order.end(), WordId{0});
    std::sort(order.begin(), order.end(), [this](WordId i, WordId j) { return words[i] < words[j]; });
    ranks.resize(words.size());
    for (size_t r = 0; r < order.size(); ++r) {
        ranks[order[r]] = static_cast<WordId>(r);
    }
}

std::optional<WordId> Lexicon::find(std::string_view word) const {
    auto it = index.find(std::string{word});
    if (it == index.end()) return std::nullopt;
    return it->second;
}

WordId Lexicon::require(std::string_view word) const {
    auto id = find(word);
    guard::runtimeGuard<InvalidWordError>(id.has_value(), "'{}' is not in the vocabulary", word);
    return *id;
}

Lexicon loadLexicon(const std::string& guessPath, const std::string& answerPath) {
    auto guesses = readWordList(guessPath);
    auto answers = readWordList(answerPath);
    Lexicon lexicon{guesses, answers};
    log::info("Loaded {} allowed guesses and {} possible answers ({} distinct words)", lexicon.guesses().size(), lexicon.answerCount(), lexicon.size());
    return lexicon;
}

}
