#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <algorithm>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "../src/candidateFilter.hpp"
#include "../src/errors.hpp"
#include "../src/feedback.hpp"
#include "../src/hardMode.hpp"
#include "../src/letterFrequencyStrategy.hpp"
#include "../src/minimaxStrategy.hpp"
#include "../src/selector.hpp"
#include "testWords.hpp"

using namespace guesswork;
using strategy::Mode;

namespace {

// Every guess and candidate, once, in lexicographic order
vocab::WordIds poolOf(const vocab::Lexicon& lexicon, const vocab::WordIds& candidates) {
    std::set<std::string> words;
    for (auto id : lexicon.guesses()) words.insert(lexicon.word(id));
    for (auto id : candidates) words.insert(lexicon.word(id));
    vocab::WordIds pool;
    for (const auto& word : words) pool.push_back(lexicon.require(word));
    return pool;
}

double expectedRemaining(const vocab::Lexicon& lexicon, vocab::WordId guess, const vocab::WordIds& candidates) {
    std::map<feedback::Encoding, size_t> buckets;
    for (auto secret : candidates) ++buckets[feedback::encode(lexicon.word(guess), lexicon.word(secret))];
    double total = 0.0;
    for (auto [pattern, size] : buckets) total += static_cast<double>(size * size);
    return total / static_cast<double>(candidates.size());
}

size_t coverage(const vocab::Lexicon& lexicon, vocab::WordId guess, const vocab::WordIds& candidates) {
    const auto& word = lexicon.word(guess);
    std::set<char> letters(word.begin(), word.end());
    size_t total = 0;
    for (char letter : letters) {
        total += static_cast<size_t>(std::count_if(candidates.begin(), candidates.end(), [&](vocab::WordId id) {
            return lexicon.word(id).find(letter) != std::string::npos;
        }));
    }
    return total;
}

bool contains(const vocab::WordIds& ids, vocab::WordId id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

// The pick minimises score; among minimisers, candidates come first, then lexicographic order
template <typename Score>
void requireTieBreak(const vocab::Lexicon& lexicon, const vocab::WordIds& pool, const vocab::WordIds& candidates, vocab::WordId pick, Score score) {
    auto best = std::numeric_limits<double>::max();
    for (auto id : pool) best = std::min(best, score(id));
    REQUIRE(score(pick) == Catch::Approx(best));

    std::optional<vocab::WordId> expected;
    for (bool wantCandidate : {true, false}) {
        for (auto id : pool) {
            if (score(id) == Catch::Approx(best) && (!wantCandidate || contains(candidates, id))) {
                expected = id;
                break;
            }
        }
        if (expected) break;
    }
    REQUIRE(expected.has_value());
    REQUIRE(lexicon.word(pick) == lexicon.word(*expected));
}

vocab::Lexicon syntheticLexicon(size_t numWords, size_t numAnswers) {
    constexpr std::string_view letters = "abcdeilnorst";
    vocab::Words answers, guesses;
    for (size_t n = 0; answers.size() + guesses.size() < numWords; ++n) {
        std::string word(config::WORD_LENGTH, 'a');
        size_t value = n * 7919 + 13;
        for (char& c : word) {
            c = letters[value % letters.size()];
            value /= letters.size();
        }
        (answers.size() < numAnswers ? answers : guesses).push_back(std::move(word));
    }
    return vocab::Lexicon{guesses, answers};
}

}

TEST_CASE("Selector: degenerate candidate sets", "[selector]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy minimax{cache, Mode::EASY, 1};

    SECTION("Singleton returns the survivor with score 0") {
        const auto crane = lexicon.require("crane");
        const auto suggestion = minimax.select({crane}, lexicon.guesses());
        REQUIRE(suggestion.guess == crane);
        REQUIRE(suggestion.score == 0.0);
        REQUIRE_FALSE(suggestion.fromBook);
    }

    SECTION("Empty set throws") {
        REQUIRE_THROWS_AS(minimax.select({}, lexicon.guesses()), NoCandidatesError);
    }

    SECTION("Two candidates: only they are scored, ties go to the first in word order") {
        const vocab::WordIds pair{lexicon.require("trace"), lexicon.require("crate")};
        REQUIRE(lexicon.word(minimax.select(pair, lexicon.guesses()).guess) == "crate");
    }
}

TEST_CASE("Selector: minimax picks the lowest expected remaining size", "[selector]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy minimax{cache, Mode::EASY, 2};
    auto score = [&](const vocab::WordIds& candidates) {
        return [&lexicon, candidates](vocab::WordId id) { return expectedRemaining(lexicon, id, candidates); };
    };

    SECTION("Opening position") {
        const auto& candidates = lexicon.answers();
        const auto suggestion = minimax.select(candidates, lexicon.guesses());
        REQUIRE(suggestion.score.value() == Catch::Approx(expectedRemaining(lexicon, suggestion.guess, candidates)));
        REQUIRE(minimax.expectedRemaining(suggestion.guess, candidates) == Catch::Approx(*suggestion.score));
        requireTieBreak(lexicon, poolOf(lexicon, candidates), candidates, suggestion.guess, score(candidates));
    }

    SECTION("After one turn") {
        const History history{{lexicon.require("slate"), feedback::encode("slate", "shore")}};
        const auto candidates = filter::filter(lexicon.answers(), history, cache);
        REQUIRE(candidates.size() > 2);

        const auto suggestion = minimax.select(candidates, lexicon.guesses());
        REQUIRE(contains(poolOf(lexicon, candidates), suggestion.guess));
        requireTieBreak(lexicon, poolOf(lexicon, candidates), candidates, suggestion.guess, score(candidates));
    }

    SECTION("Repeated calls agree") {
        const auto first = minimax.select(lexicon.answers(), lexicon.guesses());
        const auto second = minimax.select(lexicon.answers(), lexicon.guesses());
        REQUIRE(first.guess == second.guess);
        REQUIRE(first.score == second.score);
    }
}

TEST_CASE("Selector: parallel scoring matches sequential scoring", "[selector][parallel]") {
    const auto lexicon = syntheticLexicon(600, 150);
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy sequential{cache, Mode::EASY, 1};
    strategy::MinimaxStrategy parallel{cache, Mode::EASY, 4};

    const auto one = sequential.select(lexicon.answers(), lexicon.guesses());
    const auto many = parallel.select(lexicon.answers(), lexicon.guesses());
    REQUIRE(one.guess == many.guess);
    REQUIRE(one.score == many.score);
}

TEST_CASE("Selector: letter frequency maximises candidate coverage", "[selector]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};
    strategy::LetterFrequencyStrategy letterFreq{cache, Mode::EASY, 1};
    const auto& candidates = lexicon.answers();

    const auto suggestion = letterFreq.select(candidates, lexicon.guesses());
    REQUIRE(suggestion.score.value() == Catch::Approx(static_cast<double>(coverage(lexicon, suggestion.guess, candidates))));
    requireTieBreak(lexicon, poolOf(lexicon, candidates), candidates, suggestion.guess,
                    [&](vocab::WordId id) { return -static_cast<double>(coverage(lexicon, id, candidates)); });

    REQUIRE(letterFreq.name() == config::strategy_name::LETTER_FREQ);
    REQUIRE(strategy::LetterFrequencyStrategy{cache, Mode::HARD, 1}.name() == config::strategy_name::LETTER_FREQ_HARD);
}

TEST_CASE("Selector: hard mode only plays legal guesses", "[selector][hardMode]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy hardMinimax{cache, Mode::HARD, 1};
    REQUIRE(hardMinimax.name() == config::strategy_name::MINIMAX_HARD);

    // S and E pinned
    const History history{{lexicon.require("slate"), feedback::encode("slate", "shore")}};
    const auto candidates = filter::filter(lexicon.answers(), history, cache);
    REQUIRE(candidates.size() > 2);

    const auto suggestion = hardMinimax.select(candidates, lexicon.guesses(), history);
    REQUIRE(hard::isLegal(history, lexicon.word(suggestion.guess), lexicon));

    const auto legalPool = hard::legalSubset(poolOf(lexicon, candidates), history, lexicon);
    requireTieBreak(lexicon, legalPool, candidates, suggestion.guess,
                    [&](vocab::WordId id) { return expectedRemaining(lexicon, id, candidates); });

    SECTION("propose() uses the history in hard mode") {
        const auto proposed = hardMinimax.propose({candidates, lexicon.guesses(), history});
        REQUIRE(proposed.has_value());
        REQUIRE(proposed->guess == suggestion.guess);
    }
}

TEST_CASE("Selector: hard mode falls back to the unrestricted pool", "[selector][hardMode]") {
    const auto lexicon = test::smallLexicon();
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy hardMinimax{cache, Mode::HARD, 1};

    // R pinned at position 1: no word below can be played legally
    const History history{{lexicon.require("crate"), feedback::parse("02000")}};
    const vocab::WordIds candidates{lexicon.require("plush"), lexicon.require("slate"), lexicon.require("cater")};
    const vocab::WordIds guesses{lexicon.require("lints"), lexicon.require("cloud")};
    const vocab::WordIds pool{lexicon.require("cater"), lexicon.require("cloud"), lexicon.require("lints"), lexicon.require("plush"), lexicon.require("slate")};
    REQUIRE(hard::legalSubset(pool, history, lexicon).empty());

    const auto suggestion = hardMinimax.select(candidates, guesses, history);
    REQUIRE(contains(pool, suggestion.guess));
}

TEST_CASE("Selector: kinds and book keys", "[selector]") {
    REQUIRE(strategy::parseKind("minimax") == strategy::Kind::MINIMAX);
    REQUIRE(strategy::parseKind("letter-freq") == strategy::Kind::LETTER_FREQ);
    REQUIRE_THROWS_AS(strategy::parseKind("entropy"), std::invalid_argument);

    REQUIRE(strategy::bookKey(strategy::Kind::MINIMAX, Mode::EASY) == "minimax_entropy");
    REQUIRE(strategy::bookKey(strategy::Kind::MINIMAX, Mode::HARD) == "minimax_entropy_hard_mode");
    REQUIRE(strategy::bookKey(strategy::Kind::LETTER_FREQ, Mode::EASY) == "letter_freq");
}

TEST_CASE("Selector: opening book answers only the opening move", "[selector][openingBook]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};
    strategy::OpeningBook book;
    book.set(strategy::bookKey(strategy::Kind::MINIMAX, Mode::EASY), "zymic");

    auto selector = strategy::makeSelector(strategy::Kind::MINIMAX, Mode::EASY, cache, 1, &book);
    REQUIRE(selector.size() == 2);

    const History noHistory;
    const auto opening = selector.select({lexicon.answers(), lexicon.guesses(), noHistory});
    REQUIRE(lexicon.word(opening.guess) == "zymic");
    REQUIRE(opening.fromBook);
    REQUIRE_FALSE(opening.score.has_value());

    SECTION("Later moves are computed") {
        const History history{{lexicon.require("zymic"), feedback::encode("zymic", "crane")}};
        const auto candidates = filter::filter(lexicon.answers(), history, cache);
        const auto next = selector.select({candidates, lexicon.guesses(), history});
        REQUIRE_FALSE(next.fromBook);
        REQUIRE(next.score.has_value());
    }

    SECTION("A narrowed candidate set is not the opening") {
        const vocab::WordIds some{lexicon.require("crane"), lexicon.require("slate"), lexicon.require("stove")};
        REQUIRE_FALSE(selector.select({some, lexicon.guesses(), noHistory}).fromBook);
    }

    SECTION("Unknown book words fall through to computation") {
        strategy::OpeningBook stale;
        stale.set(strategy::bookKey(strategy::Kind::MINIMAX, Mode::EASY), "qqqqq");
        auto fallback = strategy::makeSelector(strategy::Kind::MINIMAX, Mode::EASY, cache, 1, &stale);
        REQUIRE_FALSE(fallback.select({lexicon.answers(), lexicon.guesses(), noHistory}).fromBook);
    }

    SECTION("Entries of other strategies are ignored") {
        auto hardSelector = strategy::makeSelector(strategy::Kind::MINIMAX, Mode::HARD, cache, 1, &book);
        REQUIRE_FALSE(hardSelector.select({lexicon.answers(), lexicon.guesses(), noHistory}).fromBook);
    }
}

TEST_CASE("Selector: a built opening equals the computed first move", "[selector][openingBook]") {
    const auto lexicon = test::fixtureLexicon();
    cache::PatternCache cache{lexicon};

    for (auto kind : {strategy::Kind::MINIMAX, strategy::Kind::LETTER_FREQ}) {
        auto computing = strategy::makeStrategy(kind, cache, Mode::EASY, 1);
        const auto built = strategy::buildOpening(*computing, lexicon);

        strategy::OpeningBook book;
        book.set(strategy::bookKey(kind, Mode::EASY), lexicon.word(built.guess));

        const History noHistory;
        auto withBook = strategy::makeSelector(kind, Mode::EASY, cache, 1, &book);
        auto withoutBook = strategy::makeSelector(kind, Mode::EASY, cache, 1);
        const auto fromBook = withBook.select({lexicon.answers(), lexicon.guesses(), noHistory});
        const auto computed = withoutBook.select({lexicon.answers(), lexicon.guesses(), noHistory});

        REQUIRE(fromBook.fromBook);
        REQUIRE(fromBook.guess == computed.guess);
    }
}
