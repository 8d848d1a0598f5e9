#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <map>
#include <string>

#include "../src/feedback.hpp"
#include "testWords.hpp"

using namespace guesswork::feedback;
using guesswork::config::WORD_LENGTH;

TEST_CASE("Feedback: multipliers", "[feedback]") {
    STATIC_REQUIRE(__impl::multipliers.size() == WORD_LENGTH);
    STATIC_REQUIRE(__impl::multipliers[0] == Encoding{1});
    for (size_t i = 1; i < WORD_LENGTH; ++i) {
        REQUIRE(__impl::multipliers[i] == (__impl::multipliers[i - 1] * __impl::BASE));
    }
    STATIC_REQUIRE(NUM_FEEDBACKS == 243);
    STATIC_REQUIRE(NOT_COMPUTED == NUM_FEEDBACKS);
    STATIC_REQUIRE(sizeof(Encoding) == 1);
}

TEST_CASE("Feedback: parse()", "[feedback]") {
    REQUIRE_THROWS_AS(parse("0000"), guesswork::InvalidFeedbackFormat);
    REQUIRE_THROWS_AS(parse("000000"), guesswork::InvalidFeedbackFormat);
    REQUIRE_THROWS_AS(parse("0a000"), guesswork::InvalidFeedbackFormat);
    REQUIRE_THROWS_AS(parse("XO___"), guesswork::InvalidFeedbackFormat);

    REQUIRE(parse("00000") == ALL_ABSENT);
    REQUIRE(parse("22222") == ALL_EXACT);
    REQUIRE(parse("10000") == Encoding{1});
    REQUIRE(parse("00002") == Encoding{2 * 81});
    STATIC_REQUIRE(__impl::parseFeedbackString("20100") == 2 + 1 * 9);
}

TEST_CASE("Feedback: toString() inverts parse() for every pattern", "[feedback]") {
    for (unsigned encoding = 0; encoding < NUM_FEEDBACKS; ++encoding) {
        const std::string text = toString(static_cast<Encoding>(encoding));
        REQUIRE(isValidFeedbackString(text));
        REQUIRE(parse(text) == encoding);
        for (size_t i = 0; i < WORD_LENGTH; ++i) REQUIRE(symbolAt(static_cast<Encoding>(encoding), i) == text[i]);
    }
    REQUIRE_THROWS_AS(toString(NOT_COMPUTED), std::out_of_range);
}

TEST_CASE("Feedback: repeated letters are credited at most once per occurrence", "[feedback]") {
    // The E at position 3 finds the secret's only unmatched E already consumed
    REQUIRE(toString(encode("speed", "abide")) == "00101");
    REQUIRE(toString(encode("geese", "elope")) == "01002");

    // An exact match consumes the occurrence before any misplaced credit
    REQUIRE(toString(encode("eerie", "crane")) == "00102");
    REQUIRE(toString(encode("llama", "hello")) == "11000");

    // ERASE holds one S and two Es
    REQUIRE(toString(encode("speed", "erase")) == "10110");
}

TEST_CASE("Feedback: known patterns", "[feedback]") {
    REQUIRE(toString(encode("crate", "trace")) == "12212");
    REQUIRE(toString(encode("slate", "crane")) == "00202");
    REQUIRE(toString(encode("zymic", "crane")) == "00001");
    REQUIRE(encode("crane", "crane") == ALL_EXACT);
}

namespace {

// Left to right consumption over a copy of the secret
std::string referencePattern(std::string_view guess, std::string_view secret) {
    std::string pattern(WORD_LENGTH, symbol::ABSENT);
    std::string remaining{secret};
    for (size_t i = 0; i < WORD_LENGTH; ++i) {
        if (guess[i] == secret[i]) {
            pattern[i] = symbol::EXACT;
            remaining[i] = '\0';
        }
    }
    for (size_t i = 0; i < WORD_LENGTH; ++i) {
        if (pattern[i] != symbol::ABSENT) continue;
        auto pos = remaining.find(guess[i]);
        if (pos == std::string::npos) continue;
        pattern[i] = symbol::MISPLACED;
        remaining[pos] = '\0';
    }
    return pattern;
}

}

TEST_CASE("Feedback: Encoder agrees with left to right consumption on every fixture pair", "[feedback]") {
    const auto lexicon = guesswork::test::fixtureLexicon();
    Encoder encoder{};

    for (size_t g = 0; g < lexicon.size(); ++g) {
        const auto& guess = lexicon.word(static_cast<guesswork::vocab::WordId>(g));
        for (size_t s = 0; s < lexicon.size(); ++s) {
            const auto& secret = lexicon.word(static_cast<guesswork::vocab::WordId>(s));
            const Encoding encoding = encoder(guess, secret);

            REQUIRE(toString(encoding) == referencePattern(guess, secret));
            REQUIRE(isSolved(encoding) == (guess == secret));

            // Never more EXACT + MISPLACED credits for a letter than the secret holds
            std::map<char, size_t> credited;
            for (size_t i = 0; i < WORD_LENGTH; ++i) {
                if (symbolAt(encoding, i) != symbol::ABSENT) ++credited[guess[i]];
            }
            for (auto [letter, count] : credited) {
                REQUIRE(count <= static_cast<size_t>(std::count(secret.begin(), secret.end(), letter)));
            }
        }
    }
}

TEST_CASE("Feedback: encode() rejects words it cannot index", "[feedback]") {
    REQUIRE_THROWS_AS(encode("SPEED", "ERASE"), guesswork::InvalidWordError);
    REQUIRE_THROWS_AS(encode("speed", "ERASE"), guesswork::InvalidWordError);
    REQUIRE_THROWS_AS(encode("abc", "crane"), guesswork::InvalidWordError);
    REQUIRE_THROWS_AS(encode("crane", "cranes"), guesswork::InvalidWordError);
    REQUIRE(encode("speed", "erase") == parse("10110"));
}
