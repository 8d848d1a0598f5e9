#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "../src/minimaxStrategy.hpp"
#include "../src/openingBook.hpp"
#include "testWords.hpp"

using namespace guesswork;
using strategy::OpeningBook;

namespace {

std::filesystem::path tempPath(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("guesswork_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove(path);
    return path;
}

}

TEST_CASE("OpeningBook: set() and get()", "[openingBook]") {
    OpeningBook book;
    REQUIRE(book.empty());
    REQUIRE_FALSE(book.get(config::strategy_name::MINIMAX).has_value());

    book.set(config::strategy_name::MINIMAX, "soare");
    book.set(config::strategy_name::LETTER_FREQ_HARD, "slate");
    book.set(config::strategy_name::MINIMAX, "roate");

    REQUIRE(book.size() == 2);
    REQUIRE(book.get(config::strategy_name::MINIMAX) == "roate");
    REQUIRE(book.get(config::strategy_name::LETTER_FREQ_HARD) == "slate");
    REQUIRE_FALSE(book.get(config::strategy_name::MINIMAX_HARD).has_value());
}

TEST_CASE("OpeningBook: save() and load()", "[openingBook]") {
    const auto path = tempPath("book");

    OpeningBook book;
    book.set(config::strategy_name::MINIMAX, "soare");
    book.set(config::strategy_name::MINIMAX_HARD, "raise");
    REQUIRE(book.save(path.string()));

    OpeningBook restored;
    restored.set(config::strategy_name::LETTER_FREQ, "crane");
    REQUIRE(restored.load(path.string()));

    // Loading replaces the previous contents
    REQUIRE(restored.size() == 2);
    REQUIRE(restored.get(config::strategy_name::MINIMAX) == "soare");
    REQUIRE(restored.get(config::strategy_name::MINIMAX_HARD) == "raise");
    REQUIRE_FALSE(restored.get(config::strategy_name::LETTER_FREQ).has_value());

    std::filesystem::remove(path);
}

TEST_CASE("OpeningBook: unreadable files leave the book unchanged", "[openingBook]") {
    OpeningBook book;
    book.set(config::strategy_name::MINIMAX, "soare");

    SECTION("Missing") {
        REQUIRE_FALSE(book.load(tempPath("missing_book").string()));
    }

    SECTION("Corrupt") {
        const auto path = tempPath("corrupt_book");
        {
            std::ofstream file{path, std::ios::binary};
            file << "definitely not an archive";
        }
        REQUIRE_FALSE(book.load(path.string()));
        std::filesystem::remove(path);
    }

    SECTION("Unwritable") {
        const auto path = std::filesystem::temp_directory_path() / "no_such_dir" / "book.bin";
        REQUIRE_FALSE(book.save(path.string()));
    }

    REQUIRE(book.size() == 1);
    REQUIRE(book.get(config::strategy_name::MINIMAX) == "soare");
}

TEST_CASE("OpeningBookProvider: only answers the opening move", "[openingBook]") {
    const auto lexicon = test::fixtureLexicon();
    OpeningBook book;
    book.set(config::strategy_name::MINIMAX, "soare");
    strategy::OpeningBookProvider provider{book, lexicon, config::strategy_name::MINIMAX};
    const auto soare = lexicon.require("soare");

    const auto opening = provider.propose({lexicon.answers(), lexicon.guesses(), {}});
    REQUIRE(opening.has_value());
    REQUIRE(opening->guess == soare);
    REQUIRE(opening->fromBook);
    REQUIRE_FALSE(opening->score.has_value());

    SECTION("Declines once a turn has been played") {
        const History history{{soare, feedback::ALL_ABSENT}};
        REQUIRE_FALSE(provider.propose({lexicon.answers(), lexicon.guesses(), history}).has_value());
    }

    SECTION("Declines on a narrowed candidate set") {
        const vocab::WordIds narrowed{lexicon.require("crane"), lexicon.require("crate")};
        REQUIRE_FALSE(provider.propose({narrowed, lexicon.guesses(), {}}).has_value());
    }

    SECTION("Declines without an entry for its strategy") {
        strategy::OpeningBookProvider other{book, lexicon, config::strategy_name::LETTER_FREQ};
        REQUIRE_FALSE(other.propose({lexicon.answers(), lexicon.guesses(), {}}).has_value());
    }

    SECTION("Declines a word outside the vocabulary") {
        book.set(config::strategy_name::MINIMAX, "qwert");
        REQUIRE_FALSE(provider.propose({lexicon.answers(), lexicon.guesses(), {}}).has_value());
    }
}

TEST_CASE("OpeningBook: buildOpening() scores the whole Answer Set", "[openingBook]") {
    const auto lexicon = test::smallLexicon();
    cache::PatternCache cache{lexicon};
    strategy::MinimaxStrategy minimax{cache, strategy::Mode::EASY, 2};

    const auto opening = strategy::buildOpening(minimax, lexicon);
    REQUIRE_FALSE(opening.fromBook);
    REQUIRE(opening.score.has_value());
    REQUIRE(*opening.score == minimax.expectedRemaining(opening.guess, lexicon.answers()));
    for (vocab::WordId id : lexicon.guesses()) {
        REQUIRE(*opening.score <= minimax.expectedRemaining(id, lexicon.answers()));
    }
}
