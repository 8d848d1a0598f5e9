#include "interactive.hpp"

#include <optional>
#include <string_view>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include "config.hpp"
#include "errors.hpp"
#include "feedback.hpp"
#include "game.hpp"
#include "log.hpp"

namespace guesswork::interactive {

namespace {

void printFeedbackKey(std::ostream& out) {
    fmt::print(out, "Feedback key: {} = correct letter and position, {} = letter elsewhere in the word, {} = letter absent\n",
               feedback::symbol::EXACT, feedback::symbol::MISPLACED, feedback::symbol::ABSENT);
    fmt::print(out, "Example: 20100 means the 1st letter is correct and the 3rd is misplaced\n");
}

// Prompts once and returns the trimmed, lowercased line. Empty on end of input.
std::optional<std::string> prompt(std::istream& in, std::ostream& out, std::string_view text) {
    fmt::print(out, "{}", text);
    out.flush();

    std::string line;
    if (!std::getline(in, line)) return std::nullopt;
    boost::algorithm::trim(line);
    boost::algorithm::to_lower(line);
    return line;
}

bool isQuit(std::string_view line) noexcept {
    return line == "quit" || line == "exit";
}

// Empty when the user quits
std::optional<feedback::Encoding> readPattern(std::istream& in, std::ostream& out) {
    while (true) {
        auto line = prompt(in, out, "Enter feedback (e.g., 20100 or 'quit' to exit): ");
        if (!line || isQuit(*line)) return std::nullopt;
        if (feedback::isValidFeedbackString(*line)) return feedback::parse(*line);
        fmt::print(out, "Invalid feedback! Please enter {} digits (0, 1, or 2).\n", config::WORD_LENGTH);
    }
}

void showCandidates(const vocab::Lexicon& lexicon, const vocab::WordIds& candidates, std::ostream& out) {
    fmt::print(out, "{} possible answers remain.\n", candidates.size());
    if (candidates.empty()) return;

    const bool showAll = candidates.size() <= config::SHOW_ALL_CANDIDATES;
    const size_t shown = showAll ? candidates.size() : config::CANDIDATE_PREVIEW;
    if (showAll) {
        fmt::print(out, "Possible answers: ");
    } else {
        fmt::print(out, "First {} possible answers: ", shown);
    }
    for (size_t i = 0; i < shown; ++i) {
        fmt::print(out, "{}{}", i ? ", " : "", lexicon.word(candidates[i]));
    }
    fmt::print(out, "{}\n", showAll ? "" : "...");
}

void showAnswerRows(const vocab::Lexicon& lexicon, const vocab::WordIds& candidates, std::ostream& out) {
    if (candidates.empty()) {
        fmt::print(out, "No possible answers found with the given constraints!\n");
        return;
    }

    fmt::print(out, "Found {} possible answer(s):\n", candidates.size());
    for (size_t i = 0; i < candidates.size(); ++i) {
        const bool rowEnd = (i + 1) % config::CANDIDATE_PREVIEW == 0 || i + 1 == candidates.size();
        fmt::print(out, "  {}{}", boost::algorithm::to_upper_copy(lexicon.word(candidates[i])), rowEnd ? "\n" : "");
    }
}

void flushCache(cache::PatternCache& cache, const std::string& cachePath) {
    if (cache.isDirty() && cache.flush(cachePath)) log::info("Updated pattern cache written to {}", cachePath);
}

}

size_t playSolver(const strategy::SolverContext& ctx, std::istream& in, std::ostream& out, const std::string& cachePath) {
    auto selector = ctx.makeSelector();
    game::Game game{ctx.cache};
    size_t gamesFinished = 0;

    fmt::print(out, "Guesswork solver ({} mode)\n", strategy::toString(ctx.mode));
    printFeedbackKey(out);

    while (true) {
        game.reset();
        bool askedUser = false;

        while (!game.isOver()) {
            strategy::Suggestion suggestion;
            try {
                suggestion = selector.select({game.candidates(), ctx.lexicon.guesses(), game.history()});
            } catch (const NoCandidatesError&) {
                fmt::print(out, "No answer matches that feedback. Check the patterns entered.\n");
                break;
            }
            fmt::print(out, "Attempt {}: {}\n", game.round() + 1, ctx.lexicon.word(suggestion.guess));

            feedback::Encoding pattern = feedback::ALL_EXACT;
            if (game.candidates().size() == 1) {
                fmt::print(out, "Feedback: {}\n", feedback::toString(pattern));
            } else {
                askedUser = true;
                const auto entered = readPattern(in, out);
                if (!entered) {
                    fmt::print(out, "Exiting game loop by user request.\n");
                    flushCache(ctx.cache, cachePath);
                    return gamesFinished;
                }
                pattern = *entered;
            }

            game.record(suggestion.guess, pattern);
            showCandidates(ctx.lexicon, game.candidates(), out);
        }

        if (game.state() == game::State::SOLVED) {
            const auto& last = game.history().back();
            fmt::print(out, "Solved in {} guesses! The answer was {}.\n", game.round(), ctx.lexicon.word(last.guess));
        } else {
            fmt::print(out, "Failed to solve the puzzle.\n");
        }
        ++gamesFinished;

        flushCache(ctx.cache, cachePath);

        // A game that never needed feedback would replay identically
        if (!askedUser) {
            fmt::print(out, "Only one possible answer, nothing left to play.\n");
            return gamesFinished;
        }
        fmt::print(out, "Initiating next game...\n\n");
    }
}

size_t playHelper(const strategy::SolverContext& ctx, std::istream& in, std::ostream& out) {
    game::Game game{ctx.cache};

    fmt::print(out, "Guesswork helper: narrow down the possible answers from your own guesses\n");
    printFeedbackKey(out);
    fmt::print(out, "Starting with {} possible answers\n", game.candidates().size());

    while (true) {
        fmt::print(out, "\nRound {}\n", game.round() + 1);

        std::optional<vocab::WordId> guessId;
        while (!guessId) {
            auto line = prompt(in, out, "Enter your guess (5-letter word): ");
            if (!line || isQuit(*line)) return game.candidates().size();
            guessId = ctx.lexicon.find(*line);
            if (!guessId) fmt::print(out, "Invalid guess! Please enter a valid {}-letter word.\n", config::WORD_LENGTH);
        }

        const auto pattern = readPattern(in, out);
        if (!pattern) return game.candidates().size();

        game.record(*guessId, *pattern);

        const auto& guess = ctx.lexicon.word(*guessId);
        fmt::print(out, "\nYour guess: {}\n", boost::algorithm::to_upper_copy(guess));
        fmt::print(out, "Feedback: {}\n", feedback::toString(*pattern));
        fmt::print(out, "Remaining possible answers: {}\n", game.candidates().size());
        showAnswerRows(ctx.lexicon, game.candidates(), out);

        if (feedback::isSolved(*pattern)) {
            fmt::print(out, "\nCongratulations! You found the answer: {}\n", boost::algorithm::to_upper_copy(guess));
            break;
        }
        if (game.candidates().empty()) {
            fmt::print(out, "\nNo possible answers found! There might be an error in your feedback.\n");
            break;
        }
        if (game.isOver()) {
            fmt::print(out, "\nOut of guesses.\n");
            break;
        }

        auto again = prompt(in, out, "\nContinue with another guess? (y/n): ");
        if (!again || (*again != "y" && *again != "yes")) break;
    }

    fmt::print(out, "\nThanks for using the helper!\n");
    return game.candidates().size();
}

}
