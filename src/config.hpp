#pragma once

#include <cstddef>
namespace guesswork::config {

    constexpr inline auto GUESS_FILE = "allowed_wordle_guesses.txt";
    constexpr inline auto ANSWER_FILE = "possible_wordle_answers.txt";
    constexpr inline auto PATTERN_CACHE_FILE = "feedback_patterns_cache.bin";
    constexpr inline auto OPENING_BOOK_FILE = "first_guesses_cache.bin";
    constexpr inline auto OPENING_BOOK_HARD_FILE = "first_guesses_cache_hard_mode.bin";
    constexpr inline auto REPORT_FILE = "average_tries.txt";
    constexpr inline auto REPORT_HARD_FILE = "average_tries_hard_mode.txt";

    constexpr inline size_t ALPHABET_SIZE = 'z' - 'a' + 1;
    constexpr inline size_t WORD_LENGTH = 5;
    constexpr inline size_t MAX_ROUNDS = 6;
    constexpr inline size_t FAILED_ROUNDS = MAX_ROUNDS + 1;  // Sentinel result for an unsolved game
    constexpr inline size_t BATCH_PROGRESS_INTERVAL = 100;
    constexpr inline size_t SHOW_ALL_CANDIDATES = 10;  // Print every candidate at or below this count
    constexpr inline size_t CANDIDATE_PREVIEW = 5;

    namespace strategy_name {
        constexpr inline auto MINIMAX = "minimax_entropy";
        constexpr inline auto MINIMAX_HARD = "minimax_entropy_hard_mode";
        constexpr inline auto LETTER_FREQ = "letter_freq";
        constexpr inline auto LETTER_FREQ_HARD = "letter_freq_hard_mode";
    }
}
