#pragma once

#include <stdexcept>

namespace guesswork {

// A guess was requested while no answer is consistent with the feedback so far
struct NoCandidatesError : std::logic_error {
    using std::logic_error::logic_error;
};

// Pattern string is not WORD_LENGTH characters of '0', '1' or '2'
struct InvalidFeedbackFormat : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// Word is malformed or missing from the vocabulary
struct InvalidWordError : std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A persisted artifact could not be read or written. Never escapes load()/save().
struct CacheUnavailable : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct GameOverError : std::logic_error {
    using std::logic_error::logic_error;
};

}
