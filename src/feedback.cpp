#include "feedback.hpp"

namespace guesswork::feedback {

Encoding encode(std::string_view guess, std::string_view secret) {
    guard::runtimeGuard<InvalidWordError>(util::isValidWord(guess) && util::isValidWord(secret), "cannot encode '{}' against '{}'", guess, secret);
    Encoder encoder{};
    return encoder(guess, secret);
}

std::string toString(Encoding encoding) {
    guard::runtimeGuard<std::out_of_range>(encoding < NUM_FEEDBACKS, "{} is not a feedback encoding", static_cast<unsigned>(encoding));
    std::string fbString(config::WORD_LENGTH, symbol::ABSENT);
    for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
        fbString[i] = symbolAt(encoding, i);
    }
    return fbString;
}

}
