#pragma once

#include <vector>

#include "feedback.hpp"
#include "vocab.hpp"

namespace guesswork {

// One round: the word played and the pattern it received
struct Turn {
    vocab::WordId guess;
    feedback::Encoding pattern;

    constexpr bool operator==(const Turn&) const noexcept = default;
};

using History = std::vector<Turn>;

}
