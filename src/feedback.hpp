#pragma once

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <string>
#include <string_view>

#include <boost/integer.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "guard.hpp"
#include "util.hpp"

namespace guesswork::feedback::symbol {
    constexpr inline char ABSENT = '0';     // Letter does not occur among the secret's unconsumed letters
    constexpr inline char MISPLACED = '1';  // Letter is in the secret, but at another position
    constexpr inline char EXACT = '2';      // Letter is in the secret at this position

}  // namespace guesswork::feedback::symbol

namespace guesswork::feedback {
    constexpr inline size_t NUM_FEEDBACKS = util::constevalPow(3ul, config::WORD_LENGTH);  // Number of unique feedback patterns
    using Encoding = boost::uint_t<std::bit_width(NUM_FEEDBACKS)>::least;                  // Smallest type holding every pattern plus NOT_COMPUTED
    constexpr inline Encoding NOT_COMPUTED = static_cast<Encoding>(NUM_FEEDBACKS);

    namespace __impl {
        constexpr inline Encoding ABSENT = 0;
        constexpr inline Encoding MISPLACED = 1;
        constexpr inline Encoding EXACT = 2;
        constexpr inline Encoding BASE = 3;

        // Returns mulipliers for Encoding
        consteval inline std::array<Encoding, config::WORD_LENGTH> initMultipliers() {
            std::array<Encoding, config::WORD_LENGTH> multipliers{};
            Encoding multiplier = 1;
            for (size_t i = 0; i < multipliers.size(); ++i) {
                multipliers[i] = multiplier;
                multiplier *= BASE;
            }
            return multipliers;
        }

        // Position i contributes symbol * multipliers[i]
        constexpr inline std::array<Encoding, config::WORD_LENGTH> multipliers = initMultipliers();

        consteval inline Encoding encodeUniform(Encoding value) {
            Encoding encoding = 0;
            for (size_t i = 0; i < multipliers.size(); ++i) {
                encoding += value * multipliers[i];
            }
            return encoding;
        }

        /*
        Two pass encoder. Pass 1 marks EXACT positions and counts the secret's unmatched letters.
        Pass 2 scans left to right and marks a position MISPLACED while its letter still has an
        unmatched count, consuming one count per mark. A secret letter is never credited to more
        guess positions than it occurs.
        */
        struct ArrEncoder {
        protected:
            using Count = boost::uint_t<std::bit_width(config::WORD_LENGTH)>::least;
            std::array<Count, config::ALPHABET_SIZE> unmatchedCounts{};

            [[nodiscard]] constexpr Count& getCount(char letter) {
                return unmatchedCounts[letter - 'a'];
            }

            constexpr void resetUnmatchedCounts() {
                unmatchedCounts.fill(0);
            }

        public:
            constexpr ArrEncoder() noexcept = default;

            [[nodiscard]] constexpr Encoding operator()(std::string_view guess, std::string_view secret) {
                Encoding encoding = encodeUniform(ABSENT);
                resetUnmatchedCounts();

                // Step 1: Add EXACT to encoding and count unmatched secret letters
                for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
                    char secretLetter = secret[i];
                    bool isExact = guess[i] == secretLetter;
                    encoding += (EXACT * multipliers[i] * static_cast<Encoding>(isExact));
                    getCount(secretLetter) += static_cast<Count>(!isExact);
                }

                // Step 2: Add MISPLACED to encoding and consume unmatched counts
                for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
                    char guessLetter = guess[i];
                    Count& count = getCount(guessLetter);
                    bool isMisplaced = (secret[i] != guessLetter) && (count > 0);
                    encoding += (MISPLACED * multipliers[i] * static_cast<Encoding>(isMisplaced));
                    count -= static_cast<Count>(isMisplaced);
                }
                return encoding;
            }
        };

        [[nodiscard]] constexpr inline Encoding parseFeedbackString(std::string_view fbString) {
            guard::hybridGuard<InvalidFeedbackFormat>(fbString.size() == config::WORD_LENGTH, "feedback must have one symbol per letter");
            Encoding encoding = 0;

            for (size_t i = 0; i < config::WORD_LENGTH; ++i) {
                Encoding pf = ABSENT;
                switch (fbString[i]) {
                    case (symbol::EXACT) : pf = EXACT; break;
                    case (symbol::ABSENT) : pf = ABSENT; break;
                    case (symbol::MISPLACED) : pf = MISPLACED; break;
                    default : guard::hybridError<InvalidFeedbackFormat>("feedback symbols must be 0, 1 or 2");
                }
                encoding += (pf * multipliers[i]);
            }
            return encoding;
        }

    }  // namespace __impl

    constexpr inline Encoding ALL_ABSENT = __impl::encodeUniform(__impl::ABSENT);
    constexpr inline Encoding ALL_EXACT = __impl::encodeUniform(__impl::EXACT);  // Solved sentinel

    constexpr inline bool isValidFeedbackString(std::string_view fbString) noexcept {
        if (fbString.size() != config::WORD_LENGTH) return false;
        auto pred = [](char c) noexcept -> bool { return c == symbol::EXACT || c == symbol::ABSENT || c == symbol::MISPLACED; };
        return std::all_of(fbString.begin(), fbString.end(), pred);
    }

    // Returns the symbol ('0', '1' or '2') at position i of encoding
    constexpr inline char symbolAt(Encoding encoding, size_t i) noexcept {
        return static_cast<char>('0' + (encoding / __impl::multipliers[i]) % __impl::BASE);
    }

    constexpr inline bool isSolved(Encoding encoding) noexcept {
        return encoding == ALL_EXACT;
    }

    using Encoder = __impl::ArrEncoder;

    // Throws InvalidFeedbackFormat
    inline Encoding parse(std::string_view fbString) {
        return __impl::parseFeedbackString(fbString);
    }

    Encoding encode(std::string_view guess, std::string_view secret);

    std::string toString(Encoding encoding);

}
