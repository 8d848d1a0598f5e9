#pragma once

#include <algorithm>
#include <bit>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <string_view>

#include <boost/integer.hpp>

#include "config.hpp"
#include "guard.hpp"

namespace guesswork::util {

// Compile time integer power
template <std::unsigned_integral T = size_t, typename R = T>
consteval inline R constevalPow(T base, T power) {
    if (power == T{0}) return R{1};
    if (base <= T{1}) return static_cast<R>(base);
    if (power % T{2} == T{0}) return constevalPow(base * base, power / T{2});
    return static_cast<R>(base) * constevalPow(base, power - 1);
}

/*
Set of values drawn from a small bounded integral domain, one bit per value. Iterates in
ascending order.
*/
template <std::integral T, T minVal, T maxVal>
requires (minVal < maxVal)
class BitIndexMap {
    static constexpr unsigned BITS = static_cast<unsigned>(maxVal - minVal) + 1u;
    static_assert(BITS <= 64u, "BitIndexMap domain does not fit in 64 bits");

public:
    using Encoding = typename boost::uint_t<BITS>::least;

private:
    Encoding bits = 0;

    static constexpr bool inRange(T val) noexcept {
        return minVal <= val && val <= maxVal;
    }

    // Undefined behavior if val is not in range
    static constexpr Encoding bitOf(T val) noexcept {
        return static_cast<Encoding>(Encoding{1} << static_cast<unsigned>(val - minVal));
    }

public:
    constexpr BitIndexMap() noexcept = default;

    constexpr bool operator==(const BitIndexMap&) const noexcept = default;

    // Throws std::out_of_range
    constexpr void set(T val) {
        guard::hybridGuard<std::out_of_range>(inRange(val), "val is out of range");
        bits |= bitOf(val);
    }

    constexpr bool contains(T val) const noexcept {
        return inRange(val) && (bits & bitOf(val));
    }

    constexpr size_t size() const noexcept {
        return static_cast<size_t>(std::popcount(bits));
    }

    constexpr bool empty() const noexcept {
        return bits == 0;
    }

    // True if every value of other is contained
    constexpr bool includes(const BitIndexMap& other) const noexcept {
        return (bits & other.bits) == other.bits;
    }

    class Iterator {
        Encoding rest;

    public:
        constexpr explicit Iterator(Encoding bits) noexcept : rest{bits} {}

        constexpr T operator*() const noexcept {
            return static_cast<T>(static_cast<T>(std::countr_zero(rest)) + minVal);
        }

        constexpr Iterator& operator++() noexcept {
            rest &= static_cast<Encoding>(rest - 1);  // Clear lowest bit
            return *this;
        }

        constexpr bool operator==(const Iterator&) const noexcept = default;
    };

    constexpr Iterator begin() const noexcept { return Iterator{bits}; }

    constexpr Iterator end() const noexcept { return Iterator{0}; }
};

using LetterSet = BitIndexMap<char, 'a', 'z'>;
using PositionSet = BitIndexMap<size_t, 0, config::WORD_LENGTH - 1>;

constexpr inline bool isValidLetter(char c) noexcept {
    return 'a' <= c && c <= 'z';
}

// Checks size and letters
constexpr inline bool isValidWord(std::string_view word) noexcept {
    if (word.size() != config::WORD_LENGTH) return false;
    return std::all_of(word.begin(), word.end(), isValidLetter);
}

}
