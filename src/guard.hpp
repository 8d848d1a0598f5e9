#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

namespace guesswork::guard {

// Throws RuntimeException using msg and ...args
template <typename RuntimeException = std::runtime_error, typename ...Args>
[[noreturn]] inline void formatError(fmt::format_string<Args...> msg, Args&&... args) {
    throw RuntimeException(fmt::format(msg, std::forward<Args>(args)...));
}

// Throws staticMsg at compile time, otherwise Exception(staticMsg) at run time
template <typename Exception = std::runtime_error>
[[noreturn]] constexpr inline void hybridError(std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        throw staticMsg;
    } else {
        throw Exception(std::string{staticMsg});
    }
}

/*
Guard noExceptCond at compile time (if possible) otherwise runtime
*/
template <typename Exception = std::runtime_error>
constexpr inline void hybridGuard(bool noExceptCond, std::string_view staticMsg) {
    if (std::is_constant_evaluated()) {
        if (!noExceptCond) throw staticMsg;
    } else {
        if (!noExceptCond) throw Exception(std::string{staticMsg});
    }
}

// Guard noExceptCond at runtime
template <typename Exception = std::runtime_error, typename ...Args>
inline void runtimeGuard(bool noExceptCond, fmt::format_string<Args...> msg, Args&&... args) {
    if (!noExceptCond) formatError<Exception>(msg, std::forward<Args>(args)...);
}

} // end namespace guesswork::guard
