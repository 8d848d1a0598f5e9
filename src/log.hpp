#pragma once

#include <atomic>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace guesswork::log {

enum class Level : uint8_t { DEBUG = 0, INFO, WARN, ERROR, OFF };

namespace __impl {
    inline std::atomic<Level> threshold{Level::INFO};
    inline std::mutex sinkMutex{};

    constexpr inline std::string_view tag(Level level) noexcept {
        switch (level) {
            case Level::DEBUG: return "debug";
            case Level::INFO: return "info";
            case Level::WARN: return "warn";
            case Level::ERROR: return "error";
            default: return "";
        }
    }

    template <typename ...Args>
    inline void write(Level level, fmt::format_string<Args...> msg, Args&&... args) {
        if (level < threshold.load(std::memory_order_relaxed)) return;
        auto line = fmt::format("[{}] {}\n", tag(level), fmt::format(msg, std::forward<Args>(args)...));

        // One line per lock so concurrent workers never interleave
        std::lock_guard<std::mutex> lock(sinkMutex);
        std::clog << line << std::flush;
    }
}

inline void setLevel(Level level) noexcept {
    __impl::threshold.store(level, std::memory_order_relaxed);
}

inline Level level() noexcept {
    return __impl::threshold.load(std::memory_order_relaxed);
}

template <typename ...Args>
inline void debug(fmt::format_string<Args...> msg, Args&&... args) {
    __impl::write(Level::DEBUG, msg, std::forward<Args>(args)...);
}

template <typename ...Args>
inline void info(fmt::format_string<Args...> msg, Args&&... args) {
    __impl::write(Level::INFO, msg, std::forward<Args>(args)...);
}

template <typename ...Args>
inline void warn(fmt::format_string<Args...> msg, Args&&... args) {
    __impl::write(Level::WARN, msg, std::forward<Args>(args)...);
}

template <typename ...Args>
inline void error(fmt::format_string<Args...> msg, Args&&... args) {
    __impl::write(Level::ERROR, msg, std::forward<Args>(args)...);
}

}
