#pragma once

#include <chrono>
#include <ratio>
#include <stdexcept>

namespace guesswork::timing {

// Accumulating stopwatch. Seconds as double unless told otherwise.
template <typename Rep = double, typename Period = std::ratio<1>>
class Timer {
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<Rep, Period>;

    Clock::time_point startedAt;
    Duration total = Duration::zero();
    bool running = false;

public:
    Timer() noexcept = default;

    // Starts immediately when asked to
    explicit Timer(bool startNow) {
        if (startNow) start();
    }

    void start() {
        if (running) throw std::logic_error("Timer::start() called while already running");
        running = true;
        startedAt = Clock::now();
    }

    void stop() {
        if (!running) throw std::logic_error("Timer::stop() called without start()");
        total += std::chrono::duration_cast<Duration>(Clock::now() - startedAt);
        running = false;
    }

    // Time accumulated so far, including the current lap
    Duration elapsed() const {
        if (!running) return total;
        return total + std::chrono::duration_cast<Duration>(Clock::now() - startedAt);
    }

    void reset() noexcept {
        total = Duration::zero();
        running = false;
    }
};

}
