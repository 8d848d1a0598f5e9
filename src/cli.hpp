#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "config.hpp"
#include "log.hpp"
#include "parallelTaskQueue.hpp"
#include "selector.hpp"

namespace guesswork::cli {

enum class Command : uint8_t { SOLVE, HELPER, STATS, OPTIMIZE, PRECOMPUTE };

std::string_view toString(Command command) noexcept;

struct Options {
    Command command = Command::SOLVE;
    strategy::Mode mode = strategy::Mode::EASY;
    strategy::Kind kind = strategy::Kind::MINIMAX;

    std::string guessPath = config::GUESS_FILE;
    std::string answerPath = config::ANSWER_FILE;
    std::string cachePath = config::PATTERN_CACHE_FILE;
    std::string bookPath;    // Defaults per mode
    std::string reportPath;  // Defaults per mode

    size_t threads = parallel::defaultConcurrency();
    bool precompute = true;
    log::Level logLevel = log::Level::INFO;
    bool showHelp = false;
};

/*
<command> [easy|hard] [options]. The mode word is accepted by solve, stats and optimize.
Throws std::invalid_argument on anything unrecognised.
*/
Options parseArgs(int argc, const char* const* argv);

std::string usage(std::string_view program);

}
