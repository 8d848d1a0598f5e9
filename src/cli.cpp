#include "cli.hpp"

#include <cstdlib>
#include <stdexcept>

#include <fmt/format.h>

#include "guard.hpp"

namespace guesswork::cli {

namespace {

Command parseCommand(std::string_view text) {
    if (text == "solve") return Command::SOLVE;
    if (text == "helper") return Command::HELPER;
    if (text == "stats") return Command::STATS;
    if (text == "optimize") return Command::OPTIMIZE;
    if (text == "precompute") return Command::PRECOMPUTE;
    guard::formatError<std::invalid_argument>("Unknown command \"{}\"", text);
}

bool acceptsMode(Command command) noexcept {
    return command == Command::SOLVE || command == Command::STATS || command == Command::OPTIMIZE;
}

size_t parseThreads(const char* text) {
    char* end = nullptr;
    const unsigned long long value = std::strtoull(text, &end, 10);
    guard::runtimeGuard<std::invalid_argument>(end != text && *end == '\0' && value > 0, "--threads expects a positive integer, got \"{}\"", text);
    return static_cast<size_t>(value);
}

}

std::string_view toString(Command command) noexcept {
    switch (command) {
        case Command::SOLVE: return "solve";
        case Command::HELPER: return "helper";
        case Command::STATS: return "stats";
        case Command::OPTIMIZE: return "optimize";
        case Command::PRECOMPUTE: return "precompute";
    }
    return "";
}

Options parseArgs(int argc, const char* const* argv) {
    Options options{};
    bool sawCommand = false;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        auto value = [&]() -> const char* {
            guard::runtimeGuard<std::invalid_argument>(i + 1 < argc, "{} expects a value", arg);
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") { options.showHelp = true; continue; }
        if (arg == "--guesses") { options.guessPath = value(); continue; }
        if (arg == "--answers") { options.answerPath = value(); continue; }
        if (arg == "--cache") { options.cachePath = value(); continue; }
        if (arg == "--book") { options.bookPath = value(); continue; }
        if (arg == "--report") { options.reportPath = value(); continue; }
        if (arg == "--threads") { options.threads = parseThreads(value()); continue; }
        if (arg == "--strategy") { options.kind = strategy::parseKind(value()); continue; }
        if (arg == "--no-precompute") { options.precompute = false; continue; }
        if (arg == "--quiet") { options.logLevel = log::Level::WARN; continue; }
        if (arg == "--verbose") { options.logLevel = log::Level::DEBUG; continue; }

        guard::runtimeGuard<std::invalid_argument>(!arg.starts_with("-"), "Unknown option \"{}\"", arg);

        if (!sawCommand) {
            options.command = parseCommand(arg);
            sawCommand = true;
        } else if (acceptsMode(options.command) && (arg == "easy" || arg == "hard")) {
            options.mode = arg == "hard" ? strategy::Mode::HARD : strategy::Mode::EASY;
        } else {
            guard::formatError<std::invalid_argument>("Unexpected argument \"{}\" for {}", arg, toString(options.command));
        }
    }

    guard::runtimeGuard<std::invalid_argument>(sawCommand || options.showHelp, "No command given");

    const bool hard = options.mode == strategy::Mode::HARD;
    if (options.bookPath.empty()) options.bookPath = hard ? config::OPENING_BOOK_HARD_FILE : config::OPENING_BOOK_FILE;
    if (options.reportPath.empty()) options.reportPath = hard ? config::REPORT_HARD_FILE : config::REPORT_FILE;
    return options;
}

std::string usage(std::string_view program) {
    return fmt::format(
        "Usage: {} <command> [easy|hard] [options]\n"
        "Commands:\n"
        "  solve [easy|hard]     interactive solver, you report the feedback\n"
        "  helper                list the answers left after your own guesses\n"
        "  stats [easy|hard]     simulate every answer and report the average tries\n"
        "  optimize [easy|hard]  compute the best first guess into the opening book\n"
        "  precompute            fill and save the pattern cache\n"
        "Options:\n"
        "  --guesses PATH   allowed guesses (default {})\n"
        "  --answers PATH   possible answers (default {})\n"
        "  --cache PATH     pattern cache (default {})\n"
        "  --book PATH      opening book (default {} or {})\n"
        "  --report PATH    stats report (default {} or {})\n"
        "  --threads N      worker threads\n"
        "  --strategy NAME  minimax or letter-freq\n"
        "  --no-precompute  fill the pattern cache lazily\n"
        "  --quiet | --verbose\n",
        program, config::GUESS_FILE, config::ANSWER_FILE, config::PATTERN_CACHE_FILE,
        config::OPENING_BOOK_FILE, config::OPENING_BOOK_HARD_FILE, config::REPORT_FILE, config::REPORT_HARD_FILE);
}

}
