#include "Logging.hh"

#include <array>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <utility>

namespace Shuffling {

namespace {

using namespace std::string_view_literals;

auto globalLoggingStream = std::ref(std::cerr);
auto globalLoggingLevel = LogLevel::WARNING;

constexpr auto LOG_LEVEL_NAMES = std::array {
    std::pair {LogLevel::NONE,    "none"sv},
    std::pair {LogLevel::FATAL,   "fatal"sv},
    std::pair {LogLevel::ERROR,   "error"sv},
    std::pair {LogLevel::WARNING, "warning"sv},
    std::pair {LogLevel::INFO,    "info"sv},
    std::pair {LogLevel::DEBUG,   "debug"sv},
};

}

namespace Impl {

bool shouldLog(const LogLevel level)
{
    if (level == LogLevel::NONE || level > globalLoggingLevel) {
        return false;
    }
    const auto time = std::time(nullptr);
    const auto name = LOG_LEVEL_NAMES.at(static_cast<std::size_t>(level)).second;
    logStream() << std::put_time(std::localtime(&time), "%c ") <<
        std::left << std::setw(8) << name << std::right;
    return true;
}

std::ostream& logStream()
{
    return globalLoggingStream;
}

}

LogLevel getLogLevel(const int verbosity)
{
    if (verbosity >= 2) {
        return LogLevel::DEBUG;
    } else if (verbosity == 1) {
        return LogLevel::INFO;
    }
    return LogLevel::WARNING;
}

std::optional<LogLevel> parseLogLevel(const std::string_view name)
{
    for (const auto& [level, level_name] : LOG_LEVEL_NAMES) {
        if (level_name == name) {
            return level;
        }
    }
    return std::nullopt;
}

void setupLogging(const LogLevel level, std::ostream& stream)
{
    globalLoggingLevel = level;
    globalLoggingStream = stream;
}

}
