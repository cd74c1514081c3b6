#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace authrelay::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

void initLogging(LogLevel level);
LogLevel logLevel();
void log(LogLevel level, const std::string& message);

// Accepts the level names in any case ("warn" and "warning" are both fine).
std::optional<LogLevel> parseLogLevel(std::string_view name);

} // namespace authrelay::util
