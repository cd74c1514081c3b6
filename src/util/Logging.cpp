#include "authrelay/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace authrelay::util {
namespace {

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::atomic<LogLevel>& threshold() {
    static std::atomic<LogLevel> level{LogLevel::info};
    return level;
}

const char* levelTag(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

// Short, stable per-thread tag so interleaved retry loops can be told apart.
unsigned threadTag() {
    static thread_local const unsigned tag =
        static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000);
    return tag;
}

std::string localTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto whole = floor<seconds>(now);
    const auto ms = duration_cast<milliseconds>(now - whole).count();

    std::time_t t = system_clock::to_time_t(whole);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms;
    return oss.str();
}

} // namespace

void initLogging(LogLevel level) {
    threshold().store(level);
}

LogLevel logLevel() {
    return threshold().load();
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lower == "trace") return LogLevel::trace;
    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warn" || lower == "warning") return LogLevel::warn;
    if (lower == "error") return LogLevel::error;
    return std::nullopt;
}

void log(LogLevel level, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(threshold().load())) {
        return;
    }
    const auto stamp = localTimestamp();
    std::lock_guard lk(sinkMutex());
    std::clog << stamp << " [" << levelTag(level) << "] [t" << std::setw(5) << std::setfill('0') << threadTag()
              << "] " << message << '\n';
}

} // namespace authrelay::util
