#include "authrelay/util/Clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace authrelay::util {

Clock::TimePoint SystemClock::now() const {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

std::int64_t toEpochMillis(Clock::TimePoint timePoint) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(timePoint.time_since_epoch()).count();
}

Clock::TimePoint fromEpochMillis(std::int64_t millis) {
    return Clock::TimePoint{std::chrono::duration_cast<Clock::TimePoint::duration>(
        std::chrono::milliseconds{millis})};
}

std::string formatIsoTimestamp(Clock::TimePoint timePoint) {
    const auto seconds = std::chrono::floor<std::chrono::seconds>(timePoint);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - seconds).count();
    const std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

} // namespace authrelay::util
