#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace authrelay::util {

// Wall clock seen by the resource pool. Persisted timestamps are epoch
// milliseconds, so implementations should not hand out finer values.
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override;
};

std::int64_t toEpochMillis(Clock::TimePoint timePoint);
Clock::TimePoint fromEpochMillis(std::int64_t millis);

// UTC, millisecond precision: 2024-01-31T08:15:00.250Z
std::string formatIsoTimestamp(Clock::TimePoint timePoint);

} // namespace authrelay::util
