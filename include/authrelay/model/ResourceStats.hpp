#pragma once

#include <chrono>
#include <cstdint>

namespace authrelay::model {

struct ResourceStats {
    std::chrono::milliseconds cooldown{};
    std::uint64_t successCount{};
    std::uint64_t failCount{};
    std::uint64_t useCount{};
    std::chrono::system_clock::time_point lastUsedAt{};
    // Set by a success report: the resource may be reserved again without
    // waiting out its cooldown. Cleared by the next reservation.
    bool released{};

    [[nodiscard]] std::chrono::system_clock::time_point availableAt() const {
        return released ? lastUsedAt : lastUsedAt + cooldown;
    }
    [[nodiscard]] bool available(std::chrono::system_clock::time_point now) const { return now >= availableAt(); }
};

inline bool operator==(const ResourceStats& lhs, const ResourceStats& rhs) {
    return lhs.cooldown == rhs.cooldown && lhs.successCount == rhs.successCount &&
           lhs.failCount == rhs.failCount && lhs.useCount == rhs.useCount && lhs.lastUsedAt == rhs.lastUsedAt &&
           lhs.released == rhs.released;
}

} // namespace authrelay::model
