#pragma once

#include "authrelay/model/Outcome.hpp"
#include "authrelay/model/Resource.hpp"
#include "authrelay/model/ResourceStats.hpp"
#include "authrelay/repository/StatsStore.hpp"
#include "authrelay/util/Clock.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace authrelay::pool {

enum class AcquirePolicy {
    immediate, // nullopt as soon as nothing is available
    block      // wait for the earliest cooldown to lapse, bounded
};

struct PoolOptions {
    std::chrono::milliseconds defaultCooldown{std::chrono::minutes{10}};
    std::chrono::milliseconds maxCooldown{std::chrono::hours{12}};
    double backoffFactor{2.0};
    std::chrono::milliseconds decayInterval{std::chrono::minutes{30}};
    AcquirePolicy acquirePolicy{AcquirePolicy::immediate};
    std::chrono::milliseconds maxAcquireWait{std::chrono::seconds{30}};
    std::optional<std::uint32_t> seed;
};

struct ResourceView {
    model::Resource resource;
    model::ResourceStats stats;
    bool available{};
};

// Shared set of egress identities with per-resource cooldown and backoff.
// Every public member is safe to call from any thread; selection and
// reservation happen under one mutex so two callers never walk away with
// the same resource inside its cooldown window.
class ResourcePool {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    ResourcePool(PoolOptions options, const util::Clock& clock, repository::StatsStore* store = nullptr);

    ResourcePool(const ResourcePool&) = delete;
    ResourcePool& operator=(const ResourcePool&) = delete;

    // Replaces the resource list and merges persisted stats. Never throws.
    void initialize(std::vector<model::Resource> resources);
    std::size_t initializeFromFile(const std::filesystem::path& path, std::string_view defaultScheme = "http");

    std::optional<model::Resource> acquire(Deadline deadline = std::nullopt);

    // Prefers resources whose key is not listed, falls back to any
    // available one.
    std::optional<model::Resource> acquireExcluding(const std::vector<std::string>& excludedKeys,
                                                    Deadline deadline = std::nullopt);

    // Resources not in the current list are ignored.
    void reportOutcome(const model::Resource& resource, model::ResourceReport report);

    // Returns a reservation that never carried traffic. Counters and
    // cooldown stay as they were.
    void release(const model::Resource& resource);

    // Relaxes penalties of resources idle longer than decayInterval.
    // Returns how many records changed.
    std::size_t decay();

    [[nodiscard]] std::optional<std::string> authHeaderFor(const model::Resource& resource) const;

    [[nodiscard]] std::vector<ResourceView> snapshot() const;
    [[nodiscard]] std::optional<model::ResourceStats> stats(const std::string& key) const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool persistenceDegraded() const noexcept { return degraded_.load(); }
    [[nodiscard]] const PoolOptions& options() const noexcept { return options_; }

private:
    struct PendingWrite {
        repository::StatsMap stats;
        std::uint64_t generation{};
    };

    model::ResourceStats defaultStats() const;
    model::ResourceStats& statsForLocked(const std::string& key);
    bool pooledLocked(const std::string& key) const;
    std::optional<model::Resource> selectLocked(const std::vector<std::string>& excludedKeys,
                                                util::Clock::TimePoint now);
    std::optional<model::Resource> acquireImpl(const std::vector<std::string>& excludedKeys, Deadline deadline);
    std::optional<util::Clock::TimePoint> earliestAvailableLocked() const;
    PendingWrite preparePersistLocked();
    void writeThrough(PendingWrite pending);

    PoolOptions options_;
    const util::Clock& clock_;
    repository::StatsStore* store_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::vector<model::Resource> resources_;
    repository::StatsMap stats_;
    std::mt19937 rng_;
    std::uint64_t generation_{0};

    std::mutex persistMutex_;
    std::uint64_t writtenGeneration_{0};
    std::atomic<bool> degraded_{false};
};

} // namespace authrelay::pool
