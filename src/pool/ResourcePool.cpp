#include "authrelay/pool/ResourcePool.hpp"
#include "authrelay/util/JsonUtil.hpp"
#include "authrelay/util/Logging.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace authrelay::pool {
namespace {

std::chrono::milliseconds scaleCooldown(std::chrono::milliseconds cooldown, double factor) {
    const double scaled = static_cast<double>(cooldown.count()) * factor;
    if (scaled >= static_cast<double>(std::chrono::milliseconds::max().count())) {
        return std::chrono::milliseconds::max();
    }
    return std::chrono::milliseconds(std::llround(scaled));
}

std::mt19937 makeRng(const std::optional<std::uint32_t>& seed) {
    if (seed) {
        return std::mt19937{*seed};
    }
    return std::mt19937{std::random_device{}()};
}

} // namespace

ResourcePool::ResourcePool(PoolOptions options, const util::Clock& clock, repository::StatsStore* store)
    : options_(std::move(options))
    , clock_(clock)
    , store_(store)
    , rng_(makeRng(options_.seed)) {}

model::ResourceStats ResourcePool::defaultStats() const {
    model::ResourceStats stats;
    stats.cooldown = options_.defaultCooldown;
    return stats;
}

model::ResourceStats& ResourcePool::statsForLocked(const std::string& key) {
    return stats_.try_emplace(key, defaultStats()).first->second;
}

bool ResourcePool::pooledLocked(const std::string& key) const {
    return std::any_of(resources_.begin(), resources_.end(),
                       [&key](const model::Resource& candidate) { return candidate.key() == key; });
}

void ResourcePool::initialize(std::vector<model::Resource> resources) {
    repository::StatsMap persisted;
    if (store_) {
        try {
            persisted = store_->load();
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, std::string{"Cannot load resource stats, starting fresh: "} + ex.what());
        }
    }

    std::size_t upgraded = 0;
    for (auto& [key, entry] : persisted) {
        if (entry.cooldown < options_.defaultCooldown) {
            entry.cooldown = options_.defaultCooldown;
            ++upgraded;
        } else if (entry.cooldown > options_.maxCooldown) {
            entry.cooldown = options_.maxCooldown;
            ++upgraded;
        }
    }

    PendingWrite pending;
    {
        std::scoped_lock lock(mutex_);
        resources_ = std::move(resources);
        stats_ = std::move(persisted);
        for (const auto& resource : resources_) {
            statsForLocked(resource.key());
        }
        util::log(util::LogLevel::info,
                  "Resource pool initialised with " + std::to_string(resources_.size()) + " resources, " +
                      std::to_string(stats_.size()) + " stat records");
        pending = preparePersistLocked();
    }
    if (upgraded > 0) {
        util::log(util::LogLevel::info,
                  "Adjusted cooldown of " + std::to_string(upgraded) + " persisted records to the configured bounds");
    }
    released_.notify_all();
    writeThrough(std::move(pending));
}

std::size_t ResourcePool::initializeFromFile(const std::filesystem::path& path, std::string_view defaultScheme) {
    std::vector<model::Resource> resources;
    try {
        if (auto content = util::readTextFile(path)) {
            resources = model::parseResourceList(*content, defaultScheme);
            util::log(util::LogLevel::info,
                      "Loaded " + std::to_string(resources.size()) + " resources from " + path.string());
        } else {
            util::log(util::LogLevel::error, "Cannot read resource list " + path.string() + ", pool stays empty");
        }
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Failed to parse resource list " + path.string() + ": " + ex.what());
        resources.clear();
    }
    const auto count = resources.size();
    initialize(std::move(resources));
    return count;
}

std::optional<model::Resource> ResourcePool::acquire(Deadline deadline) {
    return acquireImpl({}, deadline);
}

std::optional<model::Resource> ResourcePool::acquireExcluding(const std::vector<std::string>& excludedKeys,
                                                              Deadline deadline) {
    return acquireImpl(excludedKeys, deadline);
}

std::optional<model::Resource> ResourcePool::acquireImpl(const std::vector<std::string>& excludedKeys,
                                                         Deadline deadline) {
    auto limit = std::chrono::steady_clock::now() + options_.maxAcquireWait;
    if (deadline && *deadline < limit) {
        limit = *deadline;
    }

    std::optional<model::Resource> selected;
    PendingWrite pending;
    {
        std::unique_lock lock(mutex_);
        for (;;) {
            const auto now = clock_.now();
            selected = selectLocked(excludedKeys, now);
            if (selected) {
                pending = preparePersistLocked();
                break;
            }
            if (options_.acquirePolicy == AcquirePolicy::immediate || resources_.empty()) {
                return std::nullopt;
            }

            const auto steadyNow = std::chrono::steady_clock::now();
            if (steadyNow >= limit) {
                util::log(util::LogLevel::debug, "Gave up waiting for a free resource");
                return std::nullopt;
            }
            auto wakeAt = limit;
            if (auto earliest = earliestAvailableLocked()) {
                auto untilFree = std::chrono::duration_cast<std::chrono::steady_clock::duration>(*earliest - now);
                wakeAt = std::min(wakeAt, steadyNow + std::max(untilFree, std::chrono::steady_clock::duration{
                                                                              std::chrono::milliseconds{1}}));
            }
            released_.wait_until(lock, wakeAt);
        }
    }
    writeThrough(std::move(pending));
    return selected;
}

std::optional<model::Resource> ResourcePool::selectLocked(const std::vector<std::string>& excludedKeys,
                                                          util::Clock::TimePoint now) {
    std::vector<std::size_t> available;
    std::vector<std::size_t> preferred;
    for (std::size_t i = 0; i < resources_.size(); ++i) {
        const auto key = resources_[i].key();
        if (!statsForLocked(key).available(now)) {
            continue;
        }
        available.push_back(i);
        if (std::find(excludedKeys.begin(), excludedKeys.end(), key) == excludedKeys.end()) {
            preferred.push_back(i);
        }
    }
    const auto& candidates = preferred.empty() ? available : preferred;
    if (candidates.empty()) {
        return std::nullopt;
    }

    // Weight by defaultCooldown / cooldown: a resource backed off once is
    // half as likely to be picked as a fresh one.
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (auto index : candidates) {
        const auto& entry = statsForLocked(resources_[index].key());
        const auto cooldown = std::max<std::int64_t>(1, entry.cooldown.count());
        weights.push_back(static_cast<double>(std::max<std::int64_t>(1, options_.defaultCooldown.count())) /
                          static_cast<double>(cooldown));
    }
    std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
    const auto& chosen = resources_[candidates[pick(rng_)]];

    auto& entry = statsForLocked(chosen.key());
    entry.lastUsedAt = now;
    entry.released = false;
    entry.useCount += 1;
    util::log(util::LogLevel::debug, "Reserved resource " + chosen.displayName() + " (use #" +
                                         std::to_string(entry.useCount) + ")");
    return chosen;
}

std::optional<util::Clock::TimePoint> ResourcePool::earliestAvailableLocked() const {
    std::optional<util::Clock::TimePoint> earliest;
    for (const auto& resource : resources_) {
        auto it = stats_.find(resource.key());
        if (it == stats_.end()) {
            continue;
        }
        const auto at = it->second.availableAt();
        if (!earliest || at < *earliest) {
            earliest = at;
        }
    }
    return earliest;
}

void ResourcePool::reportOutcome(const model::Resource& resource, model::ResourceReport report) {
    PendingWrite pending;
    {
        std::scoped_lock lock(mutex_);
        const auto key = resource.key();
        if (!pooledLocked(key)) {
            // Caller-supplied proxies carry their own credentials; never record them.
            util::log(util::LogLevel::debug, "Ignoring report for " + resource.displayName() + ", not in the pool");
            return;
        }
        const auto now = clock_.now();
        auto& entry = statsForLocked(key);
        switch (report) {
        case model::ResourceReport::success:
            entry.cooldown = options_.defaultCooldown;
            entry.lastUsedAt = now;
            entry.released = true;
            entry.successCount += 1;
            break;
        case model::ResourceReport::soft_failure:
            entry.cooldown = std::min(scaleCooldown(entry.cooldown, options_.backoffFactor), options_.maxCooldown);
            entry.lastUsedAt = now;
            entry.released = false;
            entry.failCount += 1;
            util::log(util::LogLevel::info, "Resource " + resource.displayName() + " backed off to " +
                                                std::to_string(entry.cooldown.count()) + " ms (failures: " +
                                                std::to_string(entry.failCount) + ")");
            break;
        }
        pending = preparePersistLocked();
    }
    released_.notify_all();
    writeThrough(std::move(pending));
}

void ResourcePool::release(const model::Resource& resource) {
    PendingWrite pending;
    {
        std::scoped_lock lock(mutex_);
        const auto key = resource.key();
        if (!pooledLocked(key)) {
            return;
        }
        auto& entry = statsForLocked(key);
        if (entry.released) {
            return;
        }
        entry.released = true;
        pending = preparePersistLocked();
    }
    util::log(util::LogLevel::debug, "Released unused reservation of " + resource.displayName());
    released_.notify_all();
    writeThrough(std::move(pending));
}

std::size_t ResourcePool::decay() {
    std::size_t changed = 0;
    PendingWrite pending;
    {
        std::scoped_lock lock(mutex_);
        const auto now = clock_.now();
        for (auto& [key, entry] : stats_) {
            if (now - entry.lastUsedAt <= options_.decayInterval) {
                continue;
            }
            bool touched = false;
            if (entry.failCount > 0) {
                entry.failCount -= 1;
                touched = true;
            }
            if (entry.cooldown > options_.defaultCooldown) {
                auto relaxed = std::chrono::milliseconds(
                    std::llround(static_cast<double>(entry.cooldown.count()) / options_.backoffFactor));
                entry.cooldown = std::max(relaxed, options_.defaultCooldown);
                touched = true;
            }
            if (touched) {
                ++changed;
            }
        }
        if (changed == 0) {
            return 0;
        }
        pending = preparePersistLocked();
    }
    util::log(util::LogLevel::debug, "Decay relaxed " + std::to_string(changed) + " idle resources");
    released_.notify_all();
    writeThrough(std::move(pending));
    return changed;
}

std::optional<std::string> ResourcePool::authHeaderFor(const model::Resource& resource) const {
    return model::authorizationHeader(resource);
}

std::vector<ResourceView> ResourcePool::snapshot() const {
    std::scoped_lock lock(mutex_);
    const auto now = clock_.now();
    std::vector<ResourceView> views;
    views.reserve(resources_.size());
    for (const auto& resource : resources_) {
        ResourceView view;
        view.resource = resource;
        if (auto it = stats_.find(resource.key()); it != stats_.end()) {
            view.stats = it->second;
        } else {
            view.stats = defaultStats();
        }
        view.available = view.stats.available(now);
        views.push_back(std::move(view));
    }
    return views;
}

std::optional<model::ResourceStats> ResourcePool::stats(const std::string& key) const {
    std::scoped_lock lock(mutex_);
    if (auto it = stats_.find(key); it != stats_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::size_t ResourcePool::size() const {
    std::scoped_lock lock(mutex_);
    return resources_.size();
}

ResourcePool::PendingWrite ResourcePool::preparePersistLocked() {
    PendingWrite pending;
    if (!store_) {
        return pending;
    }
    pending.stats = stats_;
    pending.generation = ++generation_;
    return pending;
}

void ResourcePool::writeThrough(PendingWrite pending) {
    if (!store_ || pending.generation == 0) {
        return;
    }
    std::scoped_lock lock(persistMutex_);
    if (pending.generation <= writtenGeneration_) {
        return;
    }
    try {
        store_->save(pending.stats);
        writtenGeneration_ = pending.generation;
        if (degraded_.exchange(false)) {
            util::log(util::LogLevel::info, "Resource stats persistence recovered");
        }
    } catch (const std::exception& ex) {
        if (!degraded_.exchange(true)) {
            util::log(util::LogLevel::warn,
                      std::string{"Cannot persist resource stats, continuing in memory: "} + ex.what());
        }
    }
}

} // namespace authrelay::pool
