#pragma once

#include "authrelay/model/ResourceStats.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

namespace authrelay::repository {

using StatsMap = std::map<std::string, model::ResourceStats>;

class StatsStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable record store keyed by Resource::key(). Both operations may throw
// StatsStoreError.
class StatsStore {
public:
    virtual ~StatsStore() = default;

    virtual StatsMap load() = 0;
    virtual void save(const StatsMap& stats) = 0;
};

// JSON document on disk; every save replaces the file through a rename so
// readers never observe a half-written document.
class JsonFileStatsStore : public StatsStore {
public:
    explicit JsonFileStatsStore(std::filesystem::path path);

    StatsMap load() override;
    void save(const StatsMap& stats) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::mutex fileMutex_;
};

std::string serializeStats(const StatsMap& stats);
StatsMap deserializeStats(const std::string& payload);

} // namespace authrelay::repository
