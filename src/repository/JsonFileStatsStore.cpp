#include "authrelay/repository/StatsStore.hpp"
#include "authrelay/util/Clock.hpp"
#include "authrelay/util/JsonUtil.hpp"

#include <boost/json.hpp>

#include <fstream>
#include <system_error>

namespace authrelay::repository {
namespace {

std::uint64_t readCounter(const boost::json::object& obj, const char* key) {
    auto value = util::getInt64(obj, key);
    if (!value || *value < 0) {
        return 0;
    }
    return static_cast<std::uint64_t>(*value);
}

} // namespace

std::string serializeStats(const StatsMap& stats) {
    boost::json::object document;
    for (const auto& [key, entry] : stats) {
        boost::json::object record;
        record["cooldownMs"] = static_cast<std::int64_t>(entry.cooldown.count());
        record["successCount"] = entry.successCount;
        record["failCount"] = entry.failCount;
        record["useCount"] = entry.useCount;
        record["lastUsedAt"] = util::toEpochMillis(entry.lastUsedAt);
        record["released"] = entry.released;
        document[key] = std::move(record);
    }
    return util::stringifyJson(document);
}

StatsMap deserializeStats(const std::string& payload) {
    boost::json::value json;
    try {
        json = util::parseJson(payload);
    } catch (const std::exception& ex) {
        throw StatsStoreError(std::string{"stats document is not valid JSON: "} + ex.what());
    }
    if (!json.is_object()) {
        throw StatsStoreError("stats document must be a JSON object");
    }

    StatsMap stats;
    for (const auto& [key, value] : json.as_object()) {
        if (!value.is_object()) {
            continue;
        }
        const auto& obj = value.as_object();
        model::ResourceStats entry;
        entry.cooldown = std::chrono::milliseconds(util::getInt64(obj, "cooldownMs").value_or(0));
        entry.successCount = readCounter(obj, "successCount");
        entry.failCount = readCounter(obj, "failCount");
        entry.useCount = readCounter(obj, "useCount");
        entry.lastUsedAt = util::fromEpochMillis(util::getInt64(obj, "lastUsedAt").value_or(0));
        entry.released = util::getBool(obj, "released").value_or(false);
        stats.emplace(std::string(key), entry);
    }
    return stats;
}

JsonFileStatsStore::JsonFileStatsStore(std::filesystem::path path)
    : path_(std::move(path)) {}

StatsMap JsonFileStatsStore::load() {
    std::scoped_lock lock(fileMutex_);
    auto content = util::readTextFile(path_);
    if (!content) {
        return {};
    }
    if (content->empty()) {
        return {};
    }
    return deserializeStats(*content);
}

void JsonFileStatsStore::save(const StatsMap& stats) {
    const auto payload = serializeStats(stats);

    std::scoped_lock lock(fileMutex_);
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw StatsStoreError("cannot create " + path_.parent_path().string() + ": " + ec.message());
        }
    }

    auto tempPath = path_;
    tempPath += ".tmp";
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw StatsStoreError("cannot open " + tempPath.string() + " for writing");
        }
        ofs << payload;
        ofs.flush();
        if (!ofs) {
            throw StatsStoreError("short write to " + tempPath.string());
        }
    }

    std::filesystem::rename(tempPath, path_, ec);
    if (ec) {
        const auto reason = ec.message();
        std::filesystem::remove(tempPath, ec);
        throw StatsStoreError("cannot replace " + path_.string() + ": " + reason);
    }
}

} // namespace authrelay::repository
