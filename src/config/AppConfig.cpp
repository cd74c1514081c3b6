#include "authrelay/config/AppConfig.hpp"
#include "authrelay/util/JsonUtil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace authrelay::config {
namespace {

std::string toLower(std::string_view value) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

std::optional<std::int64_t> parseInteger(const std::string& text) {
    try {
        std::size_t consumed = 0;
        auto value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<double> parseNumber(const std::string& text) {
    try {
        std::size_t consumed = 0;
        auto value = std::stod(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<bool> parseFlag(const std::string& text) {
    auto lower = toLower(text);
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

void rejected(const char* name, const std::string& value) {
    util::log(util::LogLevel::warn, std::string{"Ignoring invalid value for "} + name + ": '" + value + "'");
}

void setMillis(std::chrono::milliseconds& target, std::optional<std::int64_t> value) {
    if (value && *value >= 0) {
        target = std::chrono::milliseconds(*value);
    }
}

} // namespace

std::optional<std::string> processEnv(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string(value);
    }
    return std::nullopt;
}

std::optional<pool::AcquirePolicy> parseAcquirePolicy(std::string_view name) {
    auto lower = toLower(name);
    if (lower == "immediate" || lower == "none") return pool::AcquirePolicy::immediate;
    if (lower == "block" || lower == "wait") return pool::AcquirePolicy::block;
    return std::nullopt;
}

std::optional<workflow::VindicationPolicy> parseVindicationPolicy(std::string_view name) {
    auto lower = toLower(name);
    if (lower == "report_success" || lower == "success") return workflow::VindicationPolicy::report_success;
    if (lower == "ignore" || lower == "none") return workflow::VindicationPolicy::ignore;
    return std::nullopt;
}

void applyJson(AppConfig& config, const boost::json::object& obj) {
    if (auto it = obj.if_contains("pool"); it && it->is_object()) {
        const auto& pool = it->as_object();
        setMillis(config.pool.defaultCooldown, util::getInt64(pool, "defaultCooldownMs"));
        setMillis(config.pool.maxCooldown, util::getInt64(pool, "maxCooldownMs"));
        setMillis(config.pool.decayInterval, util::getInt64(pool, "decayIntervalMs"));
        setMillis(config.pool.maxAcquireWait, util::getInt64(pool, "maxAcquireWaitMs"));
        setMillis(config.decayTick, util::getInt64(pool, "decayTickMs"));
        if (auto factor = util::getDouble(pool, "backoffFactor")) {
            config.pool.backoffFactor = *factor;
        }
        if (auto policy = util::getString(pool, "acquirePolicy")) {
            if (auto parsed = parseAcquirePolicy(*policy)) {
                config.pool.acquirePolicy = *parsed;
            } else {
                rejected("pool.acquirePolicy", *policy);
            }
        }
        if (auto file = util::getString(pool, "resourceFile")) config.resourceFile = *file;
        if (auto file = util::getString(pool, "statsFile")) config.statsFile = *file;
        if (auto scheme = util::getString(pool, "defaultScheme")) config.defaultScheme = *scheme;
        if (auto probe = util::getBool(pool, "probeOnStart")) config.probeOnStart = *probe;
    }

    if (auto it = obj.if_contains("retry"); it && it->is_object()) {
        const auto& retry = it->as_object();
        if (auto attempts = util::getInt64(retry, "maxAttempts")) {
            config.orchestrator.maxAttempts = static_cast<int>(*attempts);
        }
        setMillis(config.orchestrator.attemptTimeout, util::getInt64(retry, "attemptTimeoutMs"));
        if (auto policy = util::getString(retry, "vindication")) {
            if (auto parsed = parseVindicationPolicy(*policy)) {
                config.orchestrator.vindication = *parsed;
            } else {
                rejected("retry.vindication", *policy);
            }
        }
        if (auto direct = util::getBool(retry, "allowDirect")) config.orchestrator.allowDirect = *direct;
    }

    if (auto it = obj.if_contains("server"); it && it->is_object()) {
        const auto& server = it->as_object();
        if (auto host = util::getString(server, "host")) config.listenHost = *host;
        if (auto port = util::getInt64(server, "port"); port && *port > 0 && *port <= 65535) {
            config.listenPort = static_cast<std::uint16_t>(*port);
        }
        if (auto limit = util::getInt64(server, "maxConcurrent"); limit && *limit > 0) {
            config.maxConcurrent = static_cast<unsigned int>(*limit);
        }
        if (auto bytes = util::getInt64(server, "maxBodyBytes"); bytes && *bytes > 0) {
            config.serverLimits.maxBodyBytes = static_cast<std::size_t>(*bytes);
        }
        setMillis(config.serverLimits.ioTimeout, util::getInt64(server, "ioTimeoutMs"));
    }

    if (auto endpoint = util::getString(obj, "runnerEndpoint")) config.runnerEndpoint = *endpoint;
    if (auto level = util::getString(obj, "logLevel")) {
        if (auto parsed = util::parseLogLevel(*level)) {
            config.logLevel = *parsed;
        } else {
            rejected("logLevel", *level);
        }
    }
}

void applyEnvironment(AppConfig& config, const EnvLookup& env) {
    auto millis = [&env](const char* name, std::chrono::milliseconds& target) {
        if (auto value = env(name)) {
            auto parsed = parseInteger(*value);
            if (parsed && *parsed >= 0) {
                target = std::chrono::milliseconds(*parsed);
            } else {
                rejected(name, *value);
            }
        }
    };
    auto flag = [&env](const char* name, bool& target) {
        if (auto value = env(name)) {
            if (auto parsed = parseFlag(*value)) {
                target = *parsed;
            } else {
                rejected(name, *value);
            }
        }
    };

    millis("AUTHRELAY_DEFAULT_COOLDOWN_MS", config.pool.defaultCooldown);
    millis("AUTHRELAY_MAX_COOLDOWN_MS", config.pool.maxCooldown);
    millis("AUTHRELAY_DECAY_INTERVAL_MS", config.pool.decayInterval);
    millis("AUTHRELAY_MAX_ACQUIRE_WAIT_MS", config.pool.maxAcquireWait);
    millis("AUTHRELAY_DECAY_TICK_MS", config.decayTick);
    millis("AUTHRELAY_ATTEMPT_TIMEOUT_MS", config.orchestrator.attemptTimeout);
    millis("AUTHRELAY_IO_TIMEOUT_MS", config.serverLimits.ioTimeout);
    flag("AUTHRELAY_ALLOW_DIRECT", config.orchestrator.allowDirect);
    flag("AUTHRELAY_PROBE_ON_START", config.probeOnStart);

    if (auto value = env("AUTHRELAY_BACKOFF_FACTOR")) {
        if (auto parsed = parseNumber(*value)) {
            config.pool.backoffFactor = *parsed;
        } else {
            rejected("AUTHRELAY_BACKOFF_FACTOR", *value);
        }
    }
    if (auto value = env("AUTHRELAY_MAX_ATTEMPTS")) {
        if (auto parsed = parseInteger(*value)) {
            config.orchestrator.maxAttempts = static_cast<int>(*parsed);
        } else {
            rejected("AUTHRELAY_MAX_ATTEMPTS", *value);
        }
    }
    if (auto value = env("AUTHRELAY_ACQUIRE_POLICY")) {
        if (auto parsed = parseAcquirePolicy(*value)) {
            config.pool.acquirePolicy = *parsed;
        } else {
            rejected("AUTHRELAY_ACQUIRE_POLICY", *value);
        }
    }
    if (auto value = env("AUTHRELAY_VINDICATION")) {
        if (auto parsed = parseVindicationPolicy(*value)) {
            config.orchestrator.vindication = *parsed;
        } else {
            rejected("AUTHRELAY_VINDICATION", *value);
        }
    }
    if (auto value = env("AUTHRELAY_RESOURCE_FILE")) config.resourceFile = *value;
    if (auto value = env("AUTHRELAY_STATS_FILE")) config.statsFile = *value;
    if (auto value = env("AUTHRELAY_DEFAULT_SCHEME")) config.defaultScheme = toLower(*value);
    if (auto value = env("AUTHRELAY_LISTEN_HOST")) config.listenHost = *value;
    if (auto value = env("AUTHRELAY_LISTEN_PORT")) {
        auto parsed = parseInteger(*value);
        if (parsed && *parsed > 0 && *parsed <= 65535) {
            config.listenPort = static_cast<std::uint16_t>(*parsed);
        } else {
            rejected("AUTHRELAY_LISTEN_PORT", *value);
        }
    }
    if (auto value = env("AUTHRELAY_MAX_CONCURRENT")) {
        auto parsed = parseInteger(*value);
        if (parsed && *parsed > 0) {
            config.maxConcurrent = static_cast<unsigned int>(*parsed);
        } else {
            rejected("AUTHRELAY_MAX_CONCURRENT", *value);
        }
    }
    if (auto value = env("AUTHRELAY_RUNNER_ENDPOINT")) config.runnerEndpoint = *value;
    if (auto value = env("AUTHRELAY_LOG_LEVEL")) {
        if (auto parsed = util::parseLogLevel(*value)) {
            config.logLevel = *parsed;
        } else {
            rejected("AUTHRELAY_LOG_LEVEL", *value);
        }
    }
}

void normalize(AppConfig& config) {
    const AppConfig defaults;
    if (config.pool.defaultCooldown.count() <= 0) {
        util::log(util::LogLevel::warn, "Default cooldown must be positive, using the built-in default");
        config.pool.defaultCooldown = defaults.pool.defaultCooldown;
    }
    if (config.pool.maxCooldown < config.pool.defaultCooldown) {
        util::log(util::LogLevel::warn, "Max cooldown below default cooldown, raising it to the default");
        config.pool.maxCooldown = config.pool.defaultCooldown;
    }
    if (!(config.pool.backoffFactor >= 1.0)) {
        util::log(util::LogLevel::warn, "Backoff factor below 1, using " + std::to_string(defaults.pool.backoffFactor));
        config.pool.backoffFactor = defaults.pool.backoffFactor;
    }
    if (config.orchestrator.maxAttempts < 1) {
        util::log(util::LogLevel::warn, "Max attempts below 1, using " + std::to_string(defaults.orchestrator.maxAttempts));
        config.orchestrator.maxAttempts = defaults.orchestrator.maxAttempts;
    }
    if (config.orchestrator.attemptTimeout.count() <= 0) {
        util::log(util::LogLevel::warn, "Attempt timeout must be positive, using the built-in default");
        config.orchestrator.attemptTimeout = defaults.orchestrator.attemptTimeout;
    }
    if (config.serverLimits.ioTimeout.count() <= 0) {
        config.serverLimits.ioTimeout = defaults.serverLimits.ioTimeout;
    }
    if (config.decayTick.count() <= 0) {
        config.decayTick = defaults.decayTick;
    }
    if (config.defaultScheme.empty()) {
        config.defaultScheme = defaults.defaultScheme;
    }
}

AppConfig loadAppConfig(const std::filesystem::path& path, const EnvLookup& env) {
    AppConfig config;
    if (auto content = util::readTextFile(path); content && !content->empty()) {
        try {
            auto json = util::parseJson(*content);
            if (json.is_object()) {
                applyJson(config, json.as_object());
            } else {
                util::log(util::LogLevel::warn, "Config " + path.string() + " is not a JSON object, ignored");
            }
        } catch (const std::exception& ex) {
            util::log(util::LogLevel::warn, "Failed to parse config " + path.string() + ": " + ex.what());
        }
    }
    applyEnvironment(config, env);
    normalize(config);
    return config;
}

} // namespace authrelay::config
