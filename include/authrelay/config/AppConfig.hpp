#pragma once

#include "authrelay/pool/ResourcePool.hpp"
#include "authrelay/server/HttpServer.hpp"
#include "authrelay/util/Logging.hpp"
#include "authrelay/workflow/RetryOrchestrator.hpp"

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace authrelay::config {

struct AppConfig {
    pool::PoolOptions pool;
    workflow::OrchestratorOptions orchestrator;

    std::filesystem::path resourceFile{"proxies.txt"};
    std::filesystem::path statsFile{"proxy_data/proxyStats.json"};
    std::string defaultScheme{"http"};

    std::chrono::milliseconds decayTick{std::chrono::minutes{1}};
    bool probeOnStart{false};

    std::string listenHost{"0.0.0.0"};
    std::uint16_t listenPort{5090};
    unsigned int maxConcurrent{5};
    server::ServerLimits serverLimits;
    std::string runnerEndpoint{"http://127.0.0.1:5091/session"};

    util::LogLevel logLevel{util::LogLevel::info};
};

using EnvLookup = std::function<std::optional<std::string>(const char*)>;

// Reads AUTHRELAY_* variables from the process environment.
std::optional<std::string> processEnv(const char* name);

void applyJson(AppConfig& config, const boost::json::object& obj);
void applyEnvironment(AppConfig& config, const EnvLookup& env);

// Clamps inconsistent values back into range, logging each correction.
void normalize(AppConfig& config);

// Defaults, then the JSON file (if present and valid), then the
// environment. Never throws; problems are logged and the default kept.
AppConfig loadAppConfig(const std::filesystem::path& path, const EnvLookup& env = processEnv);

std::optional<pool::AcquirePolicy> parseAcquirePolicy(std::string_view name);
std::optional<workflow::VindicationPolicy> parseVindicationPolicy(std::string_view name);

} // namespace authrelay::config
