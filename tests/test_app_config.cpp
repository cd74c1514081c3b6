/// @file test_app_config.cpp
/// Layered configuration: defaults, JSON file, environment.

#include "authrelay/config/AppConfig.hpp"
#include "authrelay/util/JsonUtil.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>

using namespace std::chrono_literals;
using namespace authrelay::config;

namespace {

EnvLookup fakeEnv(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const char* name) -> std::optional<std::string> {
        if (auto it = values.find(name); it != values.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

const EnvLookup emptyEnv = fakeEnv({});

std::filesystem::path writeConfig(const std::string& content) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto path = std::filesystem::temp_directory_path() / "authrelay_tests" / (std::string(info->name()) + ".json");
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::trunc);
    ofs << content;
    return path;
}

} // namespace

TEST(AppConfig, DefaultsWithoutFileOrEnvironment) {
    auto config = loadAppConfig("/nonexistent/authrelay.json", emptyEnv);
    EXPECT_EQ(config.pool.defaultCooldown, 600000ms);
    EXPECT_EQ(config.pool.maxCooldown, 43200000ms);
    EXPECT_DOUBLE_EQ(config.pool.backoffFactor, 2.0);
    EXPECT_EQ(config.pool.decayInterval, 1800000ms);
    EXPECT_EQ(config.pool.acquirePolicy, authrelay::pool::AcquirePolicy::immediate);
    EXPECT_EQ(config.orchestrator.maxAttempts, 3);
    EXPECT_EQ(config.orchestrator.attemptTimeout, 30000ms);
    EXPECT_EQ(config.orchestrator.vindication, authrelay::workflow::VindicationPolicy::report_success);
    EXPECT_FALSE(config.orchestrator.allowDirect);
    EXPECT_EQ(config.listenPort, 5090);
    EXPECT_EQ(config.maxConcurrent, 5u);
    EXPECT_EQ(config.serverLimits.ioTimeout, 30000ms);
    EXPECT_EQ(config.resourceFile, std::filesystem::path("proxies.txt"));
    EXPECT_EQ(config.statsFile, std::filesystem::path("proxy_data/proxyStats.json"));
}

TEST(AppConfig, JsonSectionsOverrideDefaults) {
    auto path = writeConfig(R"({
        "pool": {
            "defaultCooldownMs": 1000,
            "maxCooldownMs": 8000,
            "backoffFactor": 3,
            "acquirePolicy": "block",
            "resourceFile": "/etc/authrelay/proxies.txt",
            "probeOnStart": true
        },
        "retry": {"maxAttempts": 5, "attemptTimeoutMs": 15000, "vindication": "ignore", "allowDirect": true},
        "server": {"host": "127.0.0.1", "port": 8081, "maxConcurrent": 12, "maxBodyBytes": 1024, "ioTimeoutMs": 5000},
        "runnerEndpoint": "http://worker:7000/run",
        "logLevel": "debug"
    })");

    auto config = loadAppConfig(path, emptyEnv);

    EXPECT_EQ(config.pool.defaultCooldown, 1000ms);
    EXPECT_EQ(config.pool.maxCooldown, 8000ms);
    EXPECT_DOUBLE_EQ(config.pool.backoffFactor, 3.0);
    EXPECT_EQ(config.pool.acquirePolicy, authrelay::pool::AcquirePolicy::block);
    EXPECT_EQ(config.resourceFile, std::filesystem::path("/etc/authrelay/proxies.txt"));
    EXPECT_TRUE(config.probeOnStart);
    EXPECT_EQ(config.orchestrator.maxAttempts, 5);
    EXPECT_EQ(config.orchestrator.attemptTimeout, 15000ms);
    EXPECT_EQ(config.orchestrator.vindication, authrelay::workflow::VindicationPolicy::ignore);
    EXPECT_TRUE(config.orchestrator.allowDirect);
    EXPECT_EQ(config.listenHost, "127.0.0.1");
    EXPECT_EQ(config.listenPort, 8081);
    EXPECT_EQ(config.maxConcurrent, 12u);
    EXPECT_EQ(config.serverLimits.maxBodyBytes, 1024u);
    EXPECT_EQ(config.serverLimits.ioTimeout, 5000ms);
    EXPECT_EQ(config.runnerEndpoint, "http://worker:7000/run");
    EXPECT_EQ(config.logLevel, authrelay::util::LogLevel::debug);
}

TEST(AppConfig, EnvironmentWinsOverFile) {
    auto path = writeConfig(R"({"retry": {"maxAttempts": 5}, "server": {"port": 8081}})");
    auto config = loadAppConfig(path, fakeEnv({{"AUTHRELAY_MAX_ATTEMPTS", "2"},
                                               {"AUTHRELAY_LISTEN_PORT", "9000"},
                                               {"AUTHRELAY_DEFAULT_COOLDOWN_MS", "250"},
                                               {"AUTHRELAY_ALLOW_DIRECT", "yes"},
                                               {"AUTHRELAY_ACQUIRE_POLICY", "wait"}}));
    EXPECT_EQ(config.orchestrator.maxAttempts, 2);
    EXPECT_EQ(config.listenPort, 9000);
    EXPECT_EQ(config.pool.defaultCooldown, 250ms);
    EXPECT_TRUE(config.orchestrator.allowDirect);
    EXPECT_EQ(config.pool.acquirePolicy, authrelay::pool::AcquirePolicy::block);
}

TEST(AppConfig, InvalidEnvironmentValuesAreIgnored) {
    auto config = loadAppConfig("/nonexistent/authrelay.json",
                                fakeEnv({{"AUTHRELAY_MAX_ATTEMPTS", "three"},
                                         {"AUTHRELAY_LISTEN_PORT", "70000"},
                                         {"AUTHRELAY_BACKOFF_FACTOR", "fast"},
                                         {"AUTHRELAY_VINDICATION", "maybe"}}));
    EXPECT_EQ(config.orchestrator.maxAttempts, 3);
    EXPECT_EQ(config.listenPort, 5090);
    EXPECT_DOUBLE_EQ(config.pool.backoffFactor, 2.0);
    EXPECT_EQ(config.orchestrator.vindication, authrelay::workflow::VindicationPolicy::report_success);
}

TEST(AppConfig, MalformedFileFallsBackToDefaults) {
    auto path = writeConfig("{ this is not json");
    AppConfig config;
    EXPECT_NO_THROW(config = loadAppConfig(path, emptyEnv));
    EXPECT_EQ(config.orchestrator.maxAttempts, 3);
}

TEST(AppConfig, NormalizeRepairsInconsistentValues) {
    AppConfig config;
    config.pool.defaultCooldown = 5000ms;
    config.pool.maxCooldown = 1000ms;
    config.pool.backoffFactor = 0.5;
    config.orchestrator.maxAttempts = 0;
    config.orchestrator.attemptTimeout = 0ms;

    normalize(config);

    EXPECT_EQ(config.pool.maxCooldown, 5000ms);
    EXPECT_DOUBLE_EQ(config.pool.backoffFactor, 2.0);
    EXPECT_EQ(config.orchestrator.maxAttempts, 3);
    EXPECT_EQ(config.orchestrator.attemptTimeout, 30000ms);
}

TEST(AppConfig, PolicyNames) {
    EXPECT_EQ(parseAcquirePolicy("IMMEDIATE").value(), authrelay::pool::AcquirePolicy::immediate);
    EXPECT_EQ(parseAcquirePolicy("block").value(), authrelay::pool::AcquirePolicy::block);
    EXPECT_FALSE(parseAcquirePolicy("sometimes").has_value());
    EXPECT_EQ(parseVindicationPolicy("report_success").value(), authrelay::workflow::VindicationPolicy::report_success);
    EXPECT_EQ(parseVindicationPolicy("none").value(), authrelay::workflow::VindicationPolicy::ignore);
    EXPECT_FALSE(parseVindicationPolicy("partial").has_value());
}
