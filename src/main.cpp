#include "authrelay/config/AppConfig.hpp"
#include "authrelay/controller/LoginController.hpp"
#include "authrelay/pool/ResourcePool.hpp"
#include "authrelay/repository/StatsStore.hpp"
#include "authrelay/server/HttpServer.hpp"
#include "authrelay/server/Router.hpp"
#include "authrelay/service/AdmissionGate.hpp"
#include "authrelay/service/LoginService.hpp"
#include "authrelay/service/PoolMaintenance.hpp"
#include "authrelay/session/RemoteSessionRunner.hpp"
#include "authrelay/util/Clock.hpp"
#include "authrelay/util/Logging.hpp"
#include "authrelay/workflow/RetryOrchestrator.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>

int main(int argc, char** argv) {
    using namespace authrelay;

    std::string configPath = "data/authrelay.json";
    if (argc > 1) {
        configPath = argv[1];
    } else if (auto fromEnv = config::processEnv("AUTHRELAY_CONFIG")) {
        configPath = *fromEnv;
    }

    auto appConfig = config::loadAppConfig(configPath);
    util::initLogging(appConfig.logLevel);

    std::unique_ptr<session::RemoteSessionRunner> runner;
    try {
        runner = std::make_unique<session::RemoteSessionRunner>(appConfig.runnerEndpoint);
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Invalid session runner endpoint: "} + ex.what());
        return EXIT_FAILURE;
    }

    util::SystemClock clock;
    repository::JsonFileStatsStore statsStore{appConfig.statsFile};
    pool::ResourcePool resourcePool{appConfig.pool, clock, &statsStore};
    resourcePool.initializeFromFile(appConfig.resourceFile, appConfig.defaultScheme);

    boost::asio::io_context io;
    boost::asio::thread_pool attemptPool(std::max(2u, appConfig.maxConcurrent * 2));
    // The admission gate caps running logins at maxConcurrent; the spare
    // threads keep rejections and validation errors from queueing.
    boost::asio::thread_pool loginPool(appConfig.maxConcurrent + 2);

    workflow::RetryOrchestrator orchestrator{resourcePool, *runner, attemptPool, appConfig.orchestrator};
    orchestrator.setAttemptObserver([](const model::Attempt& attempt) {
        util::log(util::LogLevel::debug,
                  "attempt " + attempt.sessionId + " " + std::string(model::toString(attempt.outcome)) + " via " +
                      (attempt.resource ? attempt.resource->displayName() : std::string{"direct"}) + " took " +
                      std::to_string(attempt.duration.count()) + " ms");
    });

    service::AdmissionGate gate{appConfig.maxConcurrent};
    service::LoginService loginService{orchestrator, gate, appConfig.defaultScheme};

    service::PoolMaintenance maintenance{io, resourcePool, appConfig.decayTick};
    if (appConfig.probeOnStart) {
        maintenance.probeAll();
    }
    maintenance.start();

    auto router = std::make_shared<server::Router>();
    controller::LoginController loginController{loginService, resourcePool, loginPool};
    loginController.registerRoutes(*router);

    auto server = std::make_shared<server::HttpServer>(io, router, appConfig.listenHost, appConfig.listenPort,
                                                       appConfig.serverLimits);
    try {
        server->start();
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, "Cannot listen on " + appConfig.listenHost + ":" +
                                             std::to_string(appConfig.listenPort) + ": " + ex.what());
        return EXIT_FAILURE;
    }

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) {
            return;
        }
        util::log(util::LogLevel::info, "Shutting down");
        maintenance.stop();
        server->stop();
        io.stop();
    });

    unsigned int ioThreadsCount = std::max(2u, std::thread::hardware_concurrency());
    std::vector<std::thread> ioThreads;
    ioThreads.reserve(ioThreadsCount - 1);
    for (unsigned int i = 0; i < ioThreadsCount - 1; ++i) {
        ioThreads.emplace_back([&io]() { io.run(); });
    }

    util::log(util::LogLevel::info, "authrelay listening on " + appConfig.listenHost + ":" +
                                        std::to_string(appConfig.listenPort) + " with " +
                                        std::to_string(resourcePool.size()) + " resources");
    io.run();

    for (auto& thread : ioThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    loginPool.join();
    attemptPool.join();
    return 0;
}
