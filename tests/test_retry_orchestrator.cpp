/// @file test_retry_orchestrator.cpp
/// Retry loop behaviour against a scripted session runner.

#include "TestSupport.hpp"

#include "authrelay/workflow/RetryOrchestrator.hpp"

#include <gtest/gtest.h>

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <thread>

using namespace std::chrono_literals;
using authrelay::model::Credentials;
using authrelay::model::Resource;
using authrelay::model::SessionOutcome;
using authrelay::model::TerminalStatus;
using authrelay::pool::PoolOptions;
using authrelay::pool::ResourcePool;
using authrelay::testing::ManualClock;
using authrelay::testing::MemoryStatsStore;
using authrelay::testing::ScriptedRunner;
using authrelay::testing::ScriptedStep;
using authrelay::workflow::OrchestratorOptions;
using authrelay::workflow::RetryOrchestrator;
using authrelay::workflow::VindicationPolicy;

namespace {

Resource makeResource(const std::string& host) {
    Resource resource;
    resource.scheme = "http";
    resource.host = host;
    resource.port = 8080;
    return resource;
}

std::vector<Resource> makeResources(int count) {
    std::vector<Resource> resources;
    for (int i = 1; i <= count; ++i) {
        resources.push_back(makeResource("r" + std::to_string(i) + ".example.com"));
    }
    return resources;
}

PoolOptions poolOptions() {
    PoolOptions options;
    options.defaultCooldown = 1000ms;
    options.maxCooldown = 8000ms;
    options.seed = 7;
    return options;
}

// Member order matters: the worker pool is joined before the runner and
// the resource pool it references go away.
struct Harness {
    Harness(std::vector<ScriptedStep> steps,
            std::vector<Resource> resources,
            OrchestratorOptions options = {},
            std::size_t workerThreads = 2)
        : pool(poolOptions(), clock, &store)
        , runner(std::move(steps))
        , workers(workerThreads)
        , orchestrator(pool, runner, workers, options) {
        pool.initialize(std::move(resources));
    }

    authrelay::model::TerminalOutcome run(const std::optional<Resource>& preferred = std::nullopt,
                                          RetryOrchestrator::Deadline deadline = std::nullopt) {
        return orchestrator.runWithRetry("https://target.example.com/login", Credentials{"alice", "hunter2"},
                                         preferred, deadline);
    }

    ManualClock clock;
    MemoryStatsStore store;
    ResourcePool pool;
    ScriptedRunner runner;
    boost::asio::thread_pool workers;
    RetryOrchestrator orchestrator;
};

} // namespace

TEST(RetryOrchestrator, DefenseBlockThenSuccessOnAnotherResource) {
    Harness harness({{SessionOutcome::target_defense_block}, {SessionOutcome::success, "code-123"}},
                    makeResources(2));

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::success);
    ASSERT_EQ(outcome.attemptCount(), 2u);
    ASSERT_TRUE(outcome.token.has_value());
    EXPECT_EQ(*outcome.token, "code-123");

    const auto& first = outcome.attempts[0].resource;
    const auto& second = outcome.attempts[1].resource;
    ASSERT_TRUE(first && second);
    EXPECT_NE(first->key(), second->key());
    EXPECT_EQ(harness.pool.stats(first->key())->failCount, 1u);
    EXPECT_EQ(harness.pool.stats(second->key())->successCount, 1u);
    ASSERT_NE(outcome.lastResource(), nullptr);
    EXPECT_EQ(*outcome.lastResource(), *second);
}

TEST(RetryOrchestrator, InvalidCredentialsStopImmediatelyAndVindicate) {
    Harness harness({{SessionOutcome::credential_invalid}}, makeResources(3));

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::credential_rejected);
    ASSERT_EQ(outcome.attemptCount(), 1u);
    EXPECT_FALSE(outcome.token.has_value());
    const auto& used = outcome.attempts[0].resource;
    ASSERT_TRUE(used.has_value());
    EXPECT_EQ(harness.pool.stats(used->key())->successCount, 1u);
    EXPECT_EQ(harness.pool.stats(used->key())->failCount, 0u);
    EXPECT_EQ(harness.runner.requests().size(), 1u);
}

TEST(RetryOrchestrator, RepeatedTimeoutsStopAtAttemptLimit) {
    OrchestratorOptions options;
    options.maxAttempts = 3;
    Harness harness({{SessionOutcome::navigation_timeout}}, makeResources(5), options);

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::resource_unresponsive);
    EXPECT_EQ(outcome.attemptCount(), 3u);
    EXPECT_EQ(harness.runner.requests().size(), 3u);
    ASSERT_TRUE(outcome.lastOutcome.has_value());
    EXPECT_EQ(*outcome.lastOutcome, SessionOutcome::navigation_timeout);
}

TEST(RetryOrchestrator, AccountBannedIsTerminal) {
    Harness harness({{SessionOutcome::account_banned}}, makeResources(2));
    auto outcome = harness.run();
    EXPECT_EQ(outcome.status, TerminalStatus::target_rejected_by_self);
    EXPECT_EQ(outcome.attemptCount(), 1u);
}

TEST(RetryOrchestrator, UnclassifiedFailureIsNotRetried) {
    Harness harness({{SessionOutcome::unclassified_failure}}, makeResources(2));
    auto outcome = harness.run();
    EXPECT_EQ(outcome.status, TerminalStatus::unclassified_failure);
    ASSERT_EQ(outcome.attemptCount(), 1u);
    EXPECT_EQ(harness.pool.stats(outcome.attempts[0].resource->key())->failCount, 1u);
}

TEST(RetryOrchestrator, EmptyPoolIsExhausted) {
    Harness harness({{SessionOutcome::success}}, {});
    auto outcome = harness.run();
    EXPECT_EQ(outcome.status, TerminalStatus::pool_exhausted);
    EXPECT_EQ(outcome.attemptCount(), 0u);
    EXPECT_TRUE(harness.runner.requests().empty());
}

TEST(RetryOrchestrator, ExhaustionMidSessionKeepsEarlierAttempts) {
    Harness harness({{SessionOutcome::no_response}}, makeResources(1));
    auto outcome = harness.run();
    EXPECT_EQ(outcome.status, TerminalStatus::pool_exhausted);
    EXPECT_EQ(outcome.attemptCount(), 1u);
}

TEST(RetryOrchestrator, DirectPathWhenAllowed) {
    OrchestratorOptions options;
    options.allowDirect = true;
    Harness harness({{SessionOutcome::success, "direct-code"}}, {}, options);

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::success);
    ASSERT_EQ(outcome.attemptCount(), 1u);
    EXPECT_FALSE(outcome.attempts[0].resource.has_value());
    auto requests = harness.runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_FALSE(requests[0].resource.has_value());
    EXPECT_FALSE(requests[0].proxyAuthorization.has_value());
}

TEST(RetryOrchestrator, PreferredResourceCarriesFirstAttempt) {
    Harness harness({{SessionOutcome::success, "tok"}}, makeResources(3));
    Resource preferred = makeResource("caller.example.com");
    preferred.username = "user";
    preferred.password = "pass";

    auto outcome = harness.run(preferred);

    EXPECT_EQ(outcome.status, TerminalStatus::success);
    auto requests = harness.runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_TRUE(requests[0].resource.has_value());
    EXPECT_EQ(*requests[0].resource, preferred);
    ASSERT_TRUE(requests[0].proxyAuthorization.has_value());
    EXPECT_EQ(*requests[0].proxyAuthorization, "Basic dXNlcjpwYXNz");
    EXPECT_FALSE(harness.pool.stats(preferred.key()).has_value());
    EXPECT_EQ(harness.store.snapshot().count(preferred.key()), 0u);
}

TEST(RetryOrchestrator, RetryAfterPreferredResourceDrawsFromPool) {
    Harness harness({{SessionOutcome::target_defense_block}, {SessionOutcome::success}}, makeResources(1));
    const auto preferred = makeResource("caller.example.com");

    auto outcome = harness.run(preferred);

    ASSERT_EQ(outcome.attemptCount(), 2u);
    EXPECT_EQ(*outcome.attempts[0].resource, preferred);
    EXPECT_EQ(outcome.attempts[1].resource->host, "r1.example.com");
}

TEST(RetryOrchestrator, RequestCarriesSessionDetails) {
    OrchestratorOptions options;
    options.attemptTimeout = 2s;
    Harness harness({{SessionOutcome::success}}, makeResources(1), options);

    harness.run();

    auto requests = harness.runner.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].targetUrl, "https://target.example.com/login");
    EXPECT_EQ(requests[0].credentials.username, "alice");
    EXPECT_EQ(requests[0].credentials.password, "hunter2");
    EXPECT_EQ(requests[0].timeout, 2s);
    EXPECT_EQ(requests[0].sessionId.size(), 36u);
}

TEST(RetryOrchestrator, EachAttemptGetsFreshSessionId) {
    Harness harness({{SessionOutcome::no_response}, {SessionOutcome::success}}, makeResources(2));
    harness.run();
    auto requests = harness.runner.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_NE(requests[0].sessionId, requests[1].sessionId);
}

TEST(RetryOrchestrator, PassedDeadlineStopsBeforeFirstAttempt) {
    Harness harness({{SessionOutcome::success}}, makeResources(2));
    auto outcome = harness.run(std::nullopt, std::chrono::steady_clock::now() - 1ms);
    EXPECT_EQ(outcome.status, TerminalStatus::deadline_exceeded);
    EXPECT_EQ(outcome.attemptCount(), 0u);
    EXPECT_TRUE(harness.runner.requests().empty());
}

TEST(RetryOrchestrator, HungRunnerTimesOutAsNavigationTimeout) {
    OrchestratorOptions options;
    options.maxAttempts = 1;
    options.attemptTimeout = 50ms;
    Harness harness({{SessionOutcome::success, "late", 400ms}}, makeResources(1), options);

    const auto started = std::chrono::steady_clock::now();
    auto outcome = harness.run();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_LT(elapsed, 350ms);
    EXPECT_EQ(outcome.status, TerminalStatus::resource_unresponsive);
    ASSERT_TRUE(outcome.lastOutcome.has_value());
    EXPECT_EQ(*outcome.lastOutcome, SessionOutcome::navigation_timeout);
    EXPECT_FALSE(outcome.token.has_value());
    EXPECT_EQ(harness.pool.stats(outcome.attempts[0].resource->key())->failCount, 1u);
}

TEST(RetryOrchestrator, AttemptQueuedPastTimeoutIsWithdrawn) {
    OrchestratorOptions options;
    options.maxAttempts = 2;
    options.attemptTimeout = 100ms;
    Harness harness({{SessionOutcome::success, "late", 300ms}}, makeResources(2), options, 1);

    auto outcome = harness.run();

    ASSERT_EQ(outcome.attemptCount(), 2u);
    EXPECT_EQ(outcome.status, TerminalStatus::resource_unresponsive);
    EXPECT_EQ(outcome.attempts[0].outcome, SessionOutcome::navigation_timeout);
    EXPECT_EQ(outcome.attempts[1].outcome, SessionOutcome::navigation_timeout);
    EXPECT_EQ(harness.runner.requests().size(), 1u);

    const auto inFlightKey = outcome.attempts[0].resource->key();
    const auto queuedKey = outcome.attempts[1].resource->key();
    ASSERT_NE(inFlightKey, queuedKey);
    EXPECT_EQ(harness.pool.stats(inFlightKey)->failCount, 1u);
    EXPECT_EQ(harness.pool.stats(queuedKey)->failCount, 0u);
    EXPECT_TRUE(harness.pool.stats(queuedKey)->available(harness.clock.now()));

    // The single worker frees up once the first runner call returns; the
    // withdrawn attempt must not reach the runner afterwards.
    std::this_thread::sleep_for(500ms);
    EXPECT_EQ(harness.runner.requests().size(), 1u);
}

TEST(RetryOrchestrator, RunnerFaultIsInfrastructureAndLeavesPoolAlone) {
    ScriptedStep broken;
    broken.throws = true;
    Harness harness({broken}, makeResources(2));

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::infrastructure_fault);
    ASSERT_EQ(outcome.attemptCount(), 1u);
    EXPECT_EQ(outcome.message, "worker unreachable");
    const auto key = outcome.attempts[0].resource->key();
    EXPECT_EQ(harness.pool.stats(key)->failCount, 0u);
    EXPECT_EQ(harness.pool.stats(key)->successCount, 0u);
}

TEST(RetryOrchestrator, IgnoreVindicationLeavesStatsUntouched) {
    OrchestratorOptions options;
    options.vindication = VindicationPolicy::ignore;
    Harness harness({{SessionOutcome::credential_invalid}}, makeResources(1), options);

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::credential_rejected);
    const auto key = outcome.attempts[0].resource->key();
    EXPECT_EQ(harness.pool.stats(key)->successCount, 0u);
    EXPECT_EQ(harness.pool.stats(key)->failCount, 0u);
}

TEST(RetryOrchestrator, ObserverSeesEveryAttempt) {
    Harness harness({{SessionOutcome::target_defense_block}, {SessionOutcome::no_response}, {SessionOutcome::success}},
                    makeResources(3));
    std::vector<SessionOutcome> seen;
    harness.orchestrator.setAttemptObserver([&seen](const authrelay::model::Attempt& attempt) {
        seen.push_back(attempt.outcome);
    });

    auto outcome = harness.run();

    EXPECT_EQ(outcome.status, TerminalStatus::success);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0], SessionOutcome::target_defense_block);
    EXPECT_EQ(seen[1], SessionOutcome::no_response);
    EXPECT_EQ(seen[2], SessionOutcome::success);
}

TEST(RetryOrchestrator, AttemptLimitBelowOneIsRaised) {
    OrchestratorOptions options;
    options.maxAttempts = 0;
    Harness harness({{SessionOutcome::no_response}}, makeResources(2), options);
    EXPECT_EQ(harness.orchestrator.options().maxAttempts, 1);
    EXPECT_EQ(harness.run().attemptCount(), 1u);
}
