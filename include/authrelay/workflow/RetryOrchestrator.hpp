#pragma once

#include "authrelay/model/Attempt.hpp"
#include "authrelay/pool/ResourcePool.hpp"
#include "authrelay/session/SessionRunner.hpp"

#include <boost/asio/thread_pool.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace authrelay::workflow {

// How outcomes that prove the target evaluated the credentials
// (credential_invalid, account_banned, account_disabled) reach the pool.
enum class VindicationPolicy {
    report_success,
    ignore
};

struct OrchestratorOptions {
    int maxAttempts{3};
    std::chrono::milliseconds attemptTimeout{std::chrono::seconds{30}};
    VindicationPolicy vindication{VindicationPolicy::report_success};
    bool allowDirect{false};
};

enum class RetryState {
    start,
    resource_selected,
    session_running,
    outcome_classified,
    retry,
    terminal
};

std::string_view toString(RetryState state) noexcept;

class RetryOrchestrator {
public:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;
    using AttemptObserver = std::function<void(const model::Attempt&)>;

    RetryOrchestrator(pool::ResourcePool& pool,
                      session::SessionRunner& runner,
                      boost::asio::thread_pool& worker,
                      OrchestratorOptions options);

    // Drives one logical sign-in to a terminal classification. Never
    // throws for attempt failures; the deadline stops further retries but
    // lets an attempt in flight run to its own timeout.
    model::TerminalOutcome runWithRetry(const std::string& targetUrl,
                                        const model::Credentials& credentials,
                                        const std::optional<model::Resource>& preferredResource = std::nullopt,
                                        Deadline deadline = std::nullopt);

    void setAttemptObserver(AttemptObserver observer);

    [[nodiscard]] const OrchestratorOptions& options() const noexcept { return options_; }

private:
    struct AttemptRun {
        session::SessionResult result;
        // False when the attempt timed out still queued behind busy workers
        // and was withdrawn before reaching the runner.
        bool started{true};
    };

    AttemptRun runAttempt(const session::SessionRequest& request);
    void report(const model::Resource& resource, model::SessionOutcome outcome);

    pool::ResourcePool& pool_;
    session::SessionRunner& runner_;
    boost::asio::thread_pool& worker_;
    OrchestratorOptions options_;
    AttemptObserver observer_;
};

} // namespace authrelay::workflow
