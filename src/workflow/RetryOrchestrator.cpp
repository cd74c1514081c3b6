#include "authrelay/workflow/RetryOrchestrator.hpp"
#include "authrelay/util/Ids.hpp"
#include "authrelay/util/Logging.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <vector>

namespace authrelay::workflow {
namespace {

struct RetrySession {
    std::string targetUrl;
    model::Credentials credentials;
    std::vector<model::Attempt> attempts;
    std::vector<std::string> usedKeys;
    int bound{1};
    RetryState state{RetryState::start};
    model::TerminalOutcome terminal;
};

std::string describe(const std::optional<model::Resource>& resource) {
    return resource ? resource->displayName() : std::string{"direct"};
}

bool deadlinePassed(const RetryOrchestrator::Deadline& deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

} // namespace

std::string_view toString(RetryState state) noexcept {
    switch (state) {
    case RetryState::start: return "START";
    case RetryState::resource_selected: return "RESOURCE_SELECTED";
    case RetryState::session_running: return "SESSION_RUNNING";
    case RetryState::outcome_classified: return "OUTCOME_CLASSIFIED";
    case RetryState::retry: return "RETRY";
    case RetryState::terminal: return "TERMINAL";
    }
    return "TERMINAL";
}

RetryOrchestrator::RetryOrchestrator(pool::ResourcePool& pool,
                                     session::SessionRunner& runner,
                                     boost::asio::thread_pool& worker,
                                     OrchestratorOptions options)
    : pool_(pool)
    , runner_(runner)
    , worker_(worker)
    , options_(options) {
    if (options_.maxAttempts < 1) {
        options_.maxAttempts = 1;
    }
}

void RetryOrchestrator::setAttemptObserver(AttemptObserver observer) {
    observer_ = std::move(observer);
}

model::TerminalOutcome RetryOrchestrator::runWithRetry(const std::string& targetUrl,
                                                       const model::Credentials& credentials,
                                                       const std::optional<model::Resource>& preferredResource,
                                                       Deadline deadline) {
    RetrySession session;
    session.targetUrl = targetUrl;
    session.credentials = credentials;
    session.bound = options_.maxAttempts;

    auto finish = [&session](model::TerminalStatus status, std::string message) {
        session.state = RetryState::terminal;
        session.terminal.status = status;
        session.terminal.message = std::move(message);
        if (!session.attempts.empty()) {
            session.terminal.lastOutcome = session.attempts.back().outcome;
        }
        session.terminal.attempts = std::move(session.attempts);
        util::log(util::LogLevel::info,
                  "Login finished as " + std::string(model::toString(status)) + " after " +
                      std::to_string(session.terminal.attempts.size()) + " attempt(s)");
        return std::move(session.terminal);
    };

    session::SessionResult lastResult;
    while (true) {
        if (deadlinePassed(deadline)) {
            if (session.attempts.empty()) {
                return finish(model::TerminalStatus::deadline_exceeded, "deadline passed before the first attempt");
            }
            util::log(util::LogLevel::warn, "Deadline passed, abandoning remaining retries");
            break;
        }

        std::optional<model::Resource> resource;
        if (session.attempts.empty() && preferredResource) {
            resource = preferredResource;
        } else if (session.attempts.empty()) {
            resource = pool_.acquire(deadline);
        } else {
            resource = pool_.acquireExcluding(session.usedKeys, deadline);
        }
        if (!resource && !options_.allowDirect) {
            util::log(util::LogLevel::warn, "No resource available in the pool");
            return finish(model::TerminalStatus::pool_exhausted, "no resource available");
        }
        session.state = RetryState::resource_selected;
        if (resource) {
            session.usedKeys.push_back(resource->key());
        }

        session::SessionRequest request;
        request.sessionId = util::randomId();
        request.targetUrl = session.targetUrl;
        request.credentials = session.credentials;
        request.resource = resource;
        if (resource) {
            request.proxyAuthorization = pool_.authHeaderFor(*resource);
        }
        request.timeout = options_.attemptTimeout;

        model::Attempt attempt;
        attempt.sessionId = request.sessionId;
        attempt.resource = resource;
        attempt.startedAt = std::chrono::system_clock::now();
        const auto started = std::chrono::steady_clock::now();

        session.state = RetryState::session_running;
        util::log(util::LogLevel::info,
                  "[session " + request.sessionId + "] attempt " + std::to_string(session.attempts.size() + 1) + "/" +
                      std::to_string(session.bound) + " via " + describe(resource));

        std::optional<std::string> fault;
        bool reachedRunner = true;
        try {
            auto run = runAttempt(request);
            lastResult = std::move(run.result);
            reachedRunner = run.started;
        } catch (const std::exception& ex) {
            fault = ex.what();
            lastResult = {};
        }
        attempt.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        attempt.outcome = lastResult.outcome;
        session.attempts.push_back(attempt);
        if (observer_) {
            observer_(attempt);
        }

        if (fault) {
            util::log(util::LogLevel::error, "[session " + request.sessionId + "] session runner failed: " + *fault);
            return finish(model::TerminalStatus::infrastructure_fault, *fault);
        }

        session.state = RetryState::outcome_classified;
        util::log(util::LogLevel::info, "[session " + request.sessionId + "] " +
                                            std::string(model::toString(attempt.outcome)) + " in " +
                                            std::to_string(attempt.duration.count()) + " ms" +
                                            (lastResult.detail.empty() ? "" : " (" + lastResult.detail + ")"));
        if (!reachedRunner) {
            // Nothing went through the resource; hand it back unpenalised.
            util::log(util::LogLevel::warn, "[session " + request.sessionId + "] withdrawn before it started");
            if (resource) {
                pool_.release(*resource);
                session.usedKeys.pop_back();
            }
        } else if (resource) {
            report(*resource, attempt.outcome);
        }

        if (!model::isRetryable(attempt.outcome)) {
            break;
        }
        if (static_cast<int>(session.attempts.size()) >= session.bound) {
            util::log(util::LogLevel::warn, "Attempt limit of " + std::to_string(session.bound) + " reached");
            break;
        }
        session.state = RetryState::retry;
    }

    const auto outcome = session.attempts.back().outcome;
    if (outcome == model::SessionOutcome::success) {
        session.terminal.token = lastResult.token;
    }
    return finish(model::terminalStatusFor(outcome), lastResult.detail);
}

RetryOrchestrator::AttemptRun RetryOrchestrator::runAttempt(const session::SessionRequest& request) {
    enum Phase : int { queued, running, abandoned };

    auto promise = std::make_shared<std::promise<session::SessionResult>>();
    auto phase = std::make_shared<std::atomic<int>>(queued);
    auto future = promise->get_future();
    boost::asio::post(worker_, [&runner = runner_, promise, phase, request]() {
        int expected = queued;
        if (!phase->compare_exchange_strong(expected, running)) {
            return;
        }
        try {
            promise->set_value(runner.run(request));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    });

    if (future.wait_for(options_.attemptTimeout) == std::future_status::ready) {
        return {future.get(), true};
    }

    AttemptRun timedOut;
    timedOut.result.outcome = model::SessionOutcome::navigation_timeout;
    int expected = queued;
    if (phase->compare_exchange_strong(expected, abandoned)) {
        timedOut.started = false;
        timedOut.result.detail = "no worker free within " + std::to_string(options_.attemptTimeout.count()) + " ms";
        return timedOut;
    }
    // In flight: the runner keeps going on the worker pool and its late
    // result is dropped.
    timedOut.result.detail = "no result within " + std::to_string(options_.attemptTimeout.count()) + " ms";
    return timedOut;
}

void RetryOrchestrator::report(const model::Resource& resource, model::SessionOutcome outcome) {
    if (model::provesTargetReached(outcome) && options_.vindication == VindicationPolicy::ignore) {
        util::log(util::LogLevel::debug, "Not reporting " + std::string(model::toString(outcome)) + " for " +
                                             resource.displayName());
        return;
    }
    pool_.reportOutcome(resource, model::resourceReportFor(outcome));
}

} // namespace authrelay::workflow
