#pragma once

#include "authrelay/model/Attempt.hpp"
#include "authrelay/model/Outcome.hpp"
#include "authrelay/model/Resource.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace authrelay::session {

struct SessionRequest {
    std::string sessionId;
    std::string targetUrl;
    model::Credentials credentials;
    std::optional<model::Resource> resource;
    std::optional<std::string> proxyAuthorization;
    std::chrono::milliseconds timeout{};
};

struct SessionResult {
    model::SessionOutcome outcome{model::SessionOutcome::unclassified_failure};
    std::string token;
    std::string detail;
};

// Raised when the runner itself breaks (as opposed to the attempt failing).
class SessionRunnerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Performs one sign-in attempt through the given resource (or directly
// when none is given) and reports a categorised outcome.
class SessionRunner {
public:
    virtual ~SessionRunner() = default;

    virtual SessionResult run(const SessionRequest& request) = 0;
};

} // namespace authrelay::session
