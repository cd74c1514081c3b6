#include "authrelay/service/LoginService.hpp"
#include "authrelay/util/Ids.hpp"
#include "authrelay/util/Logging.hpp"


#include <chrono>

namespace authrelay::service {
namespace {

LoginReply errorReply(unsigned int httpStatus, std::string description) {
    LoginReply reply;
    reply.httpStatus = httpStatus;
    reply.status = "ERROR";
    reply.description = std::move(description);
    return reply;
}

} // namespace

LoginReply toLoginReply(const model::TerminalOutcome& outcome) {
    LoginReply reply;
    reply.terminal = std::string(model::toString(outcome.status));
    reply.attempts = outcome.attemptCount();
    if (const auto* resource = outcome.lastResource()) {
        reply.usedProxy = resource->displayName();
    }

    switch (outcome.status) {
    case model::TerminalStatus::success:
        reply.httpStatus = 200;
        reply.status = "SUCCESS";
        reply.token = outcome.token;
        break;
    case model::TerminalStatus::credential_rejected:
        reply.httpStatus = 400;
        reply.status = "INVALID";
        reply.description = "Invalid credentials";
        break;
    case model::TerminalStatus::target_rejected_by_self:
        reply.httpStatus = 418;
        reply.status = "BANNED";
        reply.description = "Account is banned or disabled";
        break;
    case model::TerminalStatus::target_defense_block:
        reply.httpStatus = 502;
        reply.description = "Blocked by target defenses on every attempt";
        break;
    case model::TerminalStatus::resource_unresponsive:
        reply.httpStatus = 502;
        reply.description = "No resource delivered a response";
        break;
    case model::TerminalStatus::pool_exhausted:
        reply.httpStatus = 503;
        reply.description = "No proxy available at the moment";
        break;
    case model::TerminalStatus::deadline_exceeded:
        reply.httpStatus = 504;
        reply.description = "Request deadline exceeded";
        break;
    case model::TerminalStatus::infrastructure_fault:
    case model::TerminalStatus::unclassified_failure:
        reply.httpStatus = 500;
        reply.description = outcome.message.empty() ? "Internal server error" : outcome.message;
        break;
    }
    return reply;
}

LoginService::LoginService(workflow::RetryOrchestrator& orchestrator, AdmissionGate& gate, std::string defaultScheme)
    : orchestrator_(orchestrator)
    , gate_(gate)
    , defaultScheme_(std::move(defaultScheme)) {}

LoginReply LoginService::login(const LoginRequest& request) {
    const auto requestId = request.requestId.empty() ? util::randomId() : request.requestId;
    if (request.url.empty() || request.username.empty() || request.password.empty()) {
        util::log(util::LogLevel::warn, "[request " + requestId + "] missing required parameters");
        return errorReply(400, "Missing required parameters");
    }

    std::optional<model::Resource> preferred;
    if (request.proxy && !request.proxy->empty()) {
        preferred = model::parseResource(*request.proxy, defaultScheme_);
        if (!preferred) {
            util::log(util::LogLevel::warn, "[request " + requestId + "] rejected malformed proxy");
            return errorReply(400, "Malformed proxy");
        }
    }

    auto ticket = gate_.tryEnter();
    if (!ticket) {
        util::log(util::LogLevel::warn, "[request " + requestId + "] maximum concurrent logins reached");
        return errorReply(503, "Server is busy, maximum concurrent login requests reached");
    }

    const auto& options = orchestrator_.options();
    const auto deadline = std::chrono::steady_clock::now() + options.attemptTimeout * options.maxAttempts;
    const auto started = std::chrono::steady_clock::now();

    util::log(util::LogLevel::info, "[request " + requestId + "] login started (" +
                                        std::to_string(gate_.inFlight()) + "/" +
                                        std::to_string(gate_.capacity()) + " in flight)");
    auto outcome = orchestrator_.runWithRetry(request.url, {request.username, request.password}, preferred, deadline);
    auto reply = toLoginReply(outcome);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    util::log(util::LogLevel::info, "[request " + requestId + "] " + reply.status + " => " +
                                        std::to_string(reply.httpStatus) + " in " +
                                        std::to_string(elapsed.count()) + " ms");
    return reply;
}

} // namespace authrelay::service
