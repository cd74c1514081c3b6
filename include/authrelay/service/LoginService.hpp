#pragma once

#include "authrelay/model/Attempt.hpp"
#include "authrelay/service/AdmissionGate.hpp"
#include "authrelay/workflow/RetryOrchestrator.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace authrelay::service {

struct LoginRequest {
    std::string url;
    std::string username;
    std::string password;
    std::optional<std::string> proxy;
    // Correlates log lines; generated when empty.
    std::string requestId;
};

struct LoginReply {
    unsigned int httpStatus{500};
    std::string status{"ERROR"};
    std::string description;
    std::optional<std::string> token;
    std::optional<std::string> usedProxy;
    std::string terminal;
    std::size_t attempts{};
};

// Maps a terminal outcome onto the public API vocabulary
// (SUCCESS / INVALID / BANNED / ERROR plus an HTTP status).
LoginReply toLoginReply(const model::TerminalOutcome& outcome);

class LoginService {
public:
    LoginService(workflow::RetryOrchestrator& orchestrator, AdmissionGate& gate, std::string defaultScheme);

    LoginReply login(const LoginRequest& request);

private:
    workflow::RetryOrchestrator& orchestrator_;
    AdmissionGate& gate_;
    std::string defaultScheme_;
};

} // namespace authrelay::service
