#pragma once

#include "authrelay/model/Outcome.hpp"
#include "authrelay/model/Resource.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace authrelay::model {

struct Credentials {
    std::string username;
    std::string password;
};

struct Attempt {
    std::string sessionId;
    std::optional<Resource> resource;
    SessionOutcome outcome{SessionOutcome::unclassified_failure};
    std::chrono::system_clock::time_point startedAt{};
    std::chrono::milliseconds duration{};
};

struct TerminalOutcome {
    TerminalStatus status{TerminalStatus::unclassified_failure};
    std::optional<SessionOutcome> lastOutcome;
    std::optional<std::string> token;
    std::vector<Attempt> attempts;
    std::string message;

    [[nodiscard]] std::size_t attemptCount() const noexcept { return attempts.size(); }

    // Resource that carried the last attempt, if any.
    [[nodiscard]] const Resource* lastResource() const {
        if (attempts.empty() || !attempts.back().resource) {
            return nullptr;
        }
        return &*attempts.back().resource;
    }
};

} // namespace authrelay::model
