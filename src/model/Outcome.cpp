#include "authrelay/model/Outcome.hpp"
#include "authrelay/util/Logging.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace authrelay::model {
namespace {

// Legacy worker names map onto the closed set.
constexpr std::array<std::pair<std::string_view, SessionOutcome>, 17> kWireNames{{
    {"success", SessionOutcome::success},
    {"credential_invalid", SessionOutcome::credential_invalid},
    {"login_failed", SessionOutcome::credential_invalid},
    {"invalid", SessionOutcome::credential_invalid},
    {"account_banned", SessionOutcome::account_banned},
    {"banned", SessionOutcome::account_banned},
    {"account_disabled", SessionOutcome::account_disabled},
    {"target_defense_block", SessionOutcome::target_defense_block},
    {"ip_blocked", SessionOutcome::target_defense_block},
    {"imperva_blocked", SessionOutcome::target_defense_block},
    {"navigation_timeout", SessionOutcome::navigation_timeout},
    {"timeout", SessionOutcome::navigation_timeout},
    {"no_response", SessionOutcome::no_response},
    {"proxy_error", SessionOutcome::no_response},
    {"unclassified_failure", SessionOutcome::unclassified_failure},
    {"critical_error", SessionOutcome::unclassified_failure},
    {"error", SessionOutcome::unclassified_failure},
}};

} // namespace

bool isRetryable(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::target_defense_block:
    case SessionOutcome::navigation_timeout:
    case SessionOutcome::no_response:
        return true;
    case SessionOutcome::success:
    case SessionOutcome::credential_invalid:
    case SessionOutcome::account_banned:
    case SessionOutcome::account_disabled:
    case SessionOutcome::unclassified_failure:
        return false;
    }
    return false;
}

bool provesTargetReached(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::credential_invalid:
    case SessionOutcome::account_banned:
    case SessionOutcome::account_disabled:
        return true;
    case SessionOutcome::success:
    case SessionOutcome::target_defense_block:
    case SessionOutcome::navigation_timeout:
    case SessionOutcome::no_response:
    case SessionOutcome::unclassified_failure:
        return false;
    }
    return false;
}

ResourceReport resourceReportFor(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::success:
    case SessionOutcome::credential_invalid:
    case SessionOutcome::account_banned:
    case SessionOutcome::account_disabled:
        return ResourceReport::success;
    case SessionOutcome::target_defense_block:
    case SessionOutcome::navigation_timeout:
    case SessionOutcome::no_response:
    case SessionOutcome::unclassified_failure:
        return ResourceReport::soft_failure;
    }
    return ResourceReport::soft_failure;
}

TerminalStatus terminalStatusFor(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::success: return TerminalStatus::success;
    case SessionOutcome::credential_invalid: return TerminalStatus::credential_rejected;
    case SessionOutcome::account_banned:
    case SessionOutcome::account_disabled: return TerminalStatus::target_rejected_by_self;
    case SessionOutcome::target_defense_block: return TerminalStatus::target_defense_block;
    case SessionOutcome::navigation_timeout:
    case SessionOutcome::no_response: return TerminalStatus::resource_unresponsive;
    case SessionOutcome::unclassified_failure: return TerminalStatus::unclassified_failure;
    }
    return TerminalStatus::unclassified_failure;
}

std::string_view toString(SessionOutcome outcome) noexcept {
    switch (outcome) {
    case SessionOutcome::success: return "SUCCESS";
    case SessionOutcome::credential_invalid: return "CREDENTIAL_INVALID";
    case SessionOutcome::account_banned: return "ACCOUNT_BANNED";
    case SessionOutcome::account_disabled: return "ACCOUNT_DISABLED";
    case SessionOutcome::target_defense_block: return "TARGET_DEFENSE_BLOCK";
    case SessionOutcome::navigation_timeout: return "NAVIGATION_TIMEOUT";
    case SessionOutcome::no_response: return "NO_RESPONSE";
    case SessionOutcome::unclassified_failure: return "UNCLASSIFIED_FAILURE";
    }
    return "UNCLASSIFIED_FAILURE";
}

std::string_view toString(TerminalStatus status) noexcept {
    switch (status) {
    case TerminalStatus::success: return "Success";
    case TerminalStatus::credential_rejected: return "CredentialRejected";
    case TerminalStatus::target_rejected_by_self: return "TargetRejectedBySelf";
    case TerminalStatus::target_defense_block: return "TargetDefenseBlock";
    case TerminalStatus::resource_unresponsive: return "ResourceUnresponsive";
    case TerminalStatus::pool_exhausted: return "PoolExhausted";
    case TerminalStatus::infrastructure_fault: return "InfrastructureFault";
    case TerminalStatus::unclassified_failure: return "UnclassifiedFailure";
    case TerminalStatus::deadline_exceeded: return "DeadlineExceeded";
    }
    return "UnclassifiedFailure";
}

std::string_view toString(ResourceReport report) noexcept {
    switch (report) {
    case ResourceReport::success: return "success";
    case ResourceReport::soft_failure: return "soft_failure";
    }
    return "soft_failure";
}

SessionOutcome parseSessionOutcome(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    for (const auto& [wire, outcome] : kWireNames) {
        if (wire == lower) {
            return outcome;
        }
    }
    util::log(util::LogLevel::warn, "Unrecognised session outcome '" + std::string(name) +
                                        "', treating as UNCLASSIFIED_FAILURE");
    return SessionOutcome::unclassified_failure;
}

} // namespace authrelay::model
