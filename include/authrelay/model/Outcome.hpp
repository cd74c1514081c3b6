#pragma once

#include <string_view>

namespace authrelay::model {

// Result of a single session attempt as reported by the session runner.
enum class SessionOutcome {
    success,
    credential_invalid,
    account_banned,
    account_disabled,
    target_defense_block,
    navigation_timeout,
    no_response,
    unclassified_failure
};

// Final classification handed back to the caller of runWithRetry.
enum class TerminalStatus {
    success,
    credential_rejected,
    target_rejected_by_self,
    target_defense_block,
    resource_unresponsive,
    pool_exhausted,
    infrastructure_fault,
    unclassified_failure,
    deadline_exceeded
};

// What the pool is told about the resource that carried an attempt.
enum class ResourceReport {
    success,
    soft_failure
};

[[nodiscard]] bool isRetryable(SessionOutcome outcome) noexcept;

// True when the target evaluated the credentials, i.e. the resource
// delivered a real response even though the login may have failed.
[[nodiscard]] bool provesTargetReached(SessionOutcome outcome) noexcept;

[[nodiscard]] ResourceReport resourceReportFor(SessionOutcome outcome) noexcept;
[[nodiscard]] TerminalStatus terminalStatusFor(SessionOutcome outcome) noexcept;

[[nodiscard]] std::string_view toString(SessionOutcome outcome) noexcept;
[[nodiscard]] std::string_view toString(TerminalStatus status) noexcept;
[[nodiscard]] std::string_view toString(ResourceReport report) noexcept;

// Wire names are matched case-insensitively; anything unknown becomes
// unclassified_failure and is logged.
[[nodiscard]] SessionOutcome parseSessionOutcome(std::string_view name);

} // namespace authrelay::model
