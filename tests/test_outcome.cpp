/// @file test_outcome.cpp
/// Classification tables for session outcomes.

#include "authrelay/model/Outcome.hpp"

#include <gtest/gtest.h>

using namespace authrelay::model;

TEST(Outcome, OnlyResourceSideFailuresAreRetryable) {
    EXPECT_TRUE(isRetryable(SessionOutcome::target_defense_block));
    EXPECT_TRUE(isRetryable(SessionOutcome::navigation_timeout));
    EXPECT_TRUE(isRetryable(SessionOutcome::no_response));

    EXPECT_FALSE(isRetryable(SessionOutcome::success));
    EXPECT_FALSE(isRetryable(SessionOutcome::credential_invalid));
    EXPECT_FALSE(isRetryable(SessionOutcome::account_banned));
    EXPECT_FALSE(isRetryable(SessionOutcome::account_disabled));
    EXPECT_FALSE(isRetryable(SessionOutcome::unclassified_failure));
}

TEST(Outcome, TargetVerdictsVindicateTheResource) {
    for (auto outcome : {SessionOutcome::success, SessionOutcome::credential_invalid,
                         SessionOutcome::account_banned, SessionOutcome::account_disabled}) {
        EXPECT_EQ(resourceReportFor(outcome), ResourceReport::success) << toString(outcome);
    }
    for (auto outcome : {SessionOutcome::target_defense_block, SessionOutcome::navigation_timeout,
                         SessionOutcome::no_response, SessionOutcome::unclassified_failure}) {
        EXPECT_EQ(resourceReportFor(outcome), ResourceReport::soft_failure) << toString(outcome);
    }
}

TEST(Outcome, ProvesTargetReachedExcludesSuccess) {
    EXPECT_FALSE(provesTargetReached(SessionOutcome::success));
    EXPECT_TRUE(provesTargetReached(SessionOutcome::credential_invalid));
    EXPECT_TRUE(provesTargetReached(SessionOutcome::account_banned));
    EXPECT_TRUE(provesTargetReached(SessionOutcome::account_disabled));
    EXPECT_FALSE(provesTargetReached(SessionOutcome::no_response));
}

TEST(Outcome, TerminalStatusMapping) {
    EXPECT_EQ(terminalStatusFor(SessionOutcome::success), TerminalStatus::success);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::credential_invalid), TerminalStatus::credential_rejected);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::account_banned), TerminalStatus::target_rejected_by_self);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::account_disabled), TerminalStatus::target_rejected_by_self);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::target_defense_block), TerminalStatus::target_defense_block);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::navigation_timeout), TerminalStatus::resource_unresponsive);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::no_response), TerminalStatus::resource_unresponsive);
    EXPECT_EQ(terminalStatusFor(SessionOutcome::unclassified_failure), TerminalStatus::unclassified_failure);
}

TEST(Outcome, DisplayNames) {
    EXPECT_EQ(toString(SessionOutcome::target_defense_block), "TARGET_DEFENSE_BLOCK");
    EXPECT_EQ(toString(TerminalStatus::credential_rejected), "CredentialRejected");
    EXPECT_EQ(toString(TerminalStatus::pool_exhausted), "PoolExhausted");
    EXPECT_EQ(toString(ResourceReport::soft_failure), "soft_failure");
}

TEST(ParseSessionOutcome, CanonicalNamesRoundTrip) {
    for (auto outcome : {SessionOutcome::success, SessionOutcome::credential_invalid,
                         SessionOutcome::account_banned, SessionOutcome::account_disabled,
                         SessionOutcome::target_defense_block, SessionOutcome::navigation_timeout,
                         SessionOutcome::no_response, SessionOutcome::unclassified_failure}) {
        EXPECT_EQ(parseSessionOutcome(toString(outcome)), outcome);
    }
}

TEST(ParseSessionOutcome, LegacyWorkerNames) {
    EXPECT_EQ(parseSessionOutcome("login_failed"), SessionOutcome::credential_invalid);
    EXPECT_EQ(parseSessionOutcome("INVALID"), SessionOutcome::credential_invalid);
    EXPECT_EQ(parseSessionOutcome("banned"), SessionOutcome::account_banned);
    EXPECT_EQ(parseSessionOutcome("ip_blocked"), SessionOutcome::target_defense_block);
    EXPECT_EQ(parseSessionOutcome("imperva_blocked"), SessionOutcome::target_defense_block);
    EXPECT_EQ(parseSessionOutcome("timeout"), SessionOutcome::navigation_timeout);
    EXPECT_EQ(parseSessionOutcome("proxy_error"), SessionOutcome::no_response);
    EXPECT_EQ(parseSessionOutcome("critical_error"), SessionOutcome::unclassified_failure);
}

TEST(ParseSessionOutcome, UnknownNamesAreUnclassified) {
    EXPECT_EQ(parseSessionOutcome("captcha_wall"), SessionOutcome::unclassified_failure);
    EXPECT_EQ(parseSessionOutcome(""), SessionOutcome::unclassified_failure);
}
