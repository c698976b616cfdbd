#include "orc/sync/session.hpp"

#include <gtest/gtest.h>

using orc::ErrorCode;
using orc::sync::SessionState;
using orc::sync::SyncSession;

TEST(SyncSessionTest, StartInitialisesSession) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};

    auto result = session.start(3, 1700000000000);
    ASSERT_TRUE(result.is_ok());

    const auto& info = session.info();
    EXPECT_EQ(info.session_id, "pass-1");
    EXPECT_EQ(info.entity_id, "job-7");
    EXPECT_EQ(info.device_id, "tablet-A");
    EXPECT_EQ(info.state, SessionState::FetchingSnapshot);
    EXPECT_EQ(info.entries_pending, 3u);
    EXPECT_EQ(info.started_at, 1700000000000);
}

TEST(SyncSessionTest, StartTwiceIsRejected) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    ASSERT_TRUE(session.start(0, 0).is_ok());

    auto again = session.start(0, 0);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().code, ErrorCode::InvalidState);
}

TEST(SyncSessionTest, EnforcesTransitionOrder) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    ASSERT_TRUE(session.start(0, 0).is_ok());

    EXPECT_TRUE(session.transition_to(SessionState::Reconciling).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Pushing).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Committing).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Complete).is_ok());
    EXPECT_TRUE(session.finished());

    auto illegal = session.transition_to(SessionState::Pushing);
    ASSERT_TRUE(illegal.is_error());
    EXPECT_EQ(illegal.error().code, ErrorCode::InvalidTransition);
}

TEST(SyncSessionTest, NothingToPushSkipsPushing) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    ASSERT_TRUE(session.start(0, 0).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Reconciling).is_ok());

    EXPECT_TRUE(session.transition_to(SessionState::Committing).is_ok());
}

TEST(SyncSessionTest, CannotSkipReconciling) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    ASSERT_TRUE(session.start(0, 0).is_ok());

    EXPECT_TRUE(session.transition_to(SessionState::Pushing).is_error());
    EXPECT_EQ(session.state(), SessionState::FetchingSnapshot);
}

TEST(SyncSessionTest, AllowsFailureFromAnyState) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    ASSERT_TRUE(session.start(1, 0).is_ok());
    ASSERT_TRUE(session.transition_to(SessionState::Reconciling).is_ok());

    auto failed = session.mark_failed("TransportError: timeout");
    ASSERT_TRUE(failed.is_ok());
    EXPECT_EQ(session.state(), SessionState::Failed);
    EXPECT_EQ(session.info().last_error, "TransportError: timeout");

    // Re-applying the same terminal state is fine, leaving it is not
    EXPECT_TRUE(session.transition_to(SessionState::Failed).is_ok());
    EXPECT_TRUE(session.transition_to(SessionState::Reconciling).is_error());
}

TEST(SyncSessionTest, CancellationTokenIsShared) {
    auto token = std::make_shared<std::atomic<bool>>(false);
    SyncSession session{"pass-1", "job-7", "tablet-A", token};
    EXPECT_FALSE(session.cancel_requested());

    token->store(true);
    EXPECT_TRUE(session.cancel_requested());

    ASSERT_TRUE(session.start(0, 0).is_ok());
    ASSERT_TRUE(session.mark_cancelled("connectivity lost").is_ok());
    EXPECT_EQ(session.state(), SessionState::Cancelled);
    EXPECT_TRUE(session.finished());
}

TEST(SyncSessionTest, CountsAttemptsAndPushes) {
    SyncSession session{"pass-1", "job-7", "tablet-A"};
    session.record_attempt();
    session.record_attempt();
    session.record_pushed(4);
    session.record_conflicts(1);

    EXPECT_EQ(session.info().transport_attempts, 2u);
    EXPECT_EQ(session.info().entries_pushed, 4u);
    EXPECT_EQ(session.info().conflicts_found, 1u);
}
