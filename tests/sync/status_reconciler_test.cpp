#include "orc/sync/status_reconciler.hpp"

#include <gtest/gtest.h>

using orc::model::LifecycleStatus;
using orc::model::all_statuses;
using orc::sync::DemotionPolicy;
using orc::sync::StatusDecision;
using orc::sync::StatusReconciler;

namespace {

bool is_completion_cancellation_pair(LifecycleStatus a, LifecycleStatus b) {
    return (a == LifecycleStatus::Completed && b == LifecycleStatus::Cancelled) ||
           (a == LifecycleStatus::Cancelled && b == LifecycleStatus::Completed);
}

} // namespace

TEST(StatusReconcilerTest, CancelledOnServerBeatsWorkOnDevice) {
    StatusReconciler reconciler;

    auto result = reconciler.merge(LifecycleStatus::Cancelled, LifecycleStatus::InProgress);

    EXPECT_EQ(result.decision, StatusDecision::TerminalWins);
    EXPECT_EQ(result.resolved, LifecycleStatus::Cancelled);
    EXPECT_FALSE(result.requires_user_choice);
}

TEST(StatusReconcilerTest, CompletedVersusCancelledNeedsAHuman) {
    StatusReconciler reconciler;

    auto result = reconciler.merge(LifecycleStatus::Cancelled, LifecycleStatus::Completed);
    EXPECT_EQ(result.decision, StatusDecision::Conflict);
    EXPECT_TRUE(result.requires_user_choice);
    // Visible status stays at the server value until the user decides
    EXPECT_EQ(result.resolved, LifecycleStatus::Cancelled);

    auto mirrored = reconciler.merge(LifecycleStatus::Completed, LifecycleStatus::Cancelled);
    EXPECT_EQ(mirrored.decision, StatusDecision::Conflict);
    EXPECT_EQ(mirrored.resolved, LifecycleStatus::Completed);
}

TEST(StatusReconcilerTest, CompletionOnDeviceBeatsServerProgression) {
    StatusReconciler reconciler;

    auto result = reconciler.merge(LifecycleStatus::EnRoute, LifecycleStatus::Completed);

    EXPECT_EQ(result.decision, StatusDecision::TerminalWins);
    EXPECT_EQ(result.resolved, LifecycleStatus::Completed);
}

TEST(StatusReconcilerTest, HigherProgressionWins) {
    StatusReconciler reconciler;

    auto server_ahead = reconciler.merge(LifecycleStatus::InProgress, LifecycleStatus::Assigned);
    EXPECT_EQ(server_ahead.decision, StatusDecision::ServerWins);
    EXPECT_EQ(server_ahead.resolved, LifecycleStatus::InProgress);

    auto device_ahead = reconciler.merge(LifecycleStatus::Assigned, LifecycleStatus::InProgress);
    EXPECT_EQ(device_ahead.decision, StatusDecision::LocalWins);
    EXPECT_EQ(device_ahead.resolved, LifecycleStatus::InProgress);
}

TEST(StatusReconcilerTest, DispatcherAuthorityKeepsDemotionBeforeWorkStarts) {
    StatusReconciler forward{DemotionPolicy::ForwardProgress};
    StatusReconciler dispatcher{DemotionPolicy::DispatcherAuthority};

    // Dispatcher pulled the job back to Pending while the agent was driving there
    auto forward_result = forward.merge(LifecycleStatus::Pending, LifecycleStatus::EnRoute);
    EXPECT_EQ(forward_result.resolved, LifecycleStatus::EnRoute);

    auto dispatcher_result = dispatcher.merge(LifecycleStatus::Pending, LifecycleStatus::EnRoute);
    EXPECT_EQ(dispatcher_result.decision, StatusDecision::ServerWins);
    EXPECT_EQ(dispatcher_result.resolved, LifecycleStatus::Pending);

    // Once work started the device wins under both policies
    auto working = dispatcher.merge(LifecycleStatus::Assigned, LifecycleStatus::InProgress);
    EXPECT_EQ(working.decision, StatusDecision::LocalWins);
    EXPECT_EQ(working.resolved, LifecycleStatus::InProgress);
}

TEST(StatusReconcilerTest, TotalOverEveryPair) {
    for (auto policy : {DemotionPolicy::ForwardProgress, DemotionPolicy::DispatcherAuthority}) {
        StatusReconciler reconciler{policy};
        for (auto server : all_statuses()) {
            for (auto local : all_statuses()) {
                auto result = reconciler.merge(server, local);
                SCOPED_TRACE(orc::model::to_string(server) + " vs " + orc::model::to_string(local));

                if (server == local) {
                    EXPECT_EQ(result.decision, StatusDecision::Unchanged);
                    EXPECT_EQ(result.resolved, server);
                } else if (is_completion_cancellation_pair(server, local)) {
                    EXPECT_EQ(result.decision, StatusDecision::Conflict);
                    EXPECT_TRUE(result.requires_user_choice);
                } else {
                    EXPECT_FALSE(result.requires_user_choice);
                    EXPECT_TRUE(result.resolved == server || result.resolved == local);
                }

                if (StatusReconciler::is_terminal(server) != StatusReconciler::is_terminal(local)) {
                    EXPECT_EQ(result.decision, StatusDecision::TerminalWins);
                    EXPECT_TRUE(StatusReconciler::is_terminal(result.resolved));
                }
            }
        }
    }
}

TEST(StatusReconcilerTest, MergeIsDeterministic) {
    StatusReconciler reconciler;
    for (auto server : all_statuses()) {
        for (auto local : all_statuses()) {
            auto first = reconciler.merge(server, local);
            auto second = reconciler.merge(server, local);
            EXPECT_EQ(first.decision, second.decision);
            EXPECT_EQ(first.resolved, second.resolved);
        }
    }
}

TEST(StatusReconcilerTest, DeviceTransitionsOnlyMoveForward) {
    EXPECT_TRUE(StatusReconciler::is_valid_transition(LifecycleStatus::Pending, LifecycleStatus::Assigned));
    EXPECT_TRUE(StatusReconciler::is_valid_transition(LifecycleStatus::Assigned, LifecycleStatus::InProgress));
    EXPECT_TRUE(StatusReconciler::is_valid_transition(LifecycleStatus::InProgress, LifecycleStatus::Completed));
    EXPECT_TRUE(StatusReconciler::is_valid_transition(LifecycleStatus::EnRoute, LifecycleStatus::Cancelled));

    EXPECT_FALSE(StatusReconciler::is_valid_transition(LifecycleStatus::InProgress, LifecycleStatus::Assigned));
    EXPECT_FALSE(StatusReconciler::is_valid_transition(LifecycleStatus::EnRoute, LifecycleStatus::Completed));
    EXPECT_FALSE(StatusReconciler::is_valid_transition(LifecycleStatus::Completed, LifecycleStatus::Cancelled));
    EXPECT_FALSE(StatusReconciler::is_valid_transition(LifecycleStatus::Cancelled, LifecycleStatus::Pending));
    EXPECT_FALSE(StatusReconciler::is_valid_transition(LifecycleStatus::Assigned, LifecycleStatus::Assigned));
}
