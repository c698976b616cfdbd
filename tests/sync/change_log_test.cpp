#include "orc/sync/change_log.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using orc::ErrorCode;
using orc::model::ChangeLogEntry;
using orc::model::DeliveryState;
using orc::model::MutationKind;
using orc::sync::ChangeLog;

namespace {

ChangeLogEntry field_edit(const std::string& entity_id, const std::string& field, const std::string& value,
                          orc::model::Timestamp at) {
    ChangeLogEntry entry;
    entry.entity_id = entity_id;
    entry.kind = MutationKind::FieldUpdate;
    entry.target = field;
    entry.payload = value;
    entry.device_id = "tablet-07";
    entry.created_at = at;
    return entry;
}

} // namespace

TEST(ChangeLogTest, AppendAssignsIdsAndSequence) {
    ChangeLog log;

    auto first = log.append(field_edit("job-1", "notes", "a", 100));
    auto second = log.append(field_edit("job-1", "notes", "b", 101));
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value(), second.value());

    auto stored = log.find(second.value());
    ASSERT_TRUE(stored.is_ok());
    EXPECT_EQ(stored.value().state, DeliveryState::Pending);
    EXPECT_GT(stored.value().sequence, log.find(first.value()).value().sequence);
}

TEST(ChangeLogTest, DuplicateAppendReturnsExistingEntry) {
    ChangeLog log;

    auto first = log.append(field_edit("job-1", "total", "1500", 100));
    auto again = log.append(field_edit("job-1", "total", "1500", 100));

    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), first.value());
    EXPECT_EQ(log.size(), 1u);
}

TEST(ChangeLogTest, FullLogRejectsAppendAndKeepsEntries) {
    ChangeLog log{50};
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(log.append(field_edit("job-" + std::to_string(i % 5), "notes", std::to_string(i), i)).is_ok());
    }
    const auto before = log.snapshot();

    auto rejected = log.append(field_edit("job-9", "notes", "one too many", 1000));

    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueFull);
    const auto after = log.snapshot();
    ASSERT_EQ(after.size(), 50u);
    for (std::size_t i = 0; i < after.size(); ++i) {
        EXPECT_EQ(after[i].entry_id, before[i].entry_id);
        EXPECT_EQ(after[i].state, DeliveryState::Pending);
    }
}

TEST(ChangeLogTest, DeliveredEntriesFreeCapacity) {
    ChangeLog log{2};
    auto a = log.append(field_edit("job-1", "notes", "a", 1));
    auto b = log.append(field_edit("job-1", "notes", "b", 2));
    ASSERT_TRUE(log.append(field_edit("job-1", "notes", "c", 3)).is_error());

    ASSERT_TRUE(log.mark_in_flight(a.value(), 10).is_ok());
    ASSERT_TRUE(log.mark_delivered(a.value(), 11).is_ok());

    EXPECT_TRUE(log.append(field_edit("job-1", "notes", "c", 3)).is_ok());
    EXPECT_EQ(log.live_count(), 2u);
    (void)b;
}

TEST(ChangeLogTest, DrainReturnsDeliverableEntriesInDeviceOrder) {
    ChangeLog log;
    auto late = log.append(field_edit("job-1", "notes", "late", 300));
    auto early = log.append(field_edit("job-1", "notes", "early", 100));
    auto other = log.append(field_edit("job-2", "notes", "other", 200));
    auto parked = log.append(field_edit("job-1", "total", "10", 150));
    ASSERT_TRUE(log.mark_conflicted(parked.value(), 400).is_ok());
    ASSERT_TRUE(log.mark_in_flight(late.value(), 400).is_ok());

    auto drained = log.drain("job-1");

    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].entry_id, early.value());
    EXPECT_EQ(drained[1].entry_id, late.value());
    (void)other;
}

TEST(ChangeLogTest, MarkingDeliveredTwiceIsANoOp) {
    ChangeLog log;
    auto id = log.append(field_edit("job-1", "notes", "a", 1)).value();
    ASSERT_TRUE(log.mark_in_flight(id, 2).is_ok());
    ASSERT_TRUE(log.mark_delivered(id, 3).is_ok());

    EXPECT_TRUE(log.mark_delivered(id, 4).is_ok());
    EXPECT_EQ(log.find(id).value().state, DeliveryState::Acknowledged);
    EXPECT_EQ(log.find(id).value().state_changed_at, 3);
}

TEST(ChangeLogTest, TerminalStatesAreFinal) {
    ChangeLog log;
    auto delivered = log.append(field_edit("job-1", "notes", "a", 1)).value();
    auto failed = log.append(field_edit("job-1", "notes", "b", 2)).value();
    ASSERT_TRUE(log.mark_delivered(delivered, 5).is_ok());
    ASSERT_TRUE(log.mark_failed(failed, 5).is_ok());

    auto reopen = log.release(delivered, 6);
    ASSERT_TRUE(reopen.is_error());
    EXPECT_EQ(reopen.error().code, ErrorCode::InvalidTransition);
    EXPECT_TRUE(log.mark_delivered(failed, 6).is_error());
    EXPECT_TRUE(log.mark_in_flight(failed, 6).is_error());
}

TEST(ChangeLogTest, ReleaseReturnsInFlightEntryToPending) {
    ChangeLog log;
    auto id = log.append(field_edit("job-1", "notes", "a", 1)).value();
    ASSERT_TRUE(log.mark_in_flight(id, 2).is_ok());

    ASSERT_TRUE(log.release(id, 3).is_ok());

    EXPECT_EQ(log.find(id).value().state, DeliveryState::Pending);
}

TEST(ChangeLogTest, UnknownEntryIsNotFound) {
    ChangeLog log;
    auto result = log.mark_delivered("nope", 1);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(ChangeLogTest, GarbageCollectionHonoursRetentionWindow) {
    ChangeLog log{50, std::chrono::milliseconds(1000)};
    auto done = log.append(field_edit("job-1", "notes", "a", 1)).value();
    auto pending = log.append(field_edit("job-1", "notes", "b", 2)).value();
    ASSERT_TRUE(log.mark_delivered(done, 100).is_ok());

    EXPECT_EQ(log.collect_garbage(500), 0u);
    EXPECT_EQ(log.collect_garbage(1100), 1u);
    EXPECT_TRUE(log.find(done).is_error());
    EXPECT_TRUE(log.find(pending).is_ok());
}

TEST(ChangeLogTest, RekeyMovesEntriesToServerId) {
    ChangeLog log;
    log.append(field_edit("tmp-1", "notes", "a", 1));
    log.append(field_edit("tmp-1", "total", "5", 2));
    log.append(field_edit("job-2", "notes", "c", 3));

    EXPECT_EQ(log.rekey("tmp-1", "job-1"), 2u);
    EXPECT_EQ(log.drain("job-1").size(), 2u);
    EXPECT_TRUE(log.drain("tmp-1").empty());
}

TEST(ChangeLogTest, RestoreResendsInFlightEntries) {
    ChangeLog original;
    auto id = original.append(field_edit("job-1", "notes", "a", 1)).value();
    ASSERT_TRUE(original.mark_in_flight(id, 2).is_ok());

    ChangeLog restored;
    ASSERT_TRUE(restored.restore(original.snapshot()).is_ok());

    EXPECT_EQ(restored.find(id).value().state, DeliveryState::Pending);
    auto next = restored.append(field_edit("job-1", "notes", "b", 3));
    ASSERT_TRUE(next.is_ok());
    EXPECT_GT(restored.find(next.value()).value().sequence, restored.find(id).value().sequence);
}

TEST(ChangeLogTest, CollectedIdsAreNotReusedAfterRestore) {
    ChangeLog original{50, std::chrono::milliseconds(0)};
    auto first = original.append(field_edit("job-1", "notes", "a", 1)).value();
    ASSERT_TRUE(original.mark_in_flight(first, 2).is_ok());
    ASSERT_TRUE(original.mark_delivered(first, 3).is_ok());
    ASSERT_EQ(original.collect_garbage(10), 1u);
    ASSERT_EQ(original.size(), 0u);

    ChangeLog restored;
    ASSERT_TRUE(restored.restore(original.snapshot(), original.next_sequence()).is_ok());
    auto second = restored.append(field_edit("job-1", "notes", "b", 20));

    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(second.value(), first);
    EXPECT_EQ(restored.next_sequence(), original.next_sequence() + 1);
}

TEST(ChangeLogTest, ConcurrentWritersAndDrainer) {
    ChangeLog log{1000};
    std::atomic<bool> stop{false};

    std::thread drainer([&]() {
        while (!stop.load()) {
            for (const auto& entry : log.drain("job-0")) {
                EXPECT_TRUE(log.mark_delivered(entry.entry_id, 1).is_ok());
            }
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&log, t]() {
            for (int i = 0; i < 100; ++i) {
                auto appended = log.append(field_edit("job-" + std::to_string(i % 2), "notes",
                                                      std::to_string(t) + ":" + std::to_string(i), i));
                EXPECT_TRUE(appended.is_ok());
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    stop.store(true);
    drainer.join();

    EXPECT_EQ(log.size(), 400u);
}
