#include "orc/sync/snapshot_store.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using orc::ErrorCode;
using orc::model::Entity;
using orc::sync::EntitySnapshotStore;

namespace {

Entity make_job(const std::string& id, const std::string& notes) {
    Entity job;
    job.id = id;
    job.fields["notes"] = notes;
    return job;
}

} // namespace

TEST(SnapshotStoreTest, KeepsServerAndLocalVersions) {
    EntitySnapshotStore store;
    ASSERT_TRUE(store.put_local(make_job("job-1", "device")).is_ok());
    EXPECT_TRUE(store.server("job-1").is_error());

    ASSERT_TRUE(store.commit(make_job("job-1", "server"), make_job("job-1", "merged")).is_ok());

    EXPECT_EQ(store.server("job-1").value().fields.at("notes"), "server");
    EXPECT_EQ(store.local("job-1").value().fields.at("notes"), "merged");
}

TEST(SnapshotStoreTest, CommitWithoutServerKeepsPreviousServer) {
    EntitySnapshotStore store;
    ASSERT_TRUE(store.commit(make_job("job-1", "server"), make_job("job-1", "merged")).is_ok());

    ASSERT_TRUE(store.commit(std::nullopt, make_job("job-1", "again")).is_ok());

    EXPECT_EQ(store.server("job-1").value().fields.at("notes"), "server");
    EXPECT_EQ(store.local("job-1").value().fields.at("notes"), "again");
}

TEST(SnapshotStoreTest, RejectsMismatchedIds) {
    EntitySnapshotStore store;

    auto result = store.commit(make_job("job-1", "s"), make_job("job-2", "m"));

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidState);
    EXPECT_FALSE(store.contains("job-2"));
}

TEST(SnapshotStoreTest, MissingEntityIsNotFound) {
    EntitySnapshotStore store;
    auto result = store.local("job-404");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}

TEST(SnapshotStoreTest, RekeyMovesTemporaryEntity) {
    EntitySnapshotStore store;
    ASSERT_TRUE(store.put_local(make_job("tmp-1", "draft")).is_ok());

    ASSERT_TRUE(store.rekey("tmp-1", "job-900").is_ok());

    EXPECT_FALSE(store.contains("tmp-1"));
    auto moved = store.local("job-900");
    ASSERT_TRUE(moved.is_ok());
    EXPECT_EQ(moved.value().id, "job-900");
    EXPECT_EQ(moved.value().fields.at("notes"), "draft");
}

TEST(SnapshotStoreTest, RekeyOntoExistingIdFails) {
    EntitySnapshotStore store;
    ASSERT_TRUE(store.put_local(make_job("tmp-1", "a")).is_ok());
    ASSERT_TRUE(store.put_local(make_job("job-1", "b")).is_ok());

    EXPECT_TRUE(store.rekey("tmp-1", "job-1").is_error());
    EXPECT_TRUE(store.contains("tmp-1"));
}

TEST(SnapshotStoreTest, EntityIdsAreSorted) {
    EntitySnapshotStore store;
    ASSERT_TRUE(store.put_local(make_job("job-3", "")).is_ok());
    ASSERT_TRUE(store.put_local(make_job("job-1", "")).is_ok());
    ASSERT_TRUE(store.put_local(make_job("job-2", "")).is_ok());

    EXPECT_EQ(store.entity_ids(), (std::vector<std::string>{"job-1", "job-2", "job-3"}));
    EXPECT_EQ(store.size(), 3u);
}

TEST(SnapshotStoreTest, ConcurrentReadersAndWriters) {
    EntitySnapshotStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < 50; ++i) {
                const auto id = "job-" + std::to_string(t);
                EXPECT_TRUE(store.put_local(make_job(id, std::to_string(i))).is_ok());
                EXPECT_TRUE(store.local(id).is_ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(store.size(), 8u);
}
