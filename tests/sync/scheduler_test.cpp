#include "orc/sync/scheduler.hpp"
#include "sync/fake_transport.hpp"

#include <gtest/gtest.h>

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <future>
#include <thread>

using orc::EngineConfig;
using orc::events::EventBus;
using orc::model::Entity;
using orc::model::LifecycleStatus;
using orc::sync::ChangeLog;
using orc::sync::EntitySnapshotStore;
using orc::sync::SyncCoordinator;
using orc::sync::SyncScheduler;
using orc::test_support::FakeTransport;
using namespace std::chrono_literals;

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.device_id = "tablet-07";
        config.worker_threads = 2;
        coordinator = std::make_unique<SyncCoordinator>(config, transport, log, store, bus);

        Entity job;
        job.id = "job-1";
        job.status = LifecycleStatus::Assigned;
        job.fields["address"] = "Calle 13 455";
        transport.put(job);
        ASSERT_TRUE(store.commit(job, job).is_ok());
    }

    EngineConfig config;
    FakeTransport transport;
    ChangeLog log;
    EntitySnapshotStore store;
    EventBus bus;
    std::unique_ptr<SyncCoordinator> coordinator;
    boost::asio::io_context io;
};

TEST_F(SchedulerTest, BurstOfEditsRunsOneSweep) {
    SyncScheduler scheduler(io, *coordinator, 20ms);
    for (const auto* note : {"a", "b", "c"}) {
        ASSERT_TRUE(coordinator->record_field_update("job-1", "completion_notes", note).is_ok());
        scheduler.request_sync();
    }

    io.run();
    scheduler.stop();

    EXPECT_EQ(scheduler.passes_run(), 1u);
    EXPECT_EQ(transport.fetch_calls, 1);
    EXPECT_EQ(log.live_count(), 0u);
    EXPECT_EQ(transport.get("job-1").fields.at("completion_notes"), "c");
}

TEST_F(SchedulerTest, ReconnectRunsSweepImmediately) {
    SyncScheduler scheduler(io, *coordinator, 10s);
    scheduler.on_connectivity_changed(false);
    ASSERT_TRUE(coordinator->record_field_update("job-1", "signature_url", "sig://42").is_ok());

    scheduler.on_connectivity_changed(true);
    io.run();
    scheduler.stop();

    EXPECT_TRUE(coordinator->is_online());
    EXPECT_EQ(scheduler.passes_run(), 1u);
    EXPECT_EQ(transport.get("job-1").fields.at("signature_url"), "sig://42");
}

TEST_F(SchedulerTest, OfflineSweepIsSkipped) {
    SyncScheduler scheduler(io, *coordinator, 5ms);
    coordinator->set_online(false);
    ASSERT_TRUE(coordinator->record_field_update("job-1", "completion_notes", "x").is_ok());

    scheduler.request_sync();
    io.run();
    scheduler.stop();

    EXPECT_EQ(scheduler.passes_run(), 0u);
    EXPECT_EQ(transport.fetch_calls, 0);
    EXPECT_EQ(log.live_count(), 1u);
}

TEST_F(SchedulerTest, StoppedSchedulerIgnoresRequests) {
    SyncScheduler scheduler(io, *coordinator, 5ms);
    scheduler.stop();

    scheduler.request_sync();
    io.run();

    EXPECT_EQ(scheduler.passes_run(), 0u);
}

TEST_F(SchedulerTest, PeriodicSweepRepeats) {
    SyncScheduler scheduler(io, *coordinator, 1s);
    scheduler.start_periodic(10ms);

    io.run_for(200ms);
    scheduler.stop();
    io.restart();
    io.run();

    EXPECT_GE(scheduler.passes_run(), 2u);
}

TEST_F(SchedulerTest, SlowSweepDoesNotHoldTimerThread) {
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<bool> fetch_started{false};
    transport.on_fetch = [&]() {
        fetch_started.store(true);
        released.wait();
    };
    SyncScheduler scheduler(io, *coordinator, 1ms);
    ASSERT_TRUE(coordinator->record_field_update("job-1", "completion_notes", "slow link").is_ok());

    scheduler.request_sync();
    // Returns once the timer fired and the sweep was handed off, while the fetch is still blocked
    io.run();

    EXPECT_EQ(scheduler.passes_run(), 0u);
    while (!fetch_started.load()) {
        std::this_thread::sleep_for(1ms);
    }
    release.set_value();
    scheduler.stop();

    EXPECT_EQ(scheduler.passes_run(), 1u);
    EXPECT_EQ(transport.get("job-1").fields.at("completion_notes"), "slow link");
}
