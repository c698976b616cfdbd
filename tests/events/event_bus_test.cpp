#include <gtest/gtest.h>
#include "orc/events/event_bus.hpp"
#include "orc/events/events.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace orc::events;

TEST(EventBus, DeliversEventToSubscriber) {
    EventBus bus;

    std::string received_entity;
    std::size_t received_pending = 0;

    bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent& e) {
        received_entity = e.entity_id;
        received_pending = e.pending_entries;
    });

    bus.emit(SyncStartedEvent{"pass-1", "job-7", 3});

    EXPECT_EQ(received_entity, "job-7");
    EXPECT_EQ(received_pending, 3u);
}

TEST(EventBus, EveryHandlerOfATypeRuns) {
    EventBus bus;

    int count = 0;
    bus.subscribe<QueueFullEvent>([&](const QueueFullEvent&) { count++; });
    bus.subscribe<QueueFullEvent>([&](const QueueFullEvent&) { count++; });
    bus.subscribe<QueueFullEvent>([&](const QueueFullEvent&) { count++; });

    bus.emit(QueueFullEvent{"job-1", 50});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int started = 0;
    int failed = 0;
    bus.subscribe<SyncStartedEvent>([&](const SyncStartedEvent&) { started++; });
    bus.subscribe<SyncFailedEvent>([&](const SyncFailedEvent&) { failed++; });

    bus.emit(SyncStartedEvent{"pass-1", "job-1", 0});
    bus.emit(SyncFailedEvent{"pass-1", "job-1", "TransportError: timeout", 2});
    bus.emit(SyncStartedEvent{"pass-2", "job-1", 0});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, UnsubscribedHandlerStopsReceiving) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ConnectivityChangedEvent>([&](const ConnectivityChangedEvent&) { count++; });

    bus.emit(ConnectivityChangedEvent{false});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<ConnectivityChangedEvent>(id);

    bus.emit(ConnectivityChangedEvent{true});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, EmitWithoutSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(EntityIdReassignedEvent{"tmp-1", "job-1"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<SyncCancelledEvent>([](const SyncCancelledEvent&) {
        throw std::runtime_error("banner widget gone");
    });
    bus.subscribe<SyncCancelledEvent>([&](const SyncCancelledEvent&) { after++; });

    EXPECT_NO_THROW(bus.emit(SyncCancelledEvent{"pass-1", "job-1", "connectivity lost"}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, ConcurrentSubscribe) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<SyncCompletedEvent>([&count](const SyncCompletedEvent&) { count++; });
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    bus.emit(SyncCompletedEvent{"pass-1", "job-1", 1, 0, std::chrono::milliseconds{5}});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmitFromPassThreads) {
    EventBus bus;
    std::atomic<std::size_t> pushed{0};

    bus.subscribe<SyncCompletedEvent>([&pushed](const SyncCompletedEvent& e) { pushed += e.entries_pushed; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus, i]() {
            bus.emit(SyncCompletedEvent{"pass-" + std::to_string(i), "job", 1, 0, std::chrono::milliseconds{1}});
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(pushed.load(), 100u);
}

TEST(EventBus, SubscriberCountAndClear) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 0u);

    auto first = bus.subscribe<ConflictDetectedEvent>([](const ConflictDetectedEvent&) {});
    bus.subscribe<ConflictDetectedEvent>([](const ConflictDetectedEvent&) {});
    bus.subscribe<ConflictResolvedEvent>([](const ConflictResolvedEvent&) {});
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 2u);

    bus.unsubscribe<ConflictDetectedEvent>(first);
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 1u);

    bus.clear();
    EXPECT_EQ(bus.subscriber_count<ConflictDetectedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ConflictResolvedEvent>(), 0u);
}
