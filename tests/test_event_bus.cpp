// =============================================================================
// Unit tests for EventBus (src/event_bus.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>
#include "event_bus.hpp"

using namespace pilot;

// ---------------------------------------------------------------------------
// Basic subscribe + publish
// ---------------------------------------------------------------------------
TEST(EventBusTest, SubscribeAndPublish) {
    EventBus bus;
    int received_count = 0;
    std::string received_state;

    auto sub = bus.subscribe<SessionStateEvent>(
        [&](const SessionStateEvent& e) {
            received_count++;
            received_state = e.new_state;
        });

    SessionStateEvent ev;
    ev.device_id = "R58M123";
    ev.old_state = "Stopped";
    ev.new_state = "Starting";
    bus.publish(ev);

    EXPECT_EQ(received_count, 1);
    EXPECT_EQ(received_state, "Starting");
}

// ---------------------------------------------------------------------------
// Multiple subscribers for the same event
// ---------------------------------------------------------------------------
TEST(EventBusTest, MultipleSubscribers) {
    EventBus bus;
    int count_a = 0;
    int count_b = 0;

    auto sub_a = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_a++; });
    auto sub_b = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count_b++; });

    bus.publish(ShutdownEvent{});

    EXPECT_EQ(count_a, 1);
    EXPECT_EQ(count_b, 1);
}

// ---------------------------------------------------------------------------
// Unsubscribe via RAII handle destruction
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeOnHandleDestruction) {
    EventBus bus;
    int count = 0;

    {
        auto sub = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        bus.publish(ShutdownEvent{});
        EXPECT_EQ(count, 1);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, SubscriberCount) {
    EventBus bus;
    EXPECT_EQ(bus.subscriberCount<CommandRejectedEvent>(), 0u);

    {
        auto a = bus.subscribe<CommandRejectedEvent>([](const CommandRejectedEvent&) {});
        auto b = bus.subscribe<CommandRejectedEvent>([](const CommandRejectedEvent&) {});
        EXPECT_EQ(bus.subscriberCount<CommandRejectedEvent>(), 2u);
        EXPECT_EQ(bus.subscriberCount<ShutdownEvent>(), 0u);
    }

    EXPECT_EQ(bus.subscriberCount<CommandRejectedEvent>(), 0u);
}

TEST(EventBusTest, PublishReportsHandlersRun) {
    EventBus bus;
    EXPECT_EQ(bus.publish(ShutdownEvent{}), 0u);
    auto a = bus.subscribe<ShutdownEvent>([](const ShutdownEvent&) {});
    auto b = bus.subscribe<ShutdownEvent>([](const ShutdownEvent&) {});
    EXPECT_EQ(bus.publish(ShutdownEvent{}), 2u);
}

// ---------------------------------------------------------------------------
// Different event types are independent
// ---------------------------------------------------------------------------
TEST(EventBusTest, EventTypeIsolation) {
    EventBus bus;
    int rejected = 0;
    int discovery = 0;

    auto sub1 = bus.subscribe<CommandRejectedEvent>(
        [&](const CommandRejectedEvent&) { rejected++; });
    auto sub2 = bus.subscribe<DiscoveryStatusEvent>(
        [&](const DiscoveryStatusEvent&) { discovery++; });

    CommandRejectedEvent ev;
    ev.device_id = "R58M123";
    ev.command = "start";
    ev.reason = "AlreadyActive";
    bus.publish(ev);

    EXPECT_EQ(rejected, 1);
    EXPECT_EQ(discovery, 0);
}

TEST(EventBusTest, ResetUnsubscribesEarly) {
    EventBus bus;
    int count = 0;

    auto sub = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { count++; });
    EXPECT_TRUE(sub.active());
    sub.reset();
    EXPECT_FALSE(sub.active());
    sub.reset();

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 0);
}

TEST(EventBusTest, HandleMayOutliveBus) {
    SubscriptionHandle sub;
    {
        EventBus bus;
        sub = bus.subscribe<ShutdownEvent>([](const ShutdownEvent&) {});
        EXPECT_TRUE(sub.active());
    }
    EXPECT_FALSE(sub.active());
    // Destroying the handle after the bus is gone is a no-op
    sub = SubscriptionHandle();
}

// ---------------------------------------------------------------------------
// Handler exception does not crash bus or prevent other handlers
// ---------------------------------------------------------------------------
TEST(EventBusTest, HandlerExceptionIsCaught) {
    EventBus bus;
    int good_count = 0;

    auto sub1 = bus.subscribe<ShutdownEvent>(
        [](const ShutdownEvent&) { throw std::runtime_error("boom"); });
    auto sub2 = bus.subscribe<ShutdownEvent>(
        [&](const ShutdownEvent&) { good_count++; });

    EXPECT_NO_THROW(bus.publish(ShutdownEvent{}));
    EXPECT_EQ(good_count, 1);
}

TEST(EventBusTest, HandleMoveSemantic) {
    EventBus bus;
    int count = 0;

    SubscriptionHandle outer;
    {
        auto inner = bus.subscribe<ShutdownEvent>(
            [&](const ShutdownEvent&) { count++; });
        outer = std::move(inner);
    }

    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

// ---------------------------------------------------------------------------
// A handler may unsubscribe itself while being invoked
// ---------------------------------------------------------------------------
TEST(EventBusTest, UnsubscribeFromInsideHandler) {
    EventBus bus;
    int count = 0;
    SubscriptionHandle sub;

    sub = bus.subscribe<ShutdownEvent>([&](const ShutdownEvent&) {
        count++;
        sub = SubscriptionHandle();
    });

    bus.publish(ShutdownEvent{});
    bus.publish(ShutdownEvent{});
    EXPECT_EQ(count, 1);
}

TEST(EventBusTest, SubscribeFromInsideHandler) {
    EventBus bus;
    int late = 0;
    std::vector<SubscriptionHandle> added;

    auto sub = bus.subscribe<ShutdownEvent>([&](const ShutdownEvent&) {
        added.push_back(bus.subscribe<ShutdownEvent>([&](const ShutdownEvent&) { late++; }));
    });

    // The new handler joins from the next publish on
    EXPECT_EQ(bus.publish(ShutdownEvent{}), 1u);
    EXPECT_EQ(late, 0);
    bus.publish(ShutdownEvent{});
    EXPECT_EQ(late, 1);
}

TEST(EventBusTest, ConcurrentPublishers) {
    EventBus bus;
    std::atomic<int> count{0};
    auto sub = bus.subscribe<DiscoveryStatusEvent>(
        [&](const DiscoveryStatusEvent&) { count++; });

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&bus] {
            for (int i = 0; i < 250; i++) bus.publish(DiscoveryStatusEvent{});
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(count.load(), 1000);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
