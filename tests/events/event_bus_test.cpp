#include "dvc/events/event_bus.hpp"
#include "dvc/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using dvc::events::BranchCheckedOutEvent;
using dvc::events::BranchCreatedEvent;
using dvc::events::BranchDeletedEvent;
using dvc::events::EventBus;

TEST(EventBusTest, DeliversBranchEventToSubscriber) {
    EventBus bus;

    std::vector<std::string> created;
    bus.subscribe<BranchCreatedEvent>([&](const BranchCreatedEvent& e) {
        created.push_back(e.name + "@" + e.commit);
    });

    bus.emit(BranchCreatedEvent{"feature/login", "abc123"});

    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(created[0], "feature/login@abc123");
}

TEST(EventBusTest, RoutesByEventType) {
    EventBus bus;

    int created = 0;
    int deleted = 0;
    bus.subscribe<BranchCreatedEvent>([&](const BranchCreatedEvent&) { ++created; });
    bus.subscribe<BranchDeletedEvent>([&](const BranchDeletedEvent& e) {
        EXPECT_TRUE(e.forced);
        ++deleted;
    });

    bus.emit(BranchCreatedEvent{"a", "1"});
    bus.emit(BranchDeletedEvent{"a", "1", true});
    bus.emit(BranchCreatedEvent{"b", "1"});

    EXPECT_EQ(created, 2);
    EXPECT_EQ(deleted, 1);
}

TEST(EventBusTest, UnsubscribedHandlerStopsReceiving) {
    EventBus bus;

    int checkouts = 0;
    auto id = bus.subscribe<BranchCheckedOutEvent>([&](const BranchCheckedOutEvent&) { ++checkouts; });
    bus.emit(BranchCheckedOutEvent{"main", std::nullopt});

    bus.unsubscribe<BranchCheckedOutEvent>(id);
    bus.emit(BranchCheckedOutEvent{"dev", std::string("main")});

    EXPECT_EQ(checkouts, 1);
    EXPECT_EQ(bus.subscriber_count<BranchCheckedOutEvent>(), 0u);
}

TEST(EventBusTest, UnsubscribeUnknownIdIsHarmless) {
    EventBus bus;
    bus.subscribe<BranchCreatedEvent>([](const BranchCreatedEvent&) {});

    bus.unsubscribe<BranchCreatedEvent>(9999);
    bus.unsubscribe<BranchDeletedEvent>(0);

    EXPECT_EQ(bus.subscriber_count<BranchCreatedEvent>(), 1u);
    EXPECT_NO_THROW(bus.emit(BranchDeletedEvent{"x", "1"}));
}

TEST(EventBusTest, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int delivered = 0;
    bus.subscribe<BranchCreatedEvent>([&](const BranchCreatedEvent&) { ++delivered; });
    bus.subscribe<BranchCreatedEvent>([](const BranchCreatedEvent&) { throw std::runtime_error("sink offline"); });
    bus.subscribe<BranchCreatedEvent>([&](const BranchCreatedEvent&) { ++delivered; });

    EXPECT_NO_THROW(bus.emit(BranchCreatedEvent{"feature", "abc"}));
    EXPECT_EQ(delivered, 2);
}

TEST(EventBusTest, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int checkouts = 0;
    bus.subscribe<BranchCreatedEvent>([&](const BranchCreatedEvent&) {
        bus.subscribe<BranchCheckedOutEvent>([&](const BranchCheckedOutEvent&) { ++checkouts; });
    });

    bus.emit(BranchCreatedEvent{"feature", "abc"});
    bus.emit(BranchCheckedOutEvent{"feature", std::string("main")});

    EXPECT_EQ(checkouts, 1);
}

TEST(EventBusTest, ConcurrentBranchNotifications) {
    EventBus bus;
    std::atomic<int> created{0};
    bus.subscribe<BranchCreatedEvent>([&created](const BranchCreatedEvent&) { ++created; });

    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&bus, i]() {
            for (int j = 0; j < 25; ++j) {
                bus.emit(BranchCreatedEvent{"w" + std::to_string(i) + "/" + std::to_string(j), "abc"});
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_EQ(created.load(), 200);
}

TEST(EventBusTest, ClearDropsEverySubscription) {
    EventBus bus;
    bus.subscribe<BranchCreatedEvent>([](const BranchCreatedEvent&) {});
    bus.subscribe<BranchDeletedEvent>([](const BranchDeletedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<BranchCreatedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<BranchDeletedEvent>(), 0u);
}
