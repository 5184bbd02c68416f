#include <gtest/gtest.h>
#include "chunkflow/events/event_bus.hpp"
#include "chunkflow/events/events.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace chunkflow::events;

TEST(EventBus, SubscribeAndEmit) {
    EventBus bus;

    bool handler_called = false;
    std::uint64_t received_size = 0;

    bus.subscribe<TransferCompleted>([&](const TransferCompleted& e) {
        handler_called = true;
        received_size = e.size_bytes;
    });

    TransferCompleted event;
    event.destination = "libs/a.jar";
    event.size_bytes = 42;
    bus.emit(event);

    EXPECT_TRUE(handler_called);
    EXPECT_EQ(received_size, 42u);
}

TEST(EventBus, MultipleSubscribers) {
    EventBus bus;

    int count = 0;

    bus.subscribe<TransferStarted>([&](const TransferStarted&) { count++; });
    bus.subscribe<TransferStarted>([&](const TransferStarted&) { count++; });
    bus.subscribe<TransferStarted>([&](const TransferStarted&) { count++; });

    bus.emit(TransferStarted{"a.bin", 1, 1, false});

    EXPECT_EQ(count, 3);
}

TEST(EventBus, DifferentEventTypes) {
    EventBus bus;

    int started = 0;
    int failed = 0;

    bus.subscribe<TransferStarted>([&](const TransferStarted&) { started++; });
    bus.subscribe<TransferFailed>([&](const TransferFailed&) { failed++; });

    bus.emit(TransferStarted{"a.bin", 1, 1, false});
    bus.emit(TransferFailed{"a.bin", chunkflow::ErrorKind::TransportExhausted, 3, "HTTP 500"});
    bus.emit(TransferStarted{"b.bin", 1, 1, false});

    EXPECT_EQ(started, 2);
    EXPECT_EQ(failed, 1);
}

TEST(EventBus, Unsubscribe) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<AttemptFailed>([&](const AttemptFailed&) { count++; });

    bus.emit(AttemptFailed{"a.bin", 1, 503, "busy"});
    EXPECT_EQ(count, 1);

    bus.unsubscribe<AttemptFailed>(id);

    bus.emit(AttemptFailed{"a.bin", 2, 503, "busy"});
    EXPECT_EQ(count, 1);
}

TEST(EventBus, NoSubscribers) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(ArchiveFailed{"out.zip", chunkflow::ErrorKind::IoError, "disk full"}));
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int after = 0;
    bus.subscribe<ArchiveFailed>([](const ArchiveFailed&) {
        throw std::runtime_error("handler failure");
    });
    bus.subscribe<ArchiveFailed>([&](const ArchiveFailed&) { after++; });

    EXPECT_NO_THROW(bus.emit(ArchiveFailed{"out.zip", chunkflow::ErrorKind::IoError, "disk full"}));
    EXPECT_EQ(after, 1);
}

TEST(EventBus, HandlerMaySubscribeDuringEmit) {
    EventBus bus;

    int late_calls = 0;
    bus.subscribe<ProgressUpdated>([&](const ProgressUpdated&) {
        bus.subscribe<ProgressUpdated>([&](const ProgressUpdated&) { late_calls++; });
    });

    bus.emit(ProgressUpdated{"a.bin", 1, 10});
    EXPECT_EQ(late_calls, 0);
    EXPECT_EQ(bus.subscriber_count<ProgressUpdated>(), 2u);
}

TEST(EventBus, ThreadSafety) {
    EventBus bus;
    std::atomic<int> count{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&bus, &count]() {
            bus.subscribe<TransferStarted>([&count](const TransferStarted&) {
                count++;
            });
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    bus.emit(TransferStarted{"a.bin", 1, 1, false});

    EXPECT_EQ(count, 10);
}

TEST(EventBus, ConcurrentEmit) {
    EventBus bus;
    std::atomic<std::uint64_t> bytes{0};

    bus.subscribe<TransferCompleted>([&bytes](const TransferCompleted& e) {
        bytes += e.size_bytes;
    });

    std::vector<std::thread> threads;
    for (int i = 0; i < 100; ++i) {
        threads.emplace_back([&bus]() {
            TransferCompleted event;
            event.size_bytes = 1;
            bus.emit(event);
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes, 100u);
}

TEST(EventBus, SubscriberCount) {
    EventBus bus;

    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 0u);

    auto id1 = bus.subscribe<TransferStarted>([](const TransferStarted&) {});
    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 1u);

    bus.subscribe<TransferStarted>([](const TransferStarted&) {});
    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 2u);

    bus.unsubscribe<TransferStarted>(id1);
    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 1u);
}

TEST(EventBus, Clear) {
    EventBus bus;

    bus.subscribe<TransferStarted>([](const TransferStarted&) {});
    bus.subscribe<ArchiveCompleted>([](const ArchiveCompleted&) {});

    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 1u);
    EXPECT_EQ(bus.subscriber_count<ArchiveCompleted>(), 1u);

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<TransferStarted>(), 0u);
    EXPECT_EQ(bus.subscriber_count<ArchiveCompleted>(), 0u);
}
