#include <gtest/gtest.h>

#include "ddsync/events/components.hpp"
#include "ddsync/events/event_bus.hpp"
#include "ddsync/events/events.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ddsync;
using namespace ddsync::events;

TEST(EventBus, DeliversToMatchingSubscribersOnly) {
    EventBus bus;

    uint64_t bytes = 0;
    int skipped = 0;
    bus.subscribe<ChunkTransferredEvent>([&](const ChunkTransferredEvent& e) { bytes += e.bytes; });
    bus.subscribe<FileSkippedEvent>([&](const FileSkippedEvent&) { skipped++; });

    bus.emit(ChunkTransferredEvent{"a.txt", 0, 2, 100, 1});
    bus.emit(ChunkTransferredEvent{"a.txt", 1, 2, 20, 1});
    bus.emit(FileSkippedEvent{"b.txt", 5});

    EXPECT_EQ(bytes, 120u);
    EXPECT_EQ(skipped, 1);
}

TEST(EventBus, EveryHandlerSeesTheEvent) {
    EventBus bus;
    std::vector<std::string> seen;

    bus.subscribe<ContainerReadyEvent>([&](const ContainerReadyEvent& e) { seen.push_back("first " + e.path); });
    bus.subscribe<ContainerReadyEvent>([&](const ContainerReadyEvent& e) { seen.push_back("second " + e.path); });

    bus.emit(ContainerReadyEvent{"docs", "d-1"});

    EXPECT_EQ(seen, (std::vector<std::string>{"first docs", "second docs"}));
}

TEST(EventBus, UnsubscribedHandlerIsNotCalled) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<FileSkippedEvent>([&](const FileSkippedEvent&) { count++; });
    bus.emit(FileSkippedEvent{"a", 1});
    bus.unsubscribe<FileSkippedEvent>(id);
    bus.emit(FileSkippedEvent{"a", 1});

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<FileSkippedEvent>(), 0u);
}

TEST(EventBus, ThrowingHandlerDoesNotStopOthers) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<NodeFailedEvent>([](const NodeFailedEvent&) { throw std::runtime_error("handler bug"); });
    bus.subscribe<NodeFailedEvent>([&](const NodeFailedEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(NodeFailedEvent{"x", content::NodeKind::File, Error::network("reset")}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, NonStandardThrowIsContained) {
    EventBus bus;

    int reached = 0;
    bus.subscribe<ChunkRetryEvent>([](const ChunkRetryEvent&) { throw 42; });
    bus.subscribe<ChunkRetryEvent>([&](const ChunkRetryEvent&) { reached++; });

    EXPECT_NO_THROW(bus.emit(ChunkRetryEvent{"upload chunk 0 of a.txt", 1, Error::network("reset"),
                                             std::chrono::milliseconds(100)}));
    EXPECT_EQ(reached, 1);
}

TEST(EventBus, ConcurrentEmitFromWorkers) {
    EventBus bus;
    std::atomic<uint64_t> bytes{0};
    bus.subscribe<ChunkTransferredEvent>([&bytes](const ChunkTransferredEvent& e) { bytes += e.bytes; });

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&bus]() {
            for (uint64_t chunk = 0; chunk < 50; ++chunk) {
                bus.emit(ChunkTransferredEvent{"big.bin", chunk, 50, 2, 1});
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(bytes.load(), 8u * 50u * 2u);
}

TEST(EventBus, ClearDropsAllSubscriptions) {
    EventBus bus;
    bus.subscribe<RunStartedEvent>([](const RunStartedEvent&) {});
    bus.subscribe<RunFinishedEvent>([](const RunFinishedEvent&) {});

    bus.clear();

    EXPECT_EQ(bus.subscriber_count<RunStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<RunFinishedEvent>(), 0u);
}

TEST(LoggerComponent, SubscribesForItsLifetime) {
    EventBus bus;
    {
        LoggerComponent logger(bus);
        EXPECT_EQ(bus.subscriber_count<RunStartedEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<ChunkRetryEvent>(), 1u);
        EXPECT_EQ(bus.subscriber_count<RunFinishedEvent>(), 1u);

        EXPECT_NO_THROW(bus.emit(RunStartedEvent{sync::Direction::Upload, "demo"}));
        EXPECT_NO_THROW(bus.emit(ContainerReadyEvent{"docs", ""}));
        EXPECT_NO_THROW(bus.emit(RunFinishedEvent{sync::Direction::Download, "demo"}));
    }
    EXPECT_EQ(bus.subscriber_count<RunStartedEvent>(), 0u);
    EXPECT_EQ(bus.subscriber_count<NodeFailedEvent>(), 0u);
}
