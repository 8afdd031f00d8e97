#include "usync/events/event_bus.hpp"
#include "usync/events/events.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace usync::events;
using usync::metadata::ChangeSummary;
using usync::metadata::TransferDirection;

TEST(EventBus, DeliversEventToSubscriber) {
    EventBus bus;

    std::string folder;
    std::uint64_t version = 0;
    bus.subscribe<FolderIndexedEvent>([&](const FolderIndexedEvent& e) {
        folder = e.folder_id;
        version = e.version;
    });

    bus.emit(FolderIndexedEvent("photos", 3, ChangeSummary{1, 0, 0}, 2));

    EXPECT_EQ(folder, "photos");
    EXPECT_EQ(version, 3u);
}

TEST(EventBus, RoutesByEventType) {
    EventBus bus;

    int packs = 0;
    int segments = 0;
    bus.subscribe<PackPostedEvent>([&](const PackPostedEvent&) { packs++; });
    bus.subscribe<SegmentCompletedEvent>([&](const SegmentCompletedEvent&) { segments++; });

    bus.emit(PackPostedEvent("s1", "loc-1", 3, 4096));
    bus.emit(SegmentCompletedEvent("s1", "seg-a", TransferDirection::Upload, 100));
    bus.emit(SegmentCompletedEvent("s1", "seg-b", TransferDirection::Upload, 100));

    EXPECT_EQ(packs, 1);
    EXPECT_EQ(segments, 2);
}

TEST(EventBus, UnsubscribeStopsDelivery) {
    EventBus bus;

    int count = 0;
    auto id = bus.subscribe<ShareCreatedEvent>([&](const ShareCreatedEvent&) { count++; });

    bus.emit(ShareCreatedEvent("docs", 1, usync::metadata::ShareType::Public));
    bus.unsubscribe<ShareCreatedEvent>(id);
    bus.emit(ShareCreatedEvent("docs", 2, usync::metadata::ShareType::Public));

    EXPECT_EQ(count, 1);
    EXPECT_EQ(bus.subscriber_count<ShareCreatedEvent>(), 0u);
}

TEST(EventBus, EmitWithoutSubscribersIsHarmless) {
    EventBus bus;
    EXPECT_NO_THROW(bus.emit(ManifestPublishedEvent("docs", 1, "loc", 10)));
}

TEST(EventBus, ThrowingHandlerDoesNotReachEmitter) {
    EventBus bus;

    int later = 0;
    bus.subscribe<SegmentFailedEvent>([](const SegmentFailedEvent&) {
        throw std::runtime_error("handler exploded");
    });
    bus.subscribe<SegmentFailedEvent>([&](const SegmentFailedEvent&) { later++; });

    EXPECT_NO_THROW(bus.emit(SegmentFailedEvent("s1", "seg", "a.bin", 0, 1, "busy", false)));
    EXPECT_EQ(later, 1);
}

TEST(EventBus, HandlerMaySubscribeWhileEmitting) {
    EventBus bus;

    int nested = 0;
    bus.subscribe<SessionCompletedEvent>([&](const SessionCompletedEvent&) {
        bus.subscribe<SessionCompletedEvent>([&](const SessionCompletedEvent&) { nested++; });
    });

    bus.emit(SessionCompletedEvent("s1", TransferDirection::Download, 4, 0, std::chrono::milliseconds(5)));
    EXPECT_EQ(nested, 0);

    bus.emit(SessionCompletedEvent("s1", TransferDirection::Download, 4, 0, std::chrono::milliseconds(5)));
    EXPECT_EQ(nested, 1);
}

TEST(EventBus, ConcurrentEmitters) {
    EventBus bus;
    std::atomic<std::size_t> bytes{0};

    bus.subscribe<SegmentCompletedEvent>([&bytes](const SegmentCompletedEvent& e) { bytes += e.bytes; });

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&bus]() {
            for (int j = 0; j < 50; ++j) {
                bus.emit(SegmentCompletedEvent("s", "seg", TransferDirection::Download, 2));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(bytes.load(), 16u * 50u * 2u);
}
