#include <gtest/gtest.h>
#include <pagecraft/interaction/DragEvent.h>

#include <stdexcept>
#include <vector>

using namespace pagecraft;

namespace {

DragEvent makeStart() {
    return {DragEventType::DragStart,
            DragStarted{DragItem::fromPanel(ComponentType::Row), {10, 20}},
            std::chrono::system_clock::now()};
}

}  // namespace

TEST(DragEventChannelTest, DispatchesOnlyMatchingType) {
    DragEventChannel channel;
    int starts = 0;
    int drops = 0;
    channel.subscribe(DragEventType::DragStart, [&](const DragEvent&) { ++starts; });
    channel.subscribe(DragEventType::Drop, [&](const DragEvent&) { ++drops; });

    channel.emit(makeStart());

    EXPECT_EQ(starts, 1);
    EXPECT_EQ(drops, 0);
}

TEST(DragEventChannelTest, ListenersRunInSubscriptionOrder) {
    DragEventChannel channel;
    std::vector<int> calls;
    channel.subscribe(DragEventType::DragStart, [&](const DragEvent&) { calls.push_back(1); });
    channel.subscribe(DragEventType::DragStart, [&](const DragEvent&) { calls.push_back(2); });

    channel.emit(makeStart());

    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
}

TEST(DragEventChannelTest, ThrowingListenerDoesNotStopOthers) {
    DragEventChannel channel;
    bool laterCalled = false;
    channel.subscribe(DragEventType::DragStart, [](const DragEvent&) {
        throw std::runtime_error("listener failure");
    });
    channel.subscribe(DragEventType::DragStart, [](const DragEvent&) { throw 42; });
    channel.subscribe(DragEventType::DragStart, [&](const DragEvent&) { laterCalled = true; });

    EXPECT_NO_THROW(channel.emit(makeStart()));
    EXPECT_TRUE(laterCalled);
}

TEST(DragEventChannelTest, UnsubscribeRemovesListener) {
    DragEventChannel channel;
    int calls = 0;
    auto id = channel.subscribe(DragEventType::DragStart, [&](const DragEvent&) { ++calls; });

    EXPECT_EQ(channel.listenerCount(DragEventType::DragStart), 1u);
    EXPECT_TRUE(channel.unsubscribe(id));
    EXPECT_FALSE(channel.unsubscribe(id));
    channel.emit(makeStart());

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(channel.listenerCount(DragEventType::DragStart), 0u);
}

TEST(DragEventChannelTest, EventExposesItemOfAnyPayload) {
    DragEvent event = makeStart();
    EXPECT_EQ(event.item().type, ComponentType::Row);
    EXPECT_TRUE(event.item().isFromPanel);

    auto existing = ComponentRecord::create("b1", ComponentType::Button, "c1");
    DragEvent ended{DragEventType::DragEnd, DragEnded{DragItem::existing(existing), "cancelled"},
                    std::chrono::system_clock::now()};
    EXPECT_EQ(ended.item().id, "b1");
    EXPECT_FALSE(ended.item().isFromPanel);
    EXPECT_STREQ(dragEventTypeToString(ended.type), "drag_end");
}
