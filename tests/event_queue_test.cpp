#include <gtest/gtest.h>

#include "landrop/EventQueue.h"

#include <chrono>
#include <thread>

using namespace LanDrop;

TEST(EventQueueTest, DeliversInOrder) {
    EventQueue queue;
    queue.push(TransactionConfirmedEvent{"a"});
    queue.push(TransactionConfirmedEvent{"b"});

    auto first = queue.tryPop();
    auto second = queue.tryPop();
    ASSERT_TRUE(first && second);
    EXPECT_EQ(std::get<TransactionConfirmedEvent>(*first).id, "a");
    EXPECT_EQ(std::get<TransactionConfirmedEvent>(*second).id, "b");
    EXPECT_FALSE(queue.tryPop().has_value());
}

/**
 * @test Back-to-back peer snapshots collapse into the newest one
 */
TEST(EventQueueTest, CoalescesConsecutivePeersChanged) {
    EventQueue queue;
    PeersChangedEvent older;
    PeersChangedEvent newer;
    newer.peers.resize(2);

    queue.push(older);
    queue.push(newer);
    EXPECT_EQ(queue.size(), 1u);

    auto event = queue.tryPop();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<PeersChangedEvent>(*event).peers.size(), 2u);
}

TEST(EventQueueTest, DoesNotCoalesceAcrossOtherEvents) {
    EventQueue queue;
    queue.push(PeersChangedEvent{});
    queue.push(TransactionConfirmedEvent{"t1"});
    queue.push(PeersChangedEvent{});
    EXPECT_EQ(queue.size(), 3u);
}

TEST(EventQueueTest, PopTimesOut) {
    EventQueue queue;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop(std::chrono::milliseconds(50)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
}

TEST(EventQueueTest, PopWakesOnPushFromAnotherThread) {
    EventQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(TransactionConfirmedEvent{"late"});
    });

    auto event = queue.pop(std::chrono::seconds(5));
    producer.join();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(std::get<TransactionConfirmedEvent>(*event).id, "late");
}

TEST(EventQueueTest, ClosedQueueRejectsPushAndWakesWaiters) {
    EventQueue queue;
    std::thread closer([&queue]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.close();
    });

    EXPECT_FALSE(queue.pop(std::chrono::seconds(5)).has_value());
    closer.join();
    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.push(TransactionConfirmedEvent{"x"}));
}
