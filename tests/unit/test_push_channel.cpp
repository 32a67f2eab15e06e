#include <gtest/gtest.h>
#include "mcphost/session.hpp"
#include <thread>

using namespace mcphost;

TEST(PushChannel, FifoDelivery) {
    PushChannel ch("s1");
    EXPECT_TRUE(ch.push("a"));
    EXPECT_TRUE(ch.push("b"));
    EXPECT_EQ(ch.pop(std::chrono::milliseconds(10)), "a");
    EXPECT_EQ(ch.pop(std::chrono::milliseconds(10)), "b");
    EXPECT_FALSE(ch.pop(std::chrono::milliseconds(10)).has_value());
    EXPECT_EQ(ch.session_id(), "s1");
}

TEST(PushChannel, PopWakesOnPush) {
    PushChannel ch("s1");
    std::thread producer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.push("late");
    });
    auto msg = ch.pop(std::chrono::seconds(5));
    producer.join();
    EXPECT_EQ(msg, "late");
}

TEST(PushChannel, CloseWakesConsumerAndRejectsPush) {
    PushChannel ch("s1");
    std::thread closer([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ch.close();
    });
    auto start = std::chrono::steady_clock::now();
    auto msg = ch.pop(std::chrono::seconds(5));
    closer.join();
    EXPECT_FALSE(msg.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_FALSE(ch.is_open());
    EXPECT_FALSE(ch.push("x"));
}

TEST(PushChannel, EventIdsIncrease) {
    PushChannel ch("s1");
    auto a = ch.next_event_id();
    auto b = ch.next_event_id();
    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
}
