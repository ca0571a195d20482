#include "../common/handoff.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(Handoff, DeliversInOrderThenEndMarker) {
    Handoff<int> h;
    std::thread producer([&] {
        for (int i = 1; i <= 5; ++i) EXPECT_TRUE(h.publish(i));
        h.close();
    });

    std::vector<int> got;
    while (auto v = h.take()) got.push_back(*v);
    producer.join();

    EXPECT_EQ(got, (std::vector<int>{1, 2, 3, 4, 5}));
    EXPECT_TRUE(h.closed());
}

TEST(Handoff, HoldsAtMostOneUnconsumedItem) {
    Handoff<int> h;
    std::atomic<int> published{0};
    std::thread producer([&] {
        for (int i = 0; i < 3; ++i) {
            if (!h.publish(i)) break;
            published.fetch_add(1);
        }
        h.close();
    });

    // Producer fills the slot once, then blocks on the second publish
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(published.load(), 1);
    EXPECT_TRUE(h.pending());

    auto first = h.take();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0);

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(published.load(), 2);

    while (h.take()) {}
    producer.join();
    EXPECT_EQ(published.load(), 3);
}

TEST(Handoff, EmptyPayloadIsNotEndOfStream) {
    Handoff<std::string> h;
    std::thread producer([&] {
        h.publish(std::string());
        h.close();
    });

    auto v = h.take();
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(v->empty());
    EXPECT_FALSE(h.take().has_value());
    producer.join();
}

TEST(Handoff, CloseStillDeliversPendingItem) {
    Handoff<int> h;
    ASSERT_TRUE(h.publish(7));
    h.close();
    EXPECT_FALSE(h.publish(8));

    auto v = h.take();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(*v, 7);
    EXPECT_FALSE(h.take().has_value());
}

TEST(Handoff, CancelReleasesBlockedProducer) {
    Handoff<int> h;
    std::atomic<bool> second_result{true};
    std::thread producer([&] {
        h.publish(1);
        second_result.store(h.publish(2));  // blocks until cancel
    });

    std::this_thread::sleep_for(50ms);
    h.cancel();
    producer.join();

    EXPECT_FALSE(second_result.load());
    EXPECT_FALSE(h.take().has_value());
    EXPECT_FALSE(h.pending());
}
