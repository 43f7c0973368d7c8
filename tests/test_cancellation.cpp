#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "resilient_rest/cancellation.hpp"

using resilient_rest::CancellationToken;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, DefaultNeverStops) {
    CancellationToken token;
    EXPECT_FALSE(token.cancelled());
    EXPECT_FALSE(token.deadline_exceeded());
    EXPECT_FALSE(token.deadline().has_value());
    EXPECT_TRUE(token.wait_for(5ms));
}

TEST(CancellationTokenTest, CopiesShareCancellation) {
    CancellationToken token;
    CancellationToken copy = token;
    copy.cancel();
    EXPECT_TRUE(token.cancelled());
    EXPECT_TRUE(token.stop_requested());
    EXPECT_FALSE(token.wait_for(1s));
}

TEST(CancellationTokenTest, CancelWakesWaiter) {
    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    canceller.join();
}

TEST(CancellationTokenTest, DeadlineCutsWaitShort) {
    auto token = CancellationToken::with_timeout(50ms);
    const auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.wait_for(10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(token.deadline_exceeded());
    EXPECT_FALSE(token.cancelled());
    EXPECT_EQ(token.remaining().value(), CancellationToken::clock::duration::zero());
}
