#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "resilient_rest/logging.hpp"
#include "resilient_rest/rate_limiter.hpp"

using namespace resilient_rest;
using namespace std::chrono_literals;
using clock_type = std::chrono::steady_clock;

TEST(RateLimiterTest, BurstIsAvailableImmediately) {
    RateLimiter limiter(1.0, 3);
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_TRUE(limiter.try_acquire());
    EXPECT_FALSE(limiter.try_acquire());
}

TEST(RateLimiterTest, DisabledNeverWaits) {
    RateLimitConfiguration cfg;
    cfg.enabled = false;
    RateLimiter limiter(cfg);
    EXPECT_FALSE(limiter.enabled());
    for (int i = 0; i < 1000; ++i) {
        auto waited = limiter.acquire();
        ASSERT_TRUE(waited.has_value());
        EXPECT_EQ(waited.value(), std::chrono::nanoseconds::zero());
    }

    RateLimiter zero_rate(0.0, 1);
    EXPECT_FALSE(zero_rate.enabled());
    EXPECT_TRUE(zero_rate.try_acquire());
}

TEST(RateLimiterTest, PacesAfterTheBurst) {
    RateLimiter limiter(20.0, 1);
    const auto start = clock_type::now();
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(limiter.acquire().has_value());
    }
    // One free token, then five refills at 50 ms each.
    EXPECT_GE(clock_type::now() - start, 240ms);
}

TEST(RateLimiterTest, NoMoreThanRatePerRollingSecondAcrossThreads) {
    RateLimiter limiter(10.0, 1);
    std::vector<clock_type::time_point> grants;
    std::mutex mu;

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 4; ++i) {
                ASSERT_TRUE(limiter.acquire().has_value());
                std::lock_guard<std::mutex> lk(mu);
                grants.push_back(clock_type::now());
            }
        });
    }
    for (auto& w : workers) w.join();

    std::sort(grants.begin(), grants.end());
    ASSERT_EQ(grants.size(), 16u);
    // Burst of 1 plus 10/s: any window of one second holds at most 11.
    for (std::size_t i = 0; i < grants.size(); ++i) {
        std::size_t in_window = 0;
        for (std::size_t j = i; j < grants.size(); ++j) {
            if (grants[j] - grants[i] < 1s) ++in_window;
        }
        EXPECT_LE(in_window, 11u);
    }
}

TEST(RateLimiterTest, CancelEndsTheWait) {
    RateLimiter limiter(0.1, 1);
    ASSERT_TRUE(limiter.try_acquire());

    CancellationToken token;
    std::thread canceller([token] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });
    const auto start = clock_type::now();
    auto r = limiter.acquire(token);
    canceller.join();

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Cancelled);
    EXPECT_LT(clock_type::now() - start, 5s);
}

TEST(RateLimiterTest, DeadlineEndsTheWait) {
    RateLimiter limiter(0.1, 1);
    ASSERT_TRUE(limiter.try_acquire());
    auto r = limiter.acquire(CancellationToken::with_timeout(30ms));
    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Cancelled);
}

TEST(RateLimiterTest, VanishingRateBlocksInsteadOfSpinning) {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto capture = std::make_shared<spdlog::logger>("rate_limiter_test", sink);
    capture->set_level(spdlog::level::debug);
    log::set_logger(capture);

    RateLimiter limiter(1e-12, 1);
    ASSERT_TRUE(limiter.enabled());
    ASSERT_TRUE(limiter.try_acquire());

    const auto start = clock_type::now();
    auto r = limiter.acquire(CancellationToken::with_timeout(100ms));
    const auto waited = clock_type::now() - start;
    log::set_logger(nullptr);

    ASSERT_TRUE(r.has_error());
    EXPECT_EQ(r.error().code, Error::Code::Cancelled);
    EXPECT_GE(waited, 90ms);

    const std::string text = out.str();
    std::size_t waits = 0;
    for (auto pos = text.find("waiting"); pos != std::string::npos;
         pos = text.find("waiting", pos + 1)) {
        ++waits;
    }
    EXPECT_EQ(waits, 1u);
}
