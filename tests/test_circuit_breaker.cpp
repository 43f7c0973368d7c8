#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <vector>

#include "resilient_rest/circuit_breaker.hpp"

using namespace resilient_rest;
using namespace std::chrono_literals;

namespace {
    CircuitBreakerConfiguration config(std::size_t threshold,
                                       std::chrono::milliseconds timeout) {
        CircuitBreakerConfiguration cfg;
        cfg.failure_threshold = threshold;
        cfg.timeout = timeout;
        return cfg;
    }
}  // namespace

TEST(CircuitBreakerTest, OpensAtThreshold) {
    CircuitBreaker breaker(config(3, 60s));
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_TRUE(breaker.allow());
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    EXPECT_FALSE(breaker.allow());
    EXPECT_TRUE(breaker.would_reject());
    EXPECT_EQ(breaker.metrics().opened.load(), 1u);
    EXPECT_EQ(breaker.metrics().rejected.load(), 1u);
}

TEST(CircuitBreakerTest, SuccessResetsConsecutiveCount) {
    CircuitBreaker breaker(config(3, 60s));
    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    EXPECT_EQ(breaker.consecutive_failures(), 0u);
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreakerTest, HalfOpenTrialSuccessCloses) {
    CircuitBreaker breaker(config(1, 50ms));
    breaker.record_failure();
    ASSERT_FALSE(breaker.allow());

    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(breaker.would_reject());
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(breaker.state(), CircuitState::HalfOpen);
    // Exactly one trial at a time.
    EXPECT_FALSE(breaker.allow());

    breaker.record_success();
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(breaker.metrics().closed.load(), 1u);
}

TEST(CircuitBreakerTest, HalfOpenTrialFailureReopens) {
    CircuitBreaker breaker(config(2, 50ms));
    breaker.record_failure();
    breaker.record_failure();
    std::this_thread::sleep_for(80ms);
    ASSERT_TRUE(breaker.allow());

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    EXPECT_FALSE(breaker.allow());
    EXPECT_EQ(breaker.metrics().opened.load(), 2u);
}

TEST(CircuitBreakerTest, LateSuccessDoesNotCloseOpenCircuit) {
    CircuitBreaker breaker(config(1, 60s));
    breaker.record_failure();
    breaker.record_success();
    EXPECT_EQ(breaker.state(), CircuitState::Open);
}

TEST(CircuitBreakerTest, AbandonedTrialIsReplacedAfterTimeout) {
    CircuitBreaker breaker(config(1, 40ms));
    breaker.record_failure();
    std::this_thread::sleep_for(60ms);
    ASSERT_TRUE(breaker.allow());
    ASSERT_FALSE(breaker.allow());
    std::this_thread::sleep_for(60ms);
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(breaker.metrics().trials.load(), 2u);
}

TEST(CircuitBreakerTest, DisabledAlwaysAllows) {
    auto cfg = config(1, 60s);
    cfg.enabled = false;
    CircuitBreaker breaker(cfg);
    for (int i = 0; i < 10; ++i) breaker.record_failure();
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(breaker.state(), CircuitState::Closed);
}

TEST(CircuitBreakerTest, ConcurrentFailuresOpenOnce) {
    CircuitBreaker breaker(config(50, 60s));
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 25; ++i) breaker.record_failure();
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(breaker.state(), CircuitState::Open);
    EXPECT_EQ(breaker.metrics().opened.load(), 1u);
    EXPECT_EQ(breaker.consecutive_failures(), 200u);
}

TEST(CircuitStateTest, Names) {
    EXPECT_STREQ(to_string(CircuitState::HalfOpen), "HALF_OPEN");
    EXPECT_STREQ(to_string(CircuitState::Open), "OPEN");
}
