#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "resilient_rest/backoff.hpp"

using namespace resilient_rest;
using std::chrono::milliseconds;

TEST(BackoffTest, GrowsGeometricallyUpToTheCap) {
    BackoffPolicy policy{milliseconds(1000), 3.0, milliseconds(60000)};
    EXPECT_EQ(backoff_delay(policy, 0), milliseconds(1000));
    EXPECT_EQ(backoff_delay(policy, 1), milliseconds(3000));
    EXPECT_EQ(backoff_delay(policy, 2), milliseconds(9000));
    EXPECT_EQ(backoff_delay(policy, 3), milliseconds(27000));
    EXPECT_EQ(backoff_delay(policy, 4), milliseconds(60000));
    EXPECT_EQ(backoff_delay(policy, 5000), milliseconds(60000));
}

TEST(BackoffTest, NonDecreasingAndCapped) {
    BackoffPolicy policy{milliseconds(250), 1.7, milliseconds(20000)};
    milliseconds previous{0};
    for (std::size_t attempt = 0; attempt < 64; ++attempt) {
        auto d = backoff_delay(policy, attempt);
        EXPECT_GE(d, previous) << "attempt " << attempt;
        EXPECT_LE(d, policy.max_delay) << "attempt " << attempt;
        previous = d;
    }
}

TEST(JitterTest, UnitFactorsLeaveDelayUnchanged) {
    Jitter jitter(1.0, 1.0);
    EXPECT_EQ(jitter.apply(milliseconds(1234)), milliseconds(1234));
}

TEST(JitterTest, StaysWithinFactors) {
    Jitter jitter(0.8, 1.2, 42);
    for (int i = 0; i < 500; ++i) {
        auto d = jitter.apply(milliseconds(1000));
        EXPECT_GE(d, milliseconds(800));
        EXPECT_LE(d, milliseconds(1200));
    }
}

TEST(JitterTest, RejectsInvertedFactors) {
    EXPECT_THROW(Jitter(1.2, 0.8), std::invalid_argument);
    EXPECT_THROW(Jitter(-0.1, 1.0), std::invalid_argument);
}

TEST(RetryScheduleTest, AttemptLimit) {
    Jitter jitter(1.0, 1.0);
    RetrySchedule schedule({milliseconds(100), 2.0, milliseconds(1000)}, jitter,
                           {3, std::nullopt});
    EXPECT_FALSE(schedule.exhausted());
    schedule.record_attempt();
    EXPECT_EQ(schedule.next_delay(), milliseconds(100));
    schedule.record_attempt();
    EXPECT_EQ(schedule.next_delay(), milliseconds(200));
    schedule.record_attempt();
    EXPECT_TRUE(schedule.exhausted());
    EXPECT_FALSE(schedule.remaining().has_value());
}

TEST(RetryScheduleTest, HintTakesPrecedenceAndIsNeverShortened) {
    Jitter jitter(0.5, 0.9, 7);
    RetrySchedule schedule({milliseconds(100), 2.0, milliseconds(1000)}, jitter,
                           {5, std::nullopt});
    schedule.record_attempt();
    // Jitter below 1.0 must not cut into the server's hint.
    EXPECT_EQ(schedule.next_delay(milliseconds(5000)), milliseconds(5000));
}

TEST(RetryScheduleTest, WallClockBudgetClampsDelay) {
    Jitter jitter(1.0, 1.0);
    RetrySchedule schedule({milliseconds(5000), 1.0, milliseconds(5000)},
                           jitter, {std::nullopt, milliseconds(300)});
    schedule.record_attempt();
    auto d = schedule.next_delay();
    EXPECT_LE(d, milliseconds(300));
    EXPECT_FALSE(schedule.exhausted());

    RetrySchedule started_earlier(
        {milliseconds(100), 1.0, milliseconds(100)}, jitter,
        {std::nullopt, milliseconds(50)},
        RetrySchedule::clock::now() - milliseconds(60));
    EXPECT_TRUE(started_earlier.exhausted());
    EXPECT_EQ(started_earlier.remaining().value(), milliseconds(0));
}

TEST(RetryAfterTest, DeltaSeconds) {
    EXPECT_EQ(parse_retry_after("1").value_or(milliseconds(-1)), milliseconds(1000));
    EXPECT_EQ(parse_retry_after(" 120 ").value_or(milliseconds(-1)), milliseconds(120000));
    EXPECT_EQ(parse_retry_after("0.5").value_or(milliseconds(-1)), milliseconds(500));
}

TEST(RetryAfterTest, OverflowingSecondsClampToCeiling) {
    EXPECT_EQ(parse_retry_after("99999999999999999999").value_or(milliseconds(-1)),
              kRetryAfterCeiling);
    EXPECT_EQ(parse_retry_after("9223372036854775.807").value_or(milliseconds(-1)),
              kRetryAfterCeiling);
}

TEST(RetryAfterTest, UnrepresentableSecondsClampToCeiling) {
    const std::string huge(400, '9');
    EXPECT_NO_THROW((void)parse_retry_after(huge));
    EXPECT_EQ(parse_retry_after(huge).value_or(milliseconds(-1)),
              kRetryAfterCeiling);
}

TEST(RetryAfterTest, FarFutureDateClampsToCeiling) {
    EXPECT_EQ(parse_retry_after("Fri, 01 Jan 2100 00:00:00 GMT").value_or(milliseconds(-1)),
              kRetryAfterCeiling);
}

TEST(RetryAfterTest, Garbage) {
    EXPECT_FALSE(parse_retry_after("").has_value());
    EXPECT_FALSE(parse_retry_after("soon").has_value());
    EXPECT_FALSE(parse_retry_after("1.2.3").has_value());
    EXPECT_FALSE(parse_retry_after("10s").has_value());
}

TEST(RetryAfterTest, HttpDateInThePastIsZero) {
    EXPECT_EQ(parse_retry_after("Wed, 21 Oct 2015 07:28:00 GMT").value_or(milliseconds(-1)), milliseconds(0));
}
