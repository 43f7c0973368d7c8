#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string_view>

#include "config.hpp"

namespace resilient_rest {

    /**
     * @brief Exponential backoff parameters.
     *
     * delay(attempt) = min(max_delay, base_delay * factor^attempt)
     *
     * With base=1s, factor=3, max=60s:
     *   attempt 0: 1s, 1: 3s, 2: 9s, 3: 27s, 4+: 60s
     */
    struct BackoffPolicy {
        std::chrono::milliseconds base_delay{1000};
        double factor{3.0};
        std::chrono::milliseconds max_delay{60000};
    };

    /// @brief Un-jittered delay for a 0-based attempt index. Non-decreasing in
    /// `attempt` and never above policy.max_delay.
    [[nodiscard]] std::chrono::milliseconds backoff_delay(
        const BackoffPolicy& policy, std::size_t attempt);

    /**
     * @brief Multiplies delays by a factor drawn from [min, max].
     *
     * Thread-safe; one instance is shared by every call on an engine.
     */
    class Jitter {
       public:
        explicit Jitter(const JitterConfiguration& cfg);
        Jitter(double min_factor, double max_factor);
        /// @brief Deterministic sequence, for tests.
        Jitter(double min_factor, double max_factor, std::uint32_t seed);

        Jitter(const Jitter&) = delete;
        Jitter& operator=(const Jitter&) = delete;

        [[nodiscard]] std::chrono::milliseconds apply(
            std::chrono::milliseconds delay);

        double min_factor() const noexcept { return min_; }
        double max_factor() const noexcept { return max_; }

       private:
        double min_;
        double max_;
        std::mutex mu_;
        std::mt19937 rng_;
    };

    /**
     * @brief Attempt bookkeeping shared by the retry loop and the 202 poller.
     *
     * Bounded either by a number of attempts (retries) or by wall-clock time
     * (polling), or both. Delays come from one BackoffPolicy + Jitter pair; a
     * server hint replaces the computed delay and is never shortened by
     * jitter.
     */
    class RetrySchedule {
       public:
        using clock = std::chrono::steady_clock;

        struct Limits {
            std::optional<std::size_t> max_attempts;
            std::optional<std::chrono::milliseconds> max_elapsed;
        };

        RetrySchedule(BackoffPolicy policy, Jitter& jitter, Limits limits,
                      clock::time_point started = clock::now());

        void record_attempt() noexcept { ++attempts_; }

        std::size_t attempts() const noexcept { return attempts_; }

        std::chrono::milliseconds elapsed() const;

        /// @brief Wall-clock budget left, when bounded by max_elapsed.
        std::optional<std::chrono::milliseconds> remaining() const;

        /// @brief True once either limit has been reached.
        bool exhausted() const;

        /// @brief Wait before the next attempt.
        /// Without a hint: jittered backoff_delay(attempts() - 1).
        /// With a hint: max(hint, jittered(hint)).
        /// Clamped to remaining() when time-bounded.
        std::chrono::milliseconds next_delay(
            std::optional<std::chrono::milliseconds> hint = std::nullopt);

       private:
        BackoffPolicy policy_;
        Jitter& jitter_;
        Limits limits_;
        clock::time_point started_;
        std::size_t attempts_{0};
    };

    /// @brief Longest wait a Retry-After value can express here. Larger or
    /// unrepresentable values are clamped to it.
    inline constexpr std::chrono::milliseconds kRetryAfterCeiling =
        std::chrono::hours(24 * 7);

    /// @brief Parse a Retry-After value: delta-seconds (fractions accepted)
    /// or an IMF-fixdate HTTP-date. Dates in the past yield zero; the result
    /// never exceeds kRetryAfterCeiling.
    [[nodiscard]] std::optional<std::chrono::milliseconds> parse_retry_after(
        std::string_view value);

}  // namespace resilient_rest
