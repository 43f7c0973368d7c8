#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>

#include "cancellation.hpp"
#include "config.hpp"
#include "result.hpp"

namespace resilient_rest {

    /**
     * @brief Token-bucket throttle.
     *
     * The bucket holds at most `burst_size` tokens and starts full. Tokens
     * refill continuously at `calls_per_second`. acquire() takes one token,
     * sleeping (outside the lock) until one is available.
     *
     * Disabled when `enabled` is false, or when the rate is zero, negative or
     * infinite: acquire() then returns immediately.
     *
     * SAFETY: all methods are thread-safe.
     */
    class RateLimiter {
       public:
        using clock = std::chrono::steady_clock;

        explicit RateLimiter(const RateLimitConfiguration& cfg);
        RateLimiter(double calls_per_second, std::size_t burst_size);

        RateLimiter(const RateLimiter&) = delete;
        RateLimiter& operator=(const RateLimiter&) = delete;

        /// @brief Block until a token is available, then consume it.
        /// @return The time spent waiting, or a Cancelled error if `token`
        /// stopped first (no token is consumed in that case).
        Result<std::chrono::nanoseconds> acquire(
            const CancellationToken& token = {});

        /// @brief Consume a token if one is available right now.
        bool try_acquire();

        /// @brief Tokens currently in the bucket, refill included.
        double available_tokens() const;

        bool enabled() const noexcept { return enabled_; }
        double calls_per_second() const noexcept { return rate_; }
        double capacity() const noexcept { return capacity_; }

       private:
        void refill_(clock::time_point now);

        bool enabled_;
        double rate_;
        double capacity_;

        mutable std::mutex mu_;
        double tokens_;
        clock::time_point last_refill_;
    };

}  // namespace resilient_rest
