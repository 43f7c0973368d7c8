#pragma once

#include <chrono>
#include <cstddef>
#include <functional>

#include "backoff.hpp"
#include "cancellation.hpp"
#include "circuit_breaker.hpp"
#include "classify.hpp"
#include "config.hpp"
#include "rate_limiter.hpp"
#include "response.hpp"
#include "result.hpp"

namespace resilient_rest {

    /// @brief Performs one HTTP attempt. `attempt` counts from 1.
    using SendFunction = std::function<Result<Response>(std::size_t attempt)>;

    /// @brief Final outcome of a retried exchange.
    struct ExecutionReport {
        AttemptOutcome outcome;
        std::size_t attempts{0};
        std::chrono::milliseconds elapsed{0};
    };

    /**
     * @brief Bounded retries with exponential backoff and jitter.
     *
     * Makes at most max_retries + 1 attempts. Between attempts it sleeps on
     * the caller's CancellationToken, so a cancel ends the wait at once.
     * Retries are paced by the rate limiter and skipped once the shared
     * breaker has opened. The executor never records on the breaker; the
     * caller does that once for the whole logical call.
     */
    class RetryExecutor {
       public:
        RetryExecutor(RetryConfiguration cfg, CircuitBreaker& breaker,
                      RateLimiter& limiter, Jitter& jitter);

        /**
         * @brief Run `send` until an attempt succeeds, turns pending, fails
         * terminally, or the retry budget runs out.
         * @param idempotent Whether ambiguous network failures are retried.
         */
        ExecutionReport run(bool idempotent, const SendFunction& send,
                            const CancellationToken& token = {}) const;

        const RetryConfiguration& config() const noexcept { return cfg_; }

       private:
        RetryConfiguration cfg_;
        CircuitBreaker& breaker_;
        RateLimiter& limiter_;
        Jitter& jitter_;
    };

}  // namespace resilient_rest
