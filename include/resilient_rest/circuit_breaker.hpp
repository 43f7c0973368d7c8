#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "config.hpp"

namespace resilient_rest {

    enum class CircuitState {
        Closed,   ///< Calls flow; consecutive failures are counted
        Open,     ///< Calls rejected without I/O until the timeout passes
        HalfOpen  ///< One trial call decides between Closed and Open
    };

    inline const char* to_string(CircuitState state) {
        switch (state) {
            case CircuitState::Closed:
                return "CLOSED";
            case CircuitState::Open:
                return "OPEN";
            case CircuitState::HalfOpen:
                return "HALF_OPEN";
        }
        return "UNKNOWN";
    }

    /// @brief Counters for monitoring breaker behavior.
    struct CircuitBreakerMetrics {
        std::atomic<std::uint64_t> rejected{0};  ///< allow() returned false
        std::atomic<std::uint64_t> opened{0};    ///< Transitions to Open
        std::atomic<std::uint64_t> closed{0};    ///< Recoveries to Closed
        std::atomic<std::uint64_t> trials{0};    ///< Half-open trials admitted
    };

    /**
     * Consecutive-failure circuit breaker.
     *
     * TRANSITIONS:
     * - Closed: a failure increments the counter; reaching failure_threshold
     *   opens the circuit. A success resets the counter.
     * - Open: allow() is false until `timeout` has passed since opening, then
     *   the breaker turns HalfOpen and admits exactly one trial.
     * - HalfOpen: trial success closes, trial failure re-opens with a fresh
     *   openedAt. A trial whose outcome is never recorded expires after one
     *   timeout and a new trial is admitted.
     *
     * SAFETY: allow(), record_success() and record_failure() are the only
     * mutators and run under one lock. A disabled breaker always allows.
     */
    class CircuitBreaker {
       public:
        using clock = std::chrono::steady_clock;

        explicit CircuitBreaker(CircuitBreakerConfiguration cfg,
                                std::string name = "default");

        CircuitBreaker(const CircuitBreaker&) = delete;
        CircuitBreaker& operator=(const CircuitBreaker&) = delete;

        /// @brief Whether a call may proceed. May move Open -> HalfOpen.
        [[nodiscard]] bool allow();

        void record_success();

        void record_failure();

        /// @brief Read-only: would a call be rejected right now because the
        /// circuit is open? Never transitions and never counts a rejection.
        [[nodiscard]] bool would_reject() const;

        CircuitState state() const;

        std::size_t consecutive_failures() const;

        const CircuitBreakerMetrics& metrics() const noexcept {
            return metrics_;
        }

        const CircuitBreakerConfiguration& config() const noexcept {
            return cfg_;
        }

        const std::string& name() const noexcept { return name_; }

       private:
        void open_(clock::time_point now);

        const CircuitBreakerConfiguration cfg_;
        const std::string name_;

        mutable std::mutex mu_;
        CircuitState state_{CircuitState::Closed};
        std::size_t failures_{0};
        std::optional<clock::time_point> opened_at_;
        std::optional<clock::time_point> trial_started_at_;

        CircuitBreakerMetrics metrics_;
    };

}  // namespace resilient_rest
