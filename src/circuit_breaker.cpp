#include "resilient_rest/circuit_breaker.hpp"

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    CircuitBreaker::CircuitBreaker(CircuitBreakerConfiguration cfg,
                                   std::string name)
        : cfg_(cfg), name_(std::move(name)) {}

    bool CircuitBreaker::allow() {
        if (!cfg_.enabled) return true;

        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock::now();
        switch (state_) {
            case CircuitState::Closed:
                return true;

            case CircuitState::Open:
                if (opened_at_ && now - *opened_at_ >= cfg_.timeout) {
                    state_ = CircuitState::HalfOpen;
                    trial_started_at_ = now;
                    metrics_.trials.fetch_add(1, std::memory_order_relaxed);
                    log::logger()->info(
                        "Circuit breaker '{}' HALF_OPEN, admitting one trial call",
                        name_);
                    return true;
                }
                break;

            case CircuitState::HalfOpen:
                if (!trial_started_at_ ||
                    now - *trial_started_at_ >= cfg_.timeout) {
                    trial_started_at_ = now;
                    metrics_.trials.fetch_add(1, std::memory_order_relaxed);
                    log::logger()->debug(
                        "Circuit breaker '{}' trial expired, admitting another",
                        name_);
                    return true;
                }
                break;
        }

        metrics_.rejected.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    void CircuitBreaker::record_success() {
        if (!cfg_.enabled) return;

        std::lock_guard<std::mutex> lk(mu_);
        // A late success from a call admitted before the circuit opened
        if (state_ == CircuitState::Open) return;

        if (state_ == CircuitState::HalfOpen) {
            state_ = CircuitState::Closed;
            opened_at_.reset();
            trial_started_at_.reset();
            metrics_.closed.fetch_add(1, std::memory_order_relaxed);
            log::logger()->info("Circuit breaker '{}' CLOSED after successful trial",
                                name_);
        }
        failures_ = 0;
    }

    void CircuitBreaker::record_failure() {
        if (!cfg_.enabled) return;

        std::lock_guard<std::mutex> lk(mu_);
        const auto now = clock::now();
        ++failures_;

        switch (state_) {
            case CircuitState::Closed:
                if (failures_ >= cfg_.failure_threshold) open_(now);
                break;
            case CircuitState::HalfOpen:
                open_(now);
                break;
            case CircuitState::Open:
                break;
        }
    }

    void CircuitBreaker::open_(clock::time_point now) {
        const bool from_trial = state_ == CircuitState::HalfOpen;
        state_ = CircuitState::Open;
        opened_at_ = now;
        trial_started_at_.reset();
        metrics_.opened.fetch_add(1, std::memory_order_relaxed);
        if (from_trial) {
            log::logger()->warn("Circuit breaker '{}' re-OPENED: trial call failed",
                                name_);
        } else {
            log::logger()->warn(
                "Circuit breaker '{}' OPEN after {} consecutive failures", name_,
                failures_);
        }
    }

    bool CircuitBreaker::would_reject() const {
        if (!cfg_.enabled) return false;
        std::lock_guard<std::mutex> lk(mu_);
        return state_ == CircuitState::Open && opened_at_ &&
               clock::now() - *opened_at_ < cfg_.timeout;
    }

    CircuitState CircuitBreaker::state() const {
        std::lock_guard<std::mutex> lk(mu_);
        return state_;
    }

    std::size_t CircuitBreaker::consecutive_failures() const {
        std::lock_guard<std::mutex> lk(mu_);
        return failures_;
    }

}  // namespace resilient_rest
