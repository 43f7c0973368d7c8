#include "resilient_rest/rate_limiter.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        constexpr std::chrono::hours kMaxTokenWait{1};
    }  // namespace

    RateLimiter::RateLimiter(const RateLimitConfiguration& cfg)
        : RateLimiter(cfg.enabled ? cfg.calls_per_second : 0.0,
                      cfg.burst_size) {}

    RateLimiter::RateLimiter(double calls_per_second, std::size_t burst_size)
        : enabled_(calls_per_second > 0.0 && std::isfinite(calls_per_second)),
          rate_(calls_per_second),
          capacity_(static_cast<double>(std::max<std::size_t>(burst_size, 1))),
          tokens_(capacity_),
          last_refill_(clock::now()) {}

    void RateLimiter::refill_(clock::time_point now) {
        const std::chrono::duration<double> elapsed = now - last_refill_;
        if (elapsed.count() > 0) {
            tokens_ = std::min(capacity_, tokens_ + elapsed.count() * rate_);
            last_refill_ = now;
        }
    }

    Result<std::chrono::nanoseconds> RateLimiter::acquire(
        const CancellationToken& token) {
        if (!enabled_) {
            return Result<std::chrono::nanoseconds>::ok(
                std::chrono::nanoseconds::zero());
        }

        const auto started = clock::now();
        for (;;) {
            std::chrono::nanoseconds wait{};
            {
                std::lock_guard<std::mutex> lk(mu_);
                refill_(clock::now());
                if (tokens_ >= 1.0) {
                    tokens_ -= 1.0;
                    const auto waited = clock::now() - started;
                    return Result<std::chrono::nanoseconds>::ok(
                        std::chrono::duration_cast<std::chrono::nanoseconds>(
                            waited));
                }
                // Very low rates would overflow nanoseconds; sleep at most
                // kMaxTokenWait per round and re-check.
                const std::chrono::duration<double> needed(
                    (1.0 - tokens_) / rate_);
                wait = needed < kMaxTokenWait
                           ? std::chrono::ceil<std::chrono::nanoseconds>(needed)
                           : std::chrono::nanoseconds(kMaxTokenWait);
            }

            log::logger()->debug("Rate limit: waiting {:.3f}s for a token",
                                 static_cast<double>(wait.count()) / 1e9);
            if (!token.wait_for(wait)) {
                return Result<std::chrono::nanoseconds>::err(
                    Error::Code::Cancelled,
                    token.cancelled()
                        ? "Cancelled while waiting for the rate limiter"
                        : "Deadline exceeded while waiting for the rate limiter");
            }
        }
    }

    bool RateLimiter::try_acquire() {
        if (!enabled_) return true;
        std::lock_guard<std::mutex> lk(mu_);
        refill_(clock::now());
        if (tokens_ < 1.0) return false;
        tokens_ -= 1.0;
        return true;
    }

    double RateLimiter::available_tokens() const {
        std::lock_guard<std::mutex> lk(mu_);
        if (!enabled_) return capacity_;
        const std::chrono::duration<double> elapsed =
            clock::now() - last_refill_;
        return std::min(capacity_, tokens_ + std::max(0.0, elapsed.count()) * rate_);
    }

}  // namespace resilient_rest
