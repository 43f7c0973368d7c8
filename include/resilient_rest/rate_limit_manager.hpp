#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config.hpp"
#include "headers.hpp"
#include "rate_limiter.hpp"

namespace resilient_rest {

    /// @brief Limits applied to URLs matching one pattern.
    struct EndpointLimits {
        double calls_per_second{10.0};
        std::size_t burst_size{1};
        /// Endpoints naming the same pool share one bucket.
        std::optional<std::string> shared_pool;
    };

    /// @brief Quota the server last reported through X-RateLimit-* headers.
    struct RateLimitSnapshot {
        long limit{0};
        long remaining{0};
        std::optional<long> reset;
    };

    /**
     * @brief Registry of per-endpoint rate limiters.
     *
     * A URL is matched against configured patterns: first an exact match on
     * its authority (`host` or `host:port`), then the first pattern, in
     * configuration order, contained anywhere in the URL. Unmatched URLs use
     * the default limits. Limiters are keyed by the pattern's shared pool if
     * it has one, else by the URL authority, and are created on first use.
     *
     * At most `max_tracked_keys` limiters (and as many reported snapshots)
     * are kept; beyond that the least recently used key is dropped. Callers
     * holding a dropped limiter keep it, the next lookup starts a fresh one.
     */
    class RateLimitManager {
       public:
        /// @throws std::invalid_argument if max_tracked_keys is 0.
        explicit RateLimitManager(RateLimitConfiguration defaults = {},
                                  std::size_t max_tracked_keys = 1024);

        RateLimitManager(const RateLimitManager&) = delete;
        RateLimitManager& operator=(const RateLimitManager&) = delete;

        /// @brief Add or replace the limits for `pattern`. Limiters already
        /// created keep their settings.
        void configure_endpoint(std::string pattern, EndpointLimits limits);

        /// @brief The limiter governing `url`.
        std::shared_ptr<RateLimiter> limiter_for(std::string_view url);

        /// @brief Record X-RateLimit-Limit / -Remaining (and -Reset) for
        /// `url`. Returns the snapshot when both counters were present.
        std::optional<RateLimitSnapshot> update_from_headers(
            std::string_view url, const Headers& headers);

        /// @brief Last snapshot recorded for the limiter key of `url`.
        std::optional<RateLimitSnapshot> last_reported(
            std::string_view url) const;

        std::size_t limiter_count() const;

        std::size_t max_tracked_keys() const noexcept { return max_keys_; }

       private:
        struct Match {
            EndpointLimits limits;
            std::string key;
        };

        template <typename T>
        struct Tracked {
            T value;
            std::chrono::steady_clock::time_point last_used;
        };

        Match match_(std::string_view url) const;

        RateLimitConfiguration defaults_;
        std::size_t max_keys_;

        mutable std::mutex mu_;
        std::vector<std::pair<std::string, EndpointLimits>> patterns_;
        std::unordered_map<std::string, Tracked<std::shared_ptr<RateLimiter>>>
            limiters_;
        std::unordered_map<std::string, Tracked<RateLimitSnapshot>> reported_;
    };

}  // namespace resilient_rest
