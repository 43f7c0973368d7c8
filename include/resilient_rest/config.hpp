#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resilient_rest {

    class RequestInterceptor;

    /**
     * @brief Token-bucket throttle settings.
     */
    struct RateLimitConfiguration {
        /** @brief When false, acquire() never waits. */
        bool enabled{true};
        /** @brief Refill rate. Zero or negative disables the limiter. */
        double calls_per_second{10.0};
        /** @brief Bucket capacity. */
        std::size_t burst_size{1};
    };

    /**
     * @brief Failure-tracking state machine settings.
     */
    struct CircuitBreakerConfiguration {
        bool enabled{true};
        /** @brief Consecutive failures that open the circuit. */
        std::size_t failure_threshold{5};
        /** @brief How long the circuit stays open before one trial call. */
        std::chrono::milliseconds timeout{60000};
    };

    /**
     * @brief Bounded retry settings. A call makes at most max_retries + 1
     * attempts; the n-th retry waits
     * min(max_delay, base_delay * backoff_factor^(n-1)), jittered.
     */
    struct RetryConfiguration {
        std::size_t max_retries{5};
        double backoff_factor{3.0};
        std::chrono::milliseconds base_delay{1000};
        std::chrono::milliseconds max_delay{60000};
        /** @brief A server Retry-After hint longer than this ends the call. */
        std::chrono::milliseconds max_retry_after{300000};
    };

    /**
     * @brief Every computed delay is multiplied by a factor drawn uniformly
     * from [min_factor, max_factor]. 1.0/1.0 disables jitter.
     */
    struct JitterConfiguration {
        double min_factor{1.0};
        double max_factor{1.0};
    };

    /**
     * @brief Deferred-completion (HTTP 202) polling settings.
     */
    struct PollingConfiguration {
        /** @brief Wait between polls when the server gives no Retry-After. */
        std::chrono::milliseconds poll_interval{5000};
        /** @brief Total polling budget, measured from the 202. */
        std::chrono::milliseconds max_wait{300000};
    };

    /**
     * @brief Host-keyed transport cache settings.
     */
    struct SessionPoolConfiguration {
        /** @brief Maximum number of cached host sessions (LRU beyond). */
        std::size_t max_sessions{50};
        /** @brief Keep-alive connections kept per host session. */
        std::size_t max_idle_connections_per_session{10};
    };

    /**
     * @brief Everything a RequestEngine needs, fully resolved.
     */
    struct EngineConfiguration {
        /** @brief Optional base URL relative targets are resolved against. */
        std::optional<std::string> base_url;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"resilient_rest/1.0"};

        /** @brief Headers sent with every request; per-call headers win. */
        std::map<std::string, std::string> default_headers{
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
        };

        /** @brief Budget of a single HTTP attempt, connect included. */
        std::chrono::milliseconds request_timeout{60000};

        /** @brief Maximum size of response bodies in bytes. */
        size_t max_body_bytes{static_cast<size_t>(10) * 1024U * 1024U};

        /** @brief Whether to verify TLS certificates. */
        bool verify_tls{true};

        RateLimitConfiguration rate_limit;
        CircuitBreakerConfiguration circuit_breaker;
        RetryConfiguration retry;
        JitterConfiguration jitter;
        PollingConfiguration polling;
        SessionPoolConfiguration sessions;

        /** @brief Middleware interceptors, applied after header merging. */
        std::vector<std::shared_ptr<const RequestInterceptor>> interceptors;
    };

    /// @brief Reject inconsistent settings.
    /// @throws ConfigurationError naming the offending field.
    void validate_configuration(const EngineConfiguration& config);

}  // namespace resilient_rest
