#include "resilient_rest/config.hpp"

#include <cmath>

#include "resilient_rest/exceptions.hpp"
#include "resilient_rest/url.hpp"

namespace resilient_rest {

    namespace {
        [[noreturn]] void reject(const char* key, const std::string& why) {
            throw ConfigurationError(key, std::string("Invalid configuration '") +
                                              key + "': " + why);
        }
    }  // namespace

    void validate_configuration(const EngineConfiguration& config) {
        if (config.base_url) {
            auto base = url_utils::parse_base_url(*config.base_url);
            if (base.has_error()) reject("base_url", base.error().message);
        }
        if (config.request_timeout.count() <= 0) {
            reject("request_timeout", "must be positive");
        }
        if (config.max_body_bytes == 0) {
            reject("max_body_bytes", "must be positive");
        }

        const auto& rl = config.rate_limit;
        if (rl.enabled && std::isnan(rl.calls_per_second)) {
            reject("rate_limit.calls_per_second", "must be a number");
        }
        if (rl.enabled && rl.burst_size == 0) {
            reject("rate_limit.burst_size", "must be at least 1");
        }

        const auto& cb = config.circuit_breaker;
        if (cb.enabled && cb.failure_threshold == 0) {
            reject("circuit_breaker.failure_threshold", "must be at least 1");
        }
        if (cb.enabled && cb.timeout.count() < 0) {
            reject("circuit_breaker.timeout", "must not be negative");
        }

        const auto& rt = config.retry;
        if (!(rt.backoff_factor >= 1.0)) {
            reject("retry.backoff_factor", "must be at least 1.0");
        }
        if (rt.base_delay.count() < 0) {
            reject("retry.base_delay", "must not be negative");
        }
        if (rt.max_delay < rt.base_delay) {
            reject("retry.max_delay", "must not be below retry.base_delay");
        }
        if (rt.max_retry_after.count() < 0) {
            reject("retry.max_retry_after", "must not be negative");
        }

        const auto& jt = config.jitter;
        if (!(jt.min_factor >= 0.0)) {
            reject("jitter.min_factor", "must not be negative");
        }
        if (!(jt.max_factor >= jt.min_factor)) {
            reject("jitter.max_factor", "must not be below jitter.min_factor");
        }

        const auto& pl = config.polling;
        if (pl.poll_interval.count() <= 0) {
            reject("polling.poll_interval", "must be positive");
        }
        if (pl.max_wait.count() < 0) {
            reject("polling.max_wait", "must not be negative");
        }

        if (config.sessions.max_sessions == 0) {
            reject("sessions.max_sessions", "must be at least 1");
        }
    }

}  // namespace resilient_rest
