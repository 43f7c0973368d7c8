#include "resilient_rest/config_loader.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <type_traits>

#include "resilient_rest/exceptions.hpp"
#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        using nlohmann::json;

        std::string join_path(const std::string& parent, const char* key) {
            return parent.empty() ? std::string(key) : parent + "." + key;
        }

        const json& require_object(const json& parent, const char* key,
                                   const std::string& path) {
            const auto full = join_path(path, key);
            auto it = parent.find(key);
            if (it == parent.end()) {
                throw ConfigurationError(full,
                                         "Missing required setting '" + full + "'");
            }
            if (!it->is_object()) {
                throw ConfigurationError(full,
                                         "Setting '" + full + "' must be an object");
            }
            return *it;
        }

        template <typename T>
        T convert(const json& value, const std::string& full) {
            try {
                return value.get<T>();
            } catch (const json::exception& e) {
                throw ConfigurationError(
                    full, "Setting '" + full + "' has the wrong type: " + e.what());
            }
        }

        template <typename T>
        T require(const json& parent, const char* key, const std::string& path) {
            const auto full = join_path(path, key);
            auto it = parent.find(key);
            if (it == parent.end() || it->is_null()) {
                throw ConfigurationError(full,
                                         "Missing required setting '" + full + "'");
            }
            if constexpr (std::is_arithmetic_v<T> && !std::is_same_v<T, bool>) {
                if (!it->is_number()) {
                    throw ConfigurationError(
                        full, "Setting '" + full + "' must be a number");
                }
            }
            return convert<T>(*it, full);
        }

        template <typename T>
        std::optional<T> optional(const json& parent, const char* key,
                                  const std::string& path) {
            auto it = parent.find(key);
            if (it == parent.end() || it->is_null()) return std::nullopt;
            return convert<T>(*it, join_path(path, key));
        }

        std::chrono::milliseconds seconds_to_ms(double seconds,
                                                const std::string& full) {
            if (!std::isfinite(seconds) || seconds < 0) {
                throw ConfigurationError(
                    full, "Setting '" + full + "' must be a non-negative number");
            }
            return std::chrono::milliseconds(
                static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        }

        std::size_t non_negative_count(double value, const std::string& full) {
            if (!std::isfinite(value) || value < 0 ||
                value != std::floor(value)) {
                throw ConfigurationError(
                    full, "Setting '" + full + "' must be a non-negative integer");
            }
            return static_cast<std::size_t>(value);
        }
    }  // namespace

    EngineConfiguration load_engine_configuration(const json& document) {
        if (!document.is_object()) {
            throw ConfigurationError("", "Configuration document must be an object");
        }

        EngineConfiguration cfg;
        const std::string root = "script-behavior";
        const json& behavior = require_object(document, root.c_str(), "");

        {
            const std::string p = root + ".api-timeouts";
            const json& s = require_object(behavior, "api-timeouts", root);
            cfg.request_timeout = seconds_to_ms(
                require<double>(s, "rest-timeout-seconds", p),
                p + ".rest-timeout-seconds");
            cfg.polling.max_wait = seconds_to_ms(
                require<double>(s, "async-max-wait", p), p + ".async-max-wait");
            cfg.polling.poll_interval =
                seconds_to_ms(require<double>(s, "async-poll-interval", p),
                              p + ".async-poll-interval");
        }

        {
            const std::string p = root + ".retry-strategy";
            const json& s = require_object(behavior, "retry-strategy", root);
            cfg.retry.max_retries = non_negative_count(
                require<double>(s, "max-retries", p), p + ".max-retries");
            cfg.retry.backoff_factor = require<double>(s, "backoff-factor", p);
            if (auto v = optional<double>(s, "base-delay-seconds", p)) {
                cfg.retry.base_delay =
                    seconds_to_ms(*v, p + ".base-delay-seconds");
            }
            if (auto v = optional<double>(s, "max-delay-seconds", p)) {
                cfg.retry.max_delay = seconds_to_ms(*v, p + ".max-delay-seconds");
            }
            if (auto v = optional<double>(s, "max-retry-after-seconds", p)) {
                cfg.retry.max_retry_after =
                    seconds_to_ms(*v, p + ".max-retry-after-seconds");
            }
        }

        {
            const std::string p = root + ".jitter";
            const json& s = require_object(behavior, "jitter", root);
            cfg.jitter.min_factor = require<double>(s, "min-factor", p);
            cfg.jitter.max_factor = require<double>(s, "max-factor", p);
        }

        {
            const std::string p = root + ".rate-limiting";
            const json& s = require_object(behavior, "rate-limiting", root);
            cfg.rate_limit.enabled = require<bool>(s, "enabled", p);
            if (cfg.rate_limit.enabled) {
                cfg.rate_limit.calls_per_second =
                    require<double>(s, "calls-per-second", p);
                cfg.rate_limit.burst_size = non_negative_count(
                    require<double>(s, "burst-size", p), p + ".burst-size");
            }
        }

        {
            const std::string p = root + ".circuit-breaker";
            const json& s = require_object(behavior, "circuit-breaker", root);
            cfg.circuit_breaker.enabled = require<bool>(s, "enabled", p);
            if (cfg.circuit_breaker.enabled) {
                cfg.circuit_breaker.failure_threshold = non_negative_count(
                    require<double>(s, "failure-threshold", p),
                    p + ".failure-threshold");
                cfg.circuit_breaker.timeout = seconds_to_ms(
                    require<double>(s, "timeout-seconds", p),
                    p + ".timeout-seconds");
            }
        }

        {
            const std::string p = root + ".session-pool";
            const json& s = require_object(behavior, "session-pool", root);
            cfg.sessions.max_sessions = non_negative_count(
                require<double>(s, "max-sessions", p), p + ".max-sessions");
            if (auto v = optional<double>(s, "max-idle-connections", p)) {
                cfg.sessions.max_idle_connections_per_session =
                    non_negative_count(*v, p + ".max-idle-connections");
            }
        }

        if (auto v = optional<std::string>(document, "base-url", "")) {
            cfg.base_url = std::move(*v);
        }
        if (auto v = optional<std::string>(document, "user-agent", "")) {
            cfg.user_agent = std::move(*v);
        }
        if (auto v = optional<bool>(document, "verify-tls", "")) {
            cfg.verify_tls = *v;
        }

        validate_configuration(cfg);
        return cfg;
    }

    EngineConfiguration load_engine_configuration_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) {
            throw ConfigurationError("", "Cannot open configuration file '" +
                                             path + "'");
        }
        json document;
        try {
            in >> document;
        } catch (const json::parse_error& e) {
            throw ConfigurationError("", "Malformed configuration file '" +
                                             path + "': " + e.what());
        }
        log::logger()->debug("Loaded engine configuration from {}", path);
        return load_engine_configuration(document);
    }

}  // namespace resilient_rest
