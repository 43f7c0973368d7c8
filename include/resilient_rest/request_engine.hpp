#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "async_poller.hpp"
#include "backoff.hpp"
#include "cancellation.hpp"
#include "circuit_breaker.hpp"
#include "config.hpp"
#include "connection/session_pool.hpp"
#include "exceptions.hpp"
#include "headers.hpp"
#include "operation_result.hpp"
#include "rate_limit_manager.hpp"
#include "rate_limiter.hpp"
#include "request.hpp"
#include "retry_executor.hpp"
#include "url.hpp"

namespace resilient_rest {

    /**
     * @brief The shared resilience state an engine works against.
     *
     * Several engines may share one breaker or one pool; tests inject
     * isolated instances. Null members are built from the configuration.
     */
    struct EngineCollaborators {
        std::shared_ptr<CircuitBreaker> breaker;
        std::shared_ptr<RateLimiter> limiter;
        std::shared_ptr<SessionPool> sessions;
        std::shared_ptr<Jitter> jitter;
        /// Optional per-endpoint limits; when set, its limiter for the target
        /// replaces `limiter`.
        std::shared_ptr<RateLimitManager> rate_limits;
    };

    /**
     * @brief Resilient HTTP request engine.
     *
     * Every call goes through the circuit breaker, the rate limiter, a
     * session leased from the pool, bounded retries and, for deferred (202)
     * operations, status polling. The engine is thread-safe: many threads may
     * call it concurrently, and each call's attempts run on the calling
     * thread.
     */
    class RequestEngine {
       public:
        /**
         * @brief Engine with its own breaker, limiter, pool and jitter.
         * @param config Resolved configuration; validated here.
         * @param bearer_token Sent as `Authorization: Bearer <token>`.
         * @throws ConfigurationError on invalid configuration.
         */
        explicit RequestEngine(
            EngineConfiguration config,
            std::optional<std::string> bearer_token = std::nullopt);

        /// @brief Engine working against injected collaborators.
        RequestEngine(EngineConfiguration config,
                      EngineCollaborators collaborators,
                      std::optional<std::string> bearer_token = std::nullopt);

        RequestEngine(const RequestEngine&) = delete;
        RequestEngine& operator=(const RequestEngine&) = delete;

        /**
         * @brief Run one logical call. Never throws; failures are reported
         * in the result.
         */
        [[nodiscard]] OperationResult execute(
            const RequestSpec& spec, const CancellationToken& token = {}) const;

        /**
         * @name Verb methods
         * Return the result on success and throw the EngineError subclass
         * matching the failure otherwise.
         * @{
         */
        OperationResult get(const std::string& target,
                            const Headers& headers = {},
                            const CancellationToken& token = {}) const;

        OperationResult post(const std::string& target,
                             std::optional<std::string> body = std::nullopt,
                             const Headers& headers = {},
                             const CancellationToken& token = {}) const;

        OperationResult put(const std::string& target,
                            std::optional<std::string> body = std::nullopt,
                            const Headers& headers = {},
                            const CancellationToken& token = {}) const;

        OperationResult patch(const std::string& target,
                              std::optional<std::string> body = std::nullopt,
                              const Headers& headers = {},
                              const CancellationToken& token = {}) const;

        OperationResult del(const std::string& target,
                            const Headers& headers = {},
                            const CancellationToken& token = {}) const;
        /** @} */

        const EngineConfiguration& config() const noexcept { return m_config; }
        CircuitBreaker& breaker() const noexcept { return *m_collab.breaker; }
        SessionPool& sessions() const noexcept { return *m_collab.sessions; }
        RateLimiter& rate_limiter() const noexcept { return *m_collab.limiter; }
        std::shared_ptr<RateLimitManager> rate_limits() const noexcept {
            return m_collab.rate_limits;
        }

       private:
        /// A request after header merging, interceptors and URL resolution.
        struct Call {
            RequestSpec spec;
            UrlComponents url;
        };

        Result<Call> prepare_call_(RequestSpec spec) const;

        std::shared_ptr<RateLimiter> limiter_for_(const UrlComponents& url) const;

        Result<Response> send_once_(const Call& call, std::size_t attempt,
                                    const CancellationToken& token) const;

        ExecutionReport poll_once_(const UrlComponents& location,
                                   const CancellationToken& token) const;

        RetryExecutor executor_for_(RateLimiter& limiter) const;

        OperationResult verb_(HttpMethod method, const std::string& target,
                              std::optional<std::string> body,
                              const Headers& headers,
                              const CancellationToken& token) const;

        EngineConfiguration m_config;
        EngineCollaborators m_collab;
        std::optional<UrlComponents> m_base_url;
        AsyncOperationPoller m_poller;
    };

}  // namespace resilient_rest
