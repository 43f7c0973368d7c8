#include "resilient_rest/request_engine.hpp"

#include <exception>

#include "resilient_rest/connection/session.hpp"
#include "resilient_rest/logging.hpp"
#include "resilient_rest/middleware.hpp"

namespace resilient_rest {

    namespace {
        using clock = std::chrono::steady_clock;

        EngineConfiguration validated(EngineConfiguration config) {
            validate_configuration(config);
            return config;
        }

        EngineCollaborators complete(const EngineConfiguration& cfg,
                                     EngineCollaborators c) {
            if (!c.breaker) {
                c.breaker = std::make_shared<CircuitBreaker>(cfg.circuit_breaker);
            }
            if (!c.limiter) {
                c.limiter = std::make_shared<RateLimiter>(cfg.rate_limit);
            }
            if (!c.sessions) {
                c.sessions = std::make_shared<SessionPool>(
                    cfg.sessions,
                    make_http_transport_factory(
                        cfg.verify_tls,
                        cfg.sessions.max_idle_connections_per_session));
            }
            if (!c.jitter) {
                c.jitter = std::make_shared<Jitter>(cfg.jitter);
            }
            return c;
        }

        std::chrono::milliseconds since(clock::time_point started) {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                clock::now() - started);
        }

        OperationResult make_result(AttemptOutcome outcome,
                                    std::size_t attempts, std::size_t polls,
                                    std::chrono::milliseconds elapsed) {
            OperationResult r;
            r.success = outcome.type == OutcomeType::Success;
            if (outcome.response) {
                r.status_code = outcome.response->status_code;
                r.payload = std::move(outcome.response->body);
                r.headers = std::move(outcome.response->headers);
            }
            if (!r.success) {
                r.error_kind = outcome.error_kind.value_or(ErrorKind::Operation);
                r.message = std::move(outcome.message);
            }
            r.attempts = attempts;
            r.polls = polls;
            r.total_elapsed = elapsed;
            r.retry_after = outcome.retry_after;
            return r;
        }

        AttemptOutcome breaker_rejection(const CircuitBreaker& breaker,
                                         const UrlComponents& url) {
            AttemptOutcome out;
            out.type = OutcomeType::TerminalFailure;
            out.error_kind = ErrorKind::CircuitOpen;
            out.breaker = BreakerVerdict::Ignore;
            out.message = "Circuit breaker '" + breaker.name() +
                          "' is OPEN; request to " + url_utils::origin(url) +
                          " rejected";
            return out;
        }
    }  // namespace

    RequestEngine::RequestEngine(EngineConfiguration config,
                                 std::optional<std::string> bearer_token)
        : RequestEngine(std::move(config), EngineCollaborators{},
                        std::move(bearer_token)) {}

    RequestEngine::RequestEngine(EngineConfiguration config,
                                 EngineCollaborators collaborators,
                                 std::optional<std::string> bearer_token)
        : m_config(validated(std::move(config))),
          m_collab(complete(m_config, std::move(collaborators))),
          m_poller(m_config.polling, *m_collab.jitter) {
        if (m_config.base_url) {
            m_base_url = url_utils::parse_base_url(*m_config.base_url).value();
        }
        if (bearer_token) {
            if (bearer_token->empty()) {
                throw ConfigurationError("bearer_token",
                                         "Bearer token must not be empty");
            }
            m_config.interceptors.insert(
                m_config.interceptors.begin(),
                std::make_shared<BearerAuthInterceptor>(std::move(*bearer_token)));
        }
    }

    Result<RequestEngine::Call> RequestEngine::prepare_call_(
        RequestSpec spec) const {
        const UrlComponents* base = m_base_url ? &*m_base_url : nullptr;

        auto resolved = url_utils::resolve_url(spec.url, base);
        if (resolved.has_error()) return resolved.forward_error<Call>();
        UrlComponents url = std::move(resolved.value());

        spec.headers = merge_headers(m_config.default_headers, spec.headers);

        for (const auto& interceptor : m_config.interceptors) {
            if (!interceptor) continue;
            const std::string before = spec.url;
            interceptor->prepare(spec, url);
            if (spec.url != before) {
                auto moved = url_utils::resolve_url(spec.url, base);
                if (moved.has_error()) return moved.forward_error<Call>();
                url = std::move(moved.value());
            }
        }

        spec.url = url_utils::to_string(url);
        return Result<Call>::ok(Call{std::move(spec), std::move(url)});
    }

    std::shared_ptr<RateLimiter> RequestEngine::limiter_for_(
        const UrlComponents& url) const {
        if (m_collab.rate_limits) {
            return m_collab.rate_limits->limiter_for(url_utils::to_string(url));
        }
        return m_collab.limiter;
    }

    RetryExecutor RequestEngine::executor_for_(RateLimiter& limiter) const {
        return RetryExecutor(m_config.retry, *m_collab.breaker, limiter,
                             *m_collab.jitter);
    }

    Result<Response> RequestEngine::send_once_(
        const Call& call, std::size_t attempt,
        const CancellationToken& token) const {
        // Held for this attempt only; released before any backoff sleep.
        SessionPool::Lease lease;
        try {
            lease = m_collab.sessions->lease(endpoint_from_url(call.url));
        } catch (const std::exception& e) {
            return Result<Response>::err(
                Error::Code::Unknown,
                "No transport for " + url_utils::origin(call.url) + ": " +
                    e.what());
        }

        PreparedRequest preq =
            prepare_request(call.spec, call.url, m_config.user_agent);

        SendOptions options;
        options.timeout = m_config.request_timeout;
        options.max_body_bytes = m_config.max_body_bytes;
        options.idempotent = call.spec.idempotent;
        options.token = token;

        log::logger()->debug("{} {} (attempt {})", to_string(call.spec.method),
                             call.spec.url, attempt);
        return lease->send(preq, options);
    }

    ExecutionReport RequestEngine::poll_once_(
        const UrlComponents& location, const CancellationToken& token) const {
        auto call = prepare_call_(
            make_request(HttpMethod::Get, url_utils::to_string(location)));
        if (call.has_error()) {
            return ExecutionReport{
                classify_transport_error(call.error(), true), 0, {}};
        }

        auto limiter = limiter_for_(call.value().url);
        if (auto paced = limiter->acquire(token); paced.has_error()) {
            return ExecutionReport{
                stopped_outcome(token.deadline_exceeded(),
                                paced.error().message),
                0, {}};
        }

        const Call& poll = call.value();
        return executor_for_(*limiter).run(
            true,
            [&](std::size_t attempt) {
                return send_once_(poll, attempt, token);
            },
            token);
    }

    OperationResult RequestEngine::execute(
        const RequestSpec& spec, const CancellationToken& token) const {
        const auto started = clock::now();

        auto prepared = prepare_call_(spec);
        if (prepared.has_error()) {
            return make_result(
                classify_transport_error(prepared.error(), spec.idempotent), 0,
                0, since(started));
        }
        const Call& call = prepared.value();

        if (!m_collab.breaker->allow()) {
            log::logger()->warn("Circuit breaker '{}' open, rejecting {} {}",
                                m_collab.breaker->name(),
                                to_string(call.spec.method), call.spec.url);
            return make_result(breaker_rejection(*m_collab.breaker, call.url),
                               0, 0, since(started));
        }

        auto limiter = limiter_for_(call.url);
        if (auto paced = limiter->acquire(token); paced.has_error()) {
            return make_result(stopped_outcome(token.deadline_exceeded(),
                                               paced.error().message),
                               0, 0, since(started));
        }

        ExecutionReport report = executor_for_(*limiter).run(
            call.spec.idempotent,
            [&](std::size_t attempt) {
                return send_once_(call, attempt, token);
            },
            token);

        std::size_t attempts = report.attempts;
        std::size_t polls = 0;
        AttemptOutcome outcome = std::move(report.outcome);

        if (outcome.type == OutcomeType::Pending) {
            auto pending =
                AsyncOperationPoller::pending_from(*outcome.response, call.url);
            if (pending.has_error()) {
                log::logger()->warn("Treating 202 from {} as final: {}",
                                    call.spec.url, pending.error().message);
                outcome.type = OutcomeType::Success;
            } else {
                PollReport polled = m_poller.poll(
                    std::move(pending.value()),
                    [&](const UrlComponents& location) {
                        return poll_once_(location, token);
                    },
                    token);
                attempts += polled.attempts;
                polls = polled.polls;
                outcome = std::move(polled.outcome);
            }
        } else if (outcome.type == OutcomeType::Success &&
                   outcome.response->status_code == 202) {
            log::logger()->warn(
                "{} {} returned 202 without Location; nothing to poll",
                to_string(call.spec.method), call.spec.url);
        }

        switch (outcome.breaker) {
            case BreakerVerdict::Success:
                m_collab.breaker->record_success();
                break;
            case BreakerVerdict::Failure:
                m_collab.breaker->record_failure();
                break;
            case BreakerVerdict::Ignore:
                break;
        }

        if (m_collab.rate_limits && outcome.response) {
            m_collab.rate_limits->update_from_headers(
                call.spec.url, outcome.response->headers);
        }

        OperationResult result =
            make_result(std::move(outcome), attempts, polls, since(started));
        if (!result.success) {
            log::logger()->debug("{} {} failed after {} attempt(s): {}",
                                 to_string(call.spec.method), call.spec.url,
                                 result.attempts, result.message);
        }
        return result;
    }

    OperationResult RequestEngine::verb_(HttpMethod method,
                                         const std::string& target,
                                         std::optional<std::string> body,
                                         const Headers& headers,
                                         const CancellationToken& token) const {
        OperationResult result =
            execute(make_request(method, target, std::move(body), headers), token);
        if (!result.success) throw_engine_error(result);
        return result;
    }

    OperationResult RequestEngine::get(const std::string& target,
                                       const Headers& headers,
                                       const CancellationToken& token) const {
        return verb_(HttpMethod::Get, target, std::nullopt, headers, token);
    }

    OperationResult RequestEngine::post(const std::string& target,
                                        std::optional<std::string> body,
                                        const Headers& headers,
                                        const CancellationToken& token) const {
        return verb_(HttpMethod::Post, target, std::move(body), headers, token);
    }

    OperationResult RequestEngine::put(const std::string& target,
                                       std::optional<std::string> body,
                                       const Headers& headers,
                                       const CancellationToken& token) const {
        return verb_(HttpMethod::Put, target, std::move(body), headers, token);
    }

    OperationResult RequestEngine::patch(const std::string& target,
                                         std::optional<std::string> body,
                                         const Headers& headers,
                                         const CancellationToken& token) const {
        return verb_(HttpMethod::Patch, target, std::move(body), headers,
                     token);
    }

    OperationResult RequestEngine::del(const std::string& target,
                                       const Headers& headers,
                                       const CancellationToken& token) const {
        return verb_(HttpMethod::Delete, target, std::nullopt, headers, token);
    }

}  // namespace resilient_rest
