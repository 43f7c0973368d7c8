#include "resilient_rest/retry_executor.hpp"

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        AttemptOutcome circuit_open_outcome(const CircuitBreaker& breaker) {
            AttemptOutcome out;
            out.type = OutcomeType::TerminalFailure;
            out.error_kind = ErrorKind::CircuitOpen;
            out.breaker = BreakerVerdict::Ignore;
            out.message = "Circuit breaker '" + breaker.name() +
                          "' opened; retry abandoned";
            return out;
        }

        long long seconds_of(std::chrono::milliseconds d) {
            return std::chrono::duration_cast<std::chrono::seconds>(d).count();
        }
    }  // namespace

    RetryExecutor::RetryExecutor(RetryConfiguration cfg,
                                 CircuitBreaker& breaker,
                                 RateLimiter& limiter, Jitter& jitter)
        : cfg_(cfg), breaker_(breaker), limiter_(limiter), jitter_(jitter) {}

    ExecutionReport RetryExecutor::run(bool idempotent,
                                       const SendFunction& send,
                                       const CancellationToken& token) const {
        RetrySchedule schedule(
            BackoffPolicy{cfg_.base_delay, cfg_.backoff_factor,
                          cfg_.max_delay},
            jitter_, RetrySchedule::Limits{cfg_.max_retries + 1, std::nullopt});

        auto finish = [&](AttemptOutcome outcome) {
            // A stopped call whose deadline has passed is a timeout.
            if (outcome.error_kind == ErrorKind::Cancelled &&
                token.deadline_exceeded()) {
                outcome.error_kind = ErrorKind::Timeout;
            }
            return ExecutionReport{std::move(outcome), schedule.attempts(),
                                   schedule.elapsed()};
        };

        while (true) {
            if (schedule.attempts() > 0) {
                if (breaker_.would_reject()) {
                    return finish(circuit_open_outcome(breaker_));
                }
                auto paced = limiter_.acquire(token);
                if (paced.has_error()) {
                    return finish(stopped_outcome(token.deadline_exceeded(),
                                                  paced.error().message));
                }
            }
            if (token.stop_requested()) {
                return finish(stopped_outcome(token.deadline_exceeded(),
                                              "Call stopped before attempt " +
                                                  std::to_string(
                                                      schedule.attempts() + 1)));
            }

            schedule.record_attempt();
            auto sent = send(schedule.attempts());
            AttemptOutcome outcome =
                sent.has_error()
                    ? classify_transport_error(sent.error(), idempotent)
                    : classify_response(std::move(sent.value()), idempotent);

            if (outcome.type != OutcomeType::RetryableFailure) {
                return finish(std::move(outcome));
            }

            // A hint at the ceiling stands for "longer than can be expressed".
            if (outcome.retry_after &&
                (*outcome.retry_after > cfg_.max_retry_after ||
                 *outcome.retry_after >= kRetryAfterCeiling)) {
                log::logger()->error(
                    "Server asked to wait {}s, more than the {}s allowed; "
                    "giving up after {} attempt(s)",
                    seconds_of(*outcome.retry_after),
                    seconds_of(cfg_.max_retry_after), schedule.attempts());
                outcome.type = OutcomeType::TerminalFailure;
                return finish(std::move(outcome));
            }

            if (schedule.exhausted()) {
                log::logger()->error("Giving up after {} attempt(s): {}",
                                     schedule.attempts(), outcome.message);
                outcome.type = OutcomeType::TerminalFailure;
                return finish(std::move(outcome));
            }

            const auto delay = schedule.next_delay(outcome.retry_after);
            log::logger()->warn(
                "Attempt {}/{} failed ({}); retrying in {} ms",
                schedule.attempts(), cfg_.max_retries + 1, outcome.message,
                delay.count());

            if (!token.wait_for(delay)) {
                return finish(stopped_outcome(
                    token.deadline_exceeded(),
                    "Call stopped during backoff after " +
                        std::to_string(schedule.attempts()) + " attempt(s)"));
            }
        }
    }

}  // namespace resilient_rest
