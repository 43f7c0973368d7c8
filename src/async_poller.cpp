#include "resilient_rest/async_poller.hpp"

#include <sstream>

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        bool still_pending(const AttemptOutcome& outcome) {
            if (outcome.type == OutcomeType::Pending) return true;
            return outcome.type == OutcomeType::Success && outcome.response &&
                   outcome.response->status_code == 202;
        }

        std::string format_seconds(std::chrono::milliseconds d) {
            std::ostringstream os;
            os.precision(1);
            os << std::fixed << static_cast<double>(d.count()) / 1000.0 << "s";
            return os.str();
        }
    }  // namespace

    AsyncOperationPoller::AsyncOperationPoller(PollingConfiguration cfg,
                                               Jitter& jitter)
        : cfg_(cfg), jitter_(jitter) {}

    Result<PendingOperation> AsyncOperationPoller::pending_from(
        const Response& response, const UrlComponents& origin) {
        auto location = response.header("Location");
        if (!location || location->empty()) {
            return Result<PendingOperation>::err(
                Error::Code::InvalidUrl,
                "HTTP " + std::to_string(response.status_code) +
                    " response carries no Location header");
        }
        auto resolved = url_utils::resolve_reference(origin, *location);
        if (resolved.has_error()) {
            return resolved.forward_error<PendingOperation>();
        }

        PendingOperation op;
        op.location = std::move(resolved.value());
        if (auto ra = response.header("Retry-After")) {
            op.retry_after = parse_retry_after(*ra);
        }
        return Result<PendingOperation>::ok(std::move(op));
    }

    PollReport AsyncOperationPoller::poll(PendingOperation op,
                                          const PollFunction& poll_once,
                                          const CancellationToken& token) const {
        // Fixed interval, bounded by wall-clock time instead of attempts.
        RetrySchedule schedule(
            BackoffPolicy{cfg_.poll_interval, 1.0, cfg_.poll_interval},
            jitter_, RetrySchedule::Limits{std::nullopt, cfg_.max_wait},
            op.started_at);

        PollReport report;
        auto finish = [&](AttemptOutcome outcome) {
            report.outcome = std::move(outcome);
            report.elapsed = schedule.elapsed();
            return report;
        };

        log::logger()->info("Async operation accepted; polling {}",
                            url_utils::to_string(op.location));

        auto hint = op.retry_after;
        while (true) {
            if (schedule.exhausted()) {
                report.timed_out = true;
                log::logger()->error("Async operation timeout after {} ({} polls)",
                                     format_seconds(schedule.elapsed()),
                                     report.polls);
                AttemptOutcome timeout;
                timeout.type = OutcomeType::TerminalFailure;
                timeout.error_kind = ErrorKind::Timeout;
                // Slow is not broken.
                timeout.breaker = BreakerVerdict::Success;
                timeout.retry_after = hint;
                timeout.message = "Async operation timeout after " +
                                  format_seconds(schedule.elapsed()) + " (" +
                                  std::to_string(report.polls) + " polls)";
                return finish(std::move(timeout));
            }

            const auto delay = schedule.next_delay(hint);
            log::logger()->debug("Next poll of {} in {} ms",
                                 url_utils::to_string(op.location),
                                 delay.count());
            if (!token.wait_for(delay)) {
                return finish(stopped_outcome(
                    token.deadline_exceeded(),
                    "Polling stopped after " + std::to_string(report.polls) +
                        " poll(s)"));
            }

            schedule.record_attempt();
            ++report.polls;
            ExecutionReport polled = poll_once(op.location);
            report.attempts += polled.attempts;

            if (!still_pending(polled.outcome)) {
                if (!polled.outcome.is_failure()) {
                    log::logger()->info(
                        "Async operation completed after {} poll(s) in {}",
                        report.polls, format_seconds(schedule.elapsed()));
                }
                return finish(std::move(polled.outcome));
            }

            const Response& pending = *polled.outcome.response;
            if (auto next = pending.header("Location")) {
                auto moved = url_utils::resolve_reference(op.location, *next);
                if (moved.has_value()) {
                    op.location = std::move(moved.value());
                } else {
                    log::logger()->warn("Ignoring unusable Location '{}': {}",
                                        *next, moved.error().message);
                }
            }
            if (polled.outcome.retry_after) hint = polled.outcome.retry_after;
        }
    }

}  // namespace resilient_rest
