#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>

#include "backoff.hpp"
#include "cancellation.hpp"
#include "classify.hpp"
#include "config.hpp"
#include "response.hpp"
#include "result.hpp"
#include "retry_executor.hpp"
#include "url.hpp"

namespace resilient_rest {

    /// @brief A server-side operation the client is waiting on.
    struct PendingOperation {
        UrlComponents location;
        std::chrono::steady_clock::time_point started_at{
            std::chrono::steady_clock::now()};
        /// Wait hint from the 202 that started the operation.
        std::optional<std::chrono::milliseconds> retry_after;
    };

    /// @brief Issues one (retried) GET against the status location.
    using PollFunction =
        std::function<ExecutionReport(const UrlComponents& location)>;

    struct PollReport {
        AttemptOutcome outcome;
        /// Poll requests issued.
        std::size_t polls{0};
        /// HTTP attempts across all polls, retries included.
        std::size_t attempts{0};
        bool timed_out{false};
        std::chrono::milliseconds elapsed{0};
    };

    /**
     * @brief Waits for a deferred (HTTP 202) operation to complete.
     *
     * Sleeps for the server's Retry-After hint, or the configured poll
     * interval, jittered like retries; then polls the status location. A 202
     * answer means still pending: its Location replaces the current one and
     * its Retry-After replaces the hint. Anything else ends polling. The
     * whole loop is bounded by max_wait measured from the initial 202.
     */
    class AsyncOperationPoller {
       public:
        AsyncOperationPoller(PollingConfiguration cfg, Jitter& jitter);

        /// @brief Pending operation described by a 202 response to a request
        /// for `origin`. Fails when Location is missing or unresolvable.
        static Result<PendingOperation> pending_from(
            const Response& response, const UrlComponents& origin);

        PollReport poll(PendingOperation op, const PollFunction& poll_once,
                        const CancellationToken& token = {}) const;

        const PollingConfiguration& config() const noexcept { return cfg_; }

       private:
        PollingConfiguration cfg_;
        Jitter& jitter_;
    };

}  // namespace resilient_rest
