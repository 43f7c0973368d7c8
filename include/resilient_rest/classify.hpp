#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "error.hpp"
#include "operation_result.hpp"
#include "response.hpp"

namespace resilient_rest {

    /// @brief What one HTTP attempt means for the call.
    enum class OutcomeType {
        Success,           ///< Final response, the call is done
        Pending,           ///< 202 + Location: completion is deferred
        RetryableFailure,  ///< Worth another attempt if the budget allows
        TerminalFailure,   ///< Stop now
    };

    /// @brief How the breaker should learn of an outcome.
    enum class BreakerVerdict {
        Success,  ///< The server answered sensibly (2xx, 4xx, still pending)
        Failure,  ///< Transport failure or 5xx
        Ignore,   ///< Caller cancelled, or the breaker itself rejected
    };

    /// @brief Tagged result of one attempt. Nothing is thrown below the
    /// engine's public verbs; failures travel as values of this type.
    struct AttemptOutcome {
        OutcomeType type{OutcomeType::TerminalFailure};
        /// Present whenever a response arrived, failures included.
        std::optional<Response> response;
        std::optional<ErrorKind> error_kind;
        /// Parsed Retry-After from a 429, 503 or 202.
        std::optional<std::chrono::milliseconds> retry_after;
        std::string message;
        BreakerVerdict breaker{BreakerVerdict::Success};

        bool is_failure() const noexcept {
            return type == OutcomeType::RetryableFailure ||
                   type == OutcomeType::TerminalFailure;
        }
    };

    /**
     * @brief Classify a received response.
     *
     * - 202 with Location: Pending. Any other 2xx: Success.
     * - 429: retryable RateLimited, Retry-After honored.
     * - 408: retryable Timeout.
     * - 502/503/504: retryable TransientNetwork.
     * - other 5xx: retryable Operation when idempotent, else terminal.
     * - 401/403: terminal Authentication. Anything else: terminal Operation.
     */
    AttemptOutcome classify_response(Response response, bool idempotent);

    /**
     * @brief Classify a transport failure.
     *
     * Connection and TLS establishment failures are always retryable (the
     * request never left). Timeouts and send/receive failures are retryable
     * only for idempotent requests because the server may have acted.
     */
    AttemptOutcome classify_transport_error(const Error& error,
                                            bool idempotent);

    /// @brief Terminal outcome for a call the caller stopped: Timeout when
    /// its deadline passed, Cancelled otherwise.
    AttemptOutcome stopped_outcome(bool deadline_exceeded, std::string message);

}  // namespace resilient_rest
