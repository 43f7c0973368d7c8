#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "headers.hpp"

namespace resilient_rest {

    /// @brief Classified failure category of a logical call.
    enum class ErrorKind {
        Authentication,    ///< 401 / 403
        RateLimited,       ///< 429 after retries, or Retry-After too long
        CircuitOpen,       ///< Rejected by the breaker, no I/O attempted
        Timeout,           ///< Attempt timeouts exhausted or poll budget spent
        Operation,         ///< Non-retryable failure
        TransientNetwork,  ///< Network failure or 502/503/504 after retries
        Cancelled,         ///< Caller cancelled the call
    };

    inline const char* to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::Authentication:
                return "Authentication";
            case ErrorKind::RateLimited:
                return "RateLimited";
            case ErrorKind::CircuitOpen:
                return "CircuitOpen";
            case ErrorKind::Timeout:
                return "Timeout";
            case ErrorKind::Operation:
                return "Operation";
            case ErrorKind::TransientNetwork:
                return "TransientNetwork";
            case ErrorKind::Cancelled:
                return "Cancelled";
        }
        return "Unknown";
    }

    /**
     * @brief Outcome of one logical call, success or failure. Immutable once
     * returned by the engine.
     */
    struct OperationResult {
        bool success{false};
        /** @brief Status of the final response, if any response arrived. */
        std::optional<int> status_code;
        /** @brief Body of the final response. */
        std::string payload;
        Headers headers;
        std::optional<ErrorKind> error_kind;
        /** @brief Human-readable failure description; empty on success. */
        std::string message;
        /** @brief HTTP attempts made, poll requests included. */
        std::size_t attempts{0};
        /** @brief Poll requests made for a deferred (202) operation. */
        std::size_t polls{0};
        std::chrono::milliseconds total_elapsed{0};
        /** @brief Last Retry-After hint the server gave. */
        std::optional<std::chrono::milliseconds> retry_after;

        /// @brief Payload decoded as JSON; an empty payload yields an empty
        /// object.
        /// @throws OperationError when the payload is not valid JSON.
        nlohmann::json json() const;

        std::optional<std::string> header(std::string_view name) const {
            return find_header(headers, name);
        }
    };

}  // namespace resilient_rest
