#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "operation_result.hpp"

namespace resilient_rest {

    /**
     * @brief Base of every error the engine surfaces to callers.
     *
     * Carries the classified kind together with the attempts made and the
     * wall-clock time spent on the call.
     */
    class EngineError : public std::runtime_error {
       public:
        EngineError(ErrorKind kind, const std::string& message,
                    std::size_t attempts = 0,
                    std::chrono::milliseconds elapsed = {},
                    std::optional<int> status_code = std::nullopt)
            : std::runtime_error(message),
              kind_(kind),
              attempts_(attempts),
              elapsed_(elapsed),
              status_code_(status_code) {}

        ErrorKind kind() const noexcept { return kind_; }
        std::size_t attempts() const noexcept { return attempts_; }
        std::chrono::milliseconds elapsed() const noexcept { return elapsed_; }
        std::optional<int> status_code() const noexcept { return status_code_; }

       private:
        ErrorKind kind_;
        std::size_t attempts_;
        std::chrono::milliseconds elapsed_;
        std::optional<int> status_code_;
    };

    /// 401 / 403.
    class AuthenticationError : public EngineError {
       public:
        explicit AuthenticationError(const std::string& message,
                                     std::size_t attempts = 0,
                                     std::chrono::milliseconds elapsed = {},
                                     std::optional<int> status_code = {})
            : EngineError(ErrorKind::Authentication, message, attempts,
                          elapsed, status_code) {}
    };

    /// 429 persisted through every retry.
    class RateLimitedError : public EngineError {
       public:
        explicit RateLimitedError(const std::string& message,
                                  std::size_t attempts = 0,
                                  std::chrono::milliseconds elapsed = {},
                                  std::optional<int> status_code = {})
            : EngineError(ErrorKind::RateLimited, message, attempts, elapsed,
                          status_code) {}
    };

    /// The breaker rejected the call; no network I/O happened.
    class CircuitOpenError : public EngineError {
       public:
        explicit CircuitOpenError(const std::string& message,
                                  std::size_t attempts = 0,
                                  std::chrono::milliseconds elapsed = {},
                                  std::optional<int> status_code = {})
            : EngineError(ErrorKind::CircuitOpen, message, attempts, elapsed,
                          status_code) {}
    };

    class TimeoutError : public EngineError {
       public:
        explicit TimeoutError(const std::string& message,
                              std::size_t attempts = 0,
                              std::chrono::milliseconds elapsed = {},
                              std::optional<int> status_code = {})
            : EngineError(ErrorKind::Timeout, message, attempts, elapsed,
                          status_code) {}
    };

    class OperationError : public EngineError {
       public:
        explicit OperationError(const std::string& message,
                                std::size_t attempts = 0,
                                std::chrono::milliseconds elapsed = {},
                                std::optional<int> status_code = {})
            : EngineError(ErrorKind::Operation, message, attempts, elapsed,
                          status_code) {}
    };

    class TransientNetworkError : public EngineError {
       public:
        explicit TransientNetworkError(const std::string& message,
                                       std::size_t attempts = 0,
                                       std::chrono::milliseconds elapsed = {},
                                       std::optional<int> status_code = {})
            : EngineError(ErrorKind::TransientNetwork, message, attempts,
                          elapsed, status_code) {}
    };

    class CancelledError : public EngineError {
       public:
        explicit CancelledError(const std::string& message,
                                std::size_t attempts = 0,
                                std::chrono::milliseconds elapsed = {},
                                std::optional<int> status_code = {})
            : EngineError(ErrorKind::Cancelled, message, attempts, elapsed,
                          status_code) {}
    };

    /**
     * @brief Invalid or incomplete engine configuration.
     */
    class ConfigurationError : public std::runtime_error {
       public:
        ConfigurationError(std::string key, const std::string& message)
            : std::runtime_error(message), key_(std::move(key)) {}

        /** @brief Path of the offending setting, e.g. "retry-strategy.max-retries". */
        const std::string& key() const noexcept { return key_; }

       private:
        std::string key_;
    };

    /// @brief Throw the exception matching a failed result's error kind.
    /// @pre !result.success
    [[noreturn]] void throw_engine_error(const OperationResult& result);

}  // namespace resilient_rest
