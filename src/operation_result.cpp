#include "resilient_rest/operation_result.hpp"

#include "resilient_rest/exceptions.hpp"

namespace resilient_rest {

    nlohmann::json OperationResult::json() const {
        if (payload.empty()) return nlohmann::json::object();
        try {
            return nlohmann::json::parse(payload);
        } catch (const nlohmann::json::parse_error& e) {
            throw OperationError(
                std::string("Response payload is not valid JSON: ") + e.what(),
                attempts, total_elapsed, status_code);
        }
    }

    void throw_engine_error(const OperationResult& result) {
        const auto kind = result.error_kind.value_or(ErrorKind::Operation);
        const auto& msg = result.message;
        switch (kind) {
            case ErrorKind::Authentication:
                throw AuthenticationError(msg, result.attempts,
                                          result.total_elapsed,
                                          result.status_code);
            case ErrorKind::RateLimited:
                throw RateLimitedError(msg, result.attempts,
                                       result.total_elapsed,
                                       result.status_code);
            case ErrorKind::CircuitOpen:
                throw CircuitOpenError(msg, result.attempts,
                                       result.total_elapsed,
                                       result.status_code);
            case ErrorKind::Timeout:
                throw TimeoutError(msg, result.attempts, result.total_elapsed,
                                   result.status_code);
            case ErrorKind::TransientNetwork:
                throw TransientNetworkError(msg, result.attempts,
                                            result.total_elapsed,
                                            result.status_code);
            case ErrorKind::Cancelled:
                throw CancelledError(msg, result.attempts,
                                     result.total_elapsed, result.status_code);
            case ErrorKind::Operation:
                break;
        }
        throw OperationError(msg, result.attempts, result.total_elapsed,
                             result.status_code);
    }

}  // namespace resilient_rest
