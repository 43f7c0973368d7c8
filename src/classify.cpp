#include "resilient_rest/classify.hpp"

#include "resilient_rest/backoff.hpp"

namespace resilient_rest {

    namespace {
        constexpr std::size_t kMaxBodyInMessage = 200;

        std::string describe(const Response& response) {
            std::string msg = "HTTP " + std::to_string(response.status_code);
            if (!response.body.empty()) {
                msg += ": ";
                msg += response.body.substr(0, kMaxBodyInMessage);
            }
            return msg;
        }

        AttemptOutcome failure(OutcomeType type, ErrorKind kind,
                               BreakerVerdict breaker, std::string message) {
            AttemptOutcome out;
            out.type = type;
            out.error_kind = kind;
            out.breaker = breaker;
            out.message = std::move(message);
            return out;
        }
    }  // namespace

    AttemptOutcome classify_response(Response response, bool idempotent) {
        const int status = response.status_code;
        std::optional<std::chrono::milliseconds> hint;
        if (auto ra = response.header("Retry-After")) {
            hint = parse_retry_after(*ra);
        }

        AttemptOutcome out;
        if (status >= 200 && status < 300) {
            out.type = (status == 202 && response.header("Location"))
                           ? OutcomeType::Pending
                           : OutcomeType::Success;
            out.breaker = BreakerVerdict::Success;
        } else if (status == 429) {
            out = failure(OutcomeType::RetryableFailure, ErrorKind::RateLimited,
                          BreakerVerdict::Success, describe(response));
        } else if (status == 408) {
            out = failure(OutcomeType::RetryableFailure, ErrorKind::Timeout,
                          BreakerVerdict::Failure, describe(response));
        } else if (status == 502 || status == 503 || status == 504) {
            out = failure(OutcomeType::RetryableFailure,
                          ErrorKind::TransientNetwork, BreakerVerdict::Failure,
                          describe(response));
        } else if (status >= 500 && status < 600) {
            out = failure(idempotent ? OutcomeType::RetryableFailure
                                     : OutcomeType::TerminalFailure,
                          ErrorKind::Operation, BreakerVerdict::Failure,
                          describe(response));
        } else if (status == 401 || status == 403) {
            out = failure(OutcomeType::TerminalFailure,
                          ErrorKind::Authentication, BreakerVerdict::Success,
                          describe(response));
        } else {
            out = failure(OutcomeType::TerminalFailure, ErrorKind::Operation,
                          BreakerVerdict::Success, describe(response));
        }

        out.retry_after = hint;
        out.response = std::move(response);
        return out;
    }

    AttemptOutcome classify_transport_error(const Error& error,
                                            bool idempotent) {
        const auto ambiguous = idempotent ? OutcomeType::RetryableFailure
                                          : OutcomeType::TerminalFailure;
        switch (error.code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
                return failure(OutcomeType::RetryableFailure,
                               ErrorKind::TransientNetwork,
                               BreakerVerdict::Failure, error.message);
            case Error::Code::Timeout:
                return failure(ambiguous, ErrorKind::Timeout,
                               BreakerVerdict::Failure, error.message);
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::NetworkError:
                return failure(ambiguous, ErrorKind::TransientNetwork,
                               BreakerVerdict::Failure, error.message);
            case Error::Code::Cancelled:
                return failure(OutcomeType::TerminalFailure,
                               ErrorKind::Cancelled, BreakerVerdict::Ignore,
                               error.message);
            case Error::Code::InvalidUrl:
            case Error::Code::Unknown:
                break;
        }
        return failure(OutcomeType::TerminalFailure, ErrorKind::Operation,
                       BreakerVerdict::Ignore, error.message);
    }

    AttemptOutcome stopped_outcome(bool deadline_exceeded,
                                   std::string message) {
        return failure(OutcomeType::TerminalFailure,
                       deadline_exceeded ? ErrorKind::Timeout
                                         : ErrorKind::Cancelled,
                       BreakerVerdict::Ignore, std::move(message));
    }

}  // namespace resilient_rest
