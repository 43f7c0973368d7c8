#pragma once
#include <string>

namespace resilient_rest {
    /**
     * @brief A transport-level failure observed while performing one HTTP
     * attempt. Classified later into an ErrorKind by the retry layer.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,        /**< The provided URL is malformed or invalid. */
            ConnectionFailed,  /**< Resolve or TCP connect failed; nothing was sent. */
            TlsHandshakeFailed,/**< Failed to perform TLS handshake. */
            Timeout,           /**< The attempt ran past its per-request timeout. */
            SendFailed,        /**< Failed to send the request. */
            ReceiveFailed,     /**< Failed to receive the response. */
            NetworkError,      /**< General network error. */
            Cancelled,         /**< The caller cancelled or its deadline passed. */
            Unknown,           /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::Cancelled:
                return "Cancelled";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }
}  // namespace resilient_rest
