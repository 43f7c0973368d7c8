#pragma once
#include <boost/beast/http/verb.hpp>

namespace resilient_rest {
    namespace http = boost::beast::http;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            default:
                return http::verb::unknown;
        }
    }

    inline constexpr const char* to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
        }
        return "UNKNOWN";
    }

    /// @brief RFC 9110 idempotency. Decides whether an ambiguous network
    /// failure (request may have reached the server) may be retried.
    inline constexpr bool is_idempotent(HttpMethod method) {
        return method != HttpMethod::Post && method != HttpMethod::Patch;
    }

}  // namespace resilient_rest
