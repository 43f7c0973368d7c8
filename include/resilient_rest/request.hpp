#pragma once
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>

#include "endpoint.hpp"
#include "headers.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace resilient_rest {

    /// @brief Immutable description of one logical call.
    struct RequestSpec {
        HttpMethod method{HttpMethod::Get};
        /// Absolute URL, or a target relative to the engine's base_url.
        std::string url;
        Headers headers;
        std::optional<std::string> body;
        /// Whether an ambiguous network failure may be retried.
        bool idempotent{true};
    };

    /// @brief RequestSpec whose idempotency follows the HTTP method.
    inline RequestSpec make_request(HttpMethod method, std::string url,
                                    std::optional<std::string> body = {},
                                    Headers headers = {}) {
        RequestSpec spec;
        spec.method = method;
        spec.url = std::move(url);
        spec.headers = std::move(headers);
        spec.body = std::move(body);
        spec.idempotent = is_idempotent(method);
        return spec;
    }

    /// @brief A request ready for the wire, bound to one endpoint.
    struct PreparedRequest {
        Endpoint endpoint;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(const Headers& in,
                                      boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const RequestSpec& req, const UrlComponents& url,
                          const std::string& user_agent,
                          const bool keep_alive = true) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url.target.empty() ? "/" : url.target);
        beast_req.set(http::field::host, url_utils::is_default_port(url)
                                             ? url.host
                                             : url.host + ":" + url.port);
        beast_req.set(http::field::user_agent, user_agent);
        beast_req.keep_alive(keep_alive);
        apply_request_headers(req.headers, beast_req.base());
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
        }
        beast_req.prepare_payload();
        return beast_req;
    }

    inline PreparedRequest prepare_request(const RequestSpec& req,
                                           const UrlComponents& url,
                                           const std::string& user_agent) {
        return PreparedRequest{endpoint_from_url(url),
                               prepare_beast_request(req, url, user_agent)};
    }

}  // namespace resilient_rest
