#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "headers.hpp"
#include "request.hpp"
#include "url.hpp"

namespace resilient_rest {

    /**
     * @brief Interface for intercepting and modifying requests before they are sent.
     *
     * Interceptors run after default and per-call headers are merged, in
     * registration order, on the initial request and on every poll of a
     * deferred operation.
     */
    class RequestInterceptor {
       public:
        virtual ~RequestInterceptor() = default;

        /**
         * @brief Performs modifications on the outgoing request.
         * @param req The request to modify. Changing `req.url` re-targets it.
         * @param url The resolved URL components for the request.
         */
        virtual void prepare(RequestSpec& req, const UrlComponents& url) const = 0;
    };

    /**
     * @brief Interceptor for Bearer Token authentication.
     *
     * Adds an `Authorization: Bearer <token>` header to the request.
     */
    class BearerAuthInterceptor : public RequestInterceptor {
       public:
        explicit BearerAuthInterceptor(std::string token)
            : token_(std::move(token)) {}

        void prepare(RequestSpec& req,
                     const UrlComponents& /*url*/) const override {
            set_header(req.headers, "Authorization", "Bearer " + token_);
        }

       private:
        std::string token_;
    };

    /**
     * @brief Interceptor for API Key authentication.
     *
     * Adds an API key either as a header or as a query parameter.
     */
    class ApiKeyInterceptor : public RequestInterceptor {
       public:
        /** @brief Specifies where the API key should be placed. */
        enum class Location : std::uint8_t {
            Header, /**< Place in an HTTP header. */
            Query   /**< Place in the URL query string. */
        };

        explicit ApiKeyInterceptor(std::string key, std::string value,
                                   Location loc = Location::Header)
            : key_(std::move(key)), value_(std::move(value)), loc_(loc) {}

        void prepare(RequestSpec& req,
                     const UrlComponents& url) const override {
            if (loc_ == Location::Header) {
                set_header(req.headers, key_, value_);
            } else {
                // Relative targets were already resolved; work on the full URL
                req.url = url_utils::append_query_param(url_utils::to_string(url),
                                                        key_, value_);
            }
        }

       private:
        std::string key_;
        std::string value_;
        Location loc_;
    };

}  // namespace resilient_rest
