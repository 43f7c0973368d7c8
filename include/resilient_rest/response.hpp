#pragma once

#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "headers.hpp"

namespace resilient_rest {

    /**
     * @brief One HTTP response as received on the wire.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        /** @brief HTTP response headers, names as sent by the server. */
        Headers headers;
        /** @brief HTTP response body. */
        std::string body;

        /// @brief Case-insensitive header lookup.
        std::optional<std::string> header(std::string_view name) const {
            return find_header(headers, name);
        }
    };

    /// @brief Convert a Boost.Beast HTTP response to a Response.
    /// @note Repeated header names keep the last value.
    inline Response parse_beast_response(
        boost::beast::http::response<boost::beast::http::string_body>&&
            beast_res) {
        Response out;
        out.status_code = static_cast<int>(beast_res.result_int());

        for (const auto& field : beast_res.base()) {
            out.headers[std::string(field.name_string())] =
                std::string(field.value());
        }

        out.body = std::move(beast_res.body());
        return out;
    }

}  // namespace resilient_rest
