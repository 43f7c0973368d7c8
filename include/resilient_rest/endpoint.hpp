#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <stdexcept>
#include <string>

#include "url.hpp"

namespace resilient_rest {

    /// @brief The (scheme, host, port) triple a session is keyed by.
    struct Endpoint {
        std::string host;
        std::string port;
        bool https{false};

        inline void normalize_default_port() {
            if (port.empty()) port = https ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        /// @brief Host key `scheme://host:port` used by the SessionPool.
        std::string key() const {
            return std::string(https ? "https://" : "http://") + host + ":" +
                   port;
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.https == b.https && a.host == b.host && a.port == b.port;
        }

        friend bool operator!=(Endpoint const& a, Endpoint const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Normalized endpoint for a resolved URL.
    inline Endpoint endpoint_from_url(const UrlComponents& u) {
        Endpoint ep;
        ep.host = u.host;
        ep.port = u.port;
        ep.https = u.https;
        ep.normalize_default_port();
        ep.normalize_host();
        return ep;
    }

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Load the system CA store and require peer verification.
    /// @throws std::runtime_error when the default verify paths fail to load.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ssl_context,
                                        bool verify_peer = true) {
        if (!verify_peer) {
            ssl_context.set_verify_mode(boost::asio::ssl::verify_none);
            return;
        }
        try {
            ssl_context.set_default_verify_paths();
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to set default verify paths: ") + e.what());
        }
        ssl_context.set_verify_mode(boost::asio::ssl::verify_peer);
    }

}  // namespace resilient_rest
