#pragma once

#include <cctype>
#include <string>
#include <string_view>

#include "result.hpp"

namespace resilient_rest {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Absolute URL: path + optional query.
        // Base URL (parse_base_url): normalized prefix ("" or "/api").
        std::string target;
    };

    namespace url_utils {

        inline Result<UrlComponents> make_url_error(std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        }

        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        inline bool is_default_port(const UrlComponents& u) {
            return (u.https && u.port == "443") || (!u.https && u.port == "80");
        }

        /// @brief scheme://host[:port] of a parsed URL. The port is omitted
        /// when it is the scheme default.
        inline std::string origin(const UrlComponents& u) {
            std::string out = u.https ? "https://" : "http://";
            out += u.host;
            if (!is_default_port(u)) {
                out += ':';
                out += u.port;
            }
            return out;
        }

        /// @brief Reassemble a full URL from its parts.
        inline std::string to_string(const UrlComponents& u) {
            return origin(u) + (u.target.empty() ? "/" : u.target);
        }

        /// @brief Percent-encode everything outside RFC 3986 unreserved.
        inline std::string url_encode(std::string_view in) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(in.size() * 3);
            for (unsigned char c : in) {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                    c == '~') {
                    out.push_back(static_cast<char>(c));
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief Append `key=value` to a URL, keeping any #fragment last.
        /// Both parts are percent-encoded.
        inline std::string append_query_param(std::string url,
                                              std::string_view key,
                                              std::string_view value) {
            std::string fragment;
            if (auto pos = url.find('#'); pos != std::string::npos) {
                fragment = url.substr(pos);
                url.erase(pos);
            }

            if (url.find('?') == std::string::npos) {
                url += '?';
            } else if (url.back() != '?' && url.back() != '&') {
                url += '&';
            }
            url += url_encode(key) + "=" + url_encode(value);
            url += fragment;
            return url;
        }

        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

        inline Result<UrlComponents> resolve_reference(
            const UrlComponents& from, std::string_view reference);

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        using url_utils::make_url_error;

        std::string_view s(url);

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_url_error("URL must start with http:// or https://");
        }

        // host[:port] ends at the first '/', '?' or '#'
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto end = s.find_first_of("/?#"); end != std::string_view::npos) {
            hostport = s.substr(0, end);
            path = s.substr(end);
        }
        if (auto hash = path.find('#'); hash != std::string_view::npos) {
            path = path.substr(0, hash);
        }

        if (hostport.empty()) {
            return make_url_error("URL missing host");
        }

        std::string host;
        std::string port;

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_url_error("URL has empty port");
            }
            for (char c : port) {
                if (!std::isdigit(static_cast<unsigned char>(c))) {
                    return make_url_error("URL has non-numeric port");
                }
            }
        } else {
            host = std::string(hostport);
            port = https ? "443" : "80";
        }

        if (host.empty()) {
            return make_url_error("URL has empty host");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        if (path.empty()) {
            out.target = "/";
        } else if (path.front() == '?') {
            out.target = "/" + std::string(path);
        } else {
            out.target = std::string(path);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            if (base_url.empty()) {
                return make_url_error("base_url is empty");
            }
            if (!is_absolute_url_with_protocol(base_url)) {
                return make_url_error(
                    "base_url must start with http:// or https://");
            }

            auto parsed = resilient_rest::parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents b = std::move(parsed.value());

            b.target = trim_trailing_slashes(std::move(b.target));
            if (b.target == "/") b.target.clear();

            // Prefix joining stays a plain concatenation only without a query
            if (b.target.find('?') != std::string::npos) {
                return make_url_error(
                    "base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        /// @brief Resolve a request target. Absolute URLs are parsed;
        /// relative ones are appended to the base prefix.
        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return resilient_rest::parse_url(uri_or_url);
            }

            if (base == nullptr || base->host.empty() || base->port.empty()) {
                return make_url_error(
                    "Relative URI provided but base_url is empty");
            }

            std::string_view rel = uri_or_url;
            std::string rel_storage;

            if (rel.empty()) {
                rel = "/";
            } else if (rel.front() != '/') {
                rel_storage.reserve(rel.size() + 1);
                rel_storage.push_back('/');
                rel_storage.append(rel);
                rel = rel_storage;
            }

            UrlComponents out;
            out.https = base->https;
            out.host = base->host;
            out.port = base->port;
            out.target.reserve(base->target.size() + rel.size());
            out.target.append(base->target);
            out.target.append(rel);
            return Result<UrlComponents>::ok(std::move(out));
        }

        /// @brief Resolve a reference found in a response (e.g. a Location
        /// header) against the URL of the request that produced it.
        /// Handles absolute, scheme-relative, absolute-path, query-only and
        /// path-relative references.
        inline Result<UrlComponents> resolve_reference(
            const UrlComponents& from, std::string_view reference) {
            if (reference.empty()) {
                return make_url_error("empty URL reference");
            }
            if (is_absolute_url_with_protocol(reference)) {
                return resilient_rest::parse_url(reference);
            }
            if (reference.rfind("//", 0) == 0) {
                std::string scheme = from.https ? "https:" : "http:";
                return resilient_rest::parse_url(scheme +
                                                 std::string(reference));
            }

            UrlComponents out = from;
            std::string_view from_path = from.target;
            if (auto q = from_path.find('?'); q != std::string_view::npos) {
                from_path = from_path.substr(0, q);
            }

            if (reference.front() == '/') {
                out.target = std::string(reference);
            } else if (reference.front() == '?') {
                out.target = std::string(from_path) + std::string(reference);
            } else {
                auto slash = from_path.rfind('/');
                std::string dir = slash == std::string_view::npos
                                      ? std::string("/")
                                      : std::string(from_path.substr(0, slash + 1));
                out.target = dir + std::string(reference);
            }
            if (auto hash = out.target.find('#'); hash != std::string::npos) {
                out.target.erase(hash);
            }
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace resilient_rest
