#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace resilient_rest {

    using Headers = std::unordered_map<std::string, std::string>;

    inline bool iequals(std::string_view a, std::string_view b) noexcept {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) ==
                          std::tolower(static_cast<unsigned char>(y));
               });
    }

    /// @brief Case-insensitive lookup; HTTP field names are not case
    /// sensitive but the map keeps them as received.
    inline std::optional<std::string> find_header(const Headers& headers,
                                                  std::string_view name) {
        if (auto it = headers.find(std::string(name)); it != headers.end()) {
            return it->second;
        }
        for (const auto& [k, v] : headers) {
            if (iequals(k, name)) return v;
        }
        return std::nullopt;
    }

    inline void erase_header(Headers& headers, std::string_view name) {
        for (auto it = headers.begin(); it != headers.end();) {
            if (iequals(it->first, name))
                it = headers.erase(it);
            else
                ++it;
        }
    }

    /// @brief Set a header, replacing any existing spelling of the name.
    inline void set_header(Headers& headers, const std::string& name,
                           std::string value) {
        erase_header(headers, name);
        headers[name] = std::move(value);
    }

    /// @brief `overrides` win over `base`, compared case-insensitively.
    template <typename Map>
    Headers merge_headers(const Map& base, const Headers& overrides) {
        Headers out;
        for (const auto& [k, v] : base) set_header(out, k, v);
        for (const auto& [k, v] : overrides) set_header(out, k, v);
        return out;
    }

    /// @brief `If-Match` precondition for optimistic concurrency on PATCH and
    /// DELETE. An empty etag leaves the headers unchanged.
    inline Headers with_if_match(Headers headers, const std::string& etag) {
        if (!etag.empty()) set_header(headers, "If-Match", etag);
        return headers;
    }

}  // namespace resilient_rest
