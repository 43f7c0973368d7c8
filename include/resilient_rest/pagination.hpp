#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cancellation.hpp"
#include "headers.hpp"
#include "operation_result.hpp"
#include "result.hpp"
#include "url.hpp"

namespace resilient_rest {

    class RequestEngine;

    /// @brief Represents a single page of results.
    struct Page {
        std::vector<nlohmann::json> items;
        std::optional<std::string> next_url;

        /// @brief Items converted through nlohmann's from_json.
        template <typename T>
        std::vector<T> items_as() const {
            std::vector<T> out;
            out.reserve(items.size());
            for (const auto& item : items) out.push_back(item.get<T>());
            return out;
        }
    };

    /// @brief Helper to parse RFC 5988 Link headers.
    class LinkHeader {
       public:
        static std::optional<std::string> get_next_url(const Headers& headers);
    };

    /**
     * @brief Items and next link of one page body.
     *
     * Accepts an OData body (`value` array, `@odata.nextLink`) or a bare JSON
     * array. A Link header `rel="next"` is used when the body names no next
     * page.
     * @throws OperationError when the payload is not JSON.
     */
    Page page_from(const OperationResult& result);

    /// @brief Pager for synchronous result iteration over a RequestEngine.
    class Pager {
       public:
        Pager(const RequestEngine& engine, std::string initial_url,
              Headers headers = {}, CancellationToken token = {});

        /// @brief Fetch the next page of results.
        /// @return std::nullopt once no pages remain.
        /// @throws EngineError when the request fails; the pager then stops.
        std::optional<Page> next();

        bool has_next() const noexcept { return next_url_.has_value(); }

        std::size_t pages_fetched() const noexcept { return fetched_; }

       private:
        Result<UrlComponents> absolute_url_(const std::string& url) const;

        const RequestEngine& engine_;
        std::optional<std::string> next_url_;
        Headers headers_;
        CancellationToken token_;
        std::size_t fetched_{0};
    };

}  // namespace resilient_rest
