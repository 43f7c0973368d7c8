#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "cancellation.hpp"
#include "headers.hpp"

namespace resilient_rest {

    class RequestEngine;

    /// @brief Largest `$top` sent to an OData service.
    inline constexpr std::size_t kMaxODataPageSize = 1000;

    struct ODataQuery {
        /// `$filter` clause, sent URL-encoded.
        std::optional<std::string> filter;
        /// `$select` fields, comma-joined.
        std::vector<std::string> select;
        /// `$top` per page; capped at kMaxODataPageSize.
        std::size_t page_size{kMaxODataPageSize};
        std::optional<std::size_t> max_pages;
        /// Pause after each full page, jittered with the engine's factors.
        std::chrono::milliseconds page_delay{500};
    };

    /// @brief `<base>/<entity>?[$filter=..&][$select=..&]$top=N&$skip=M`.
    std::string build_odata_url(const std::string& base_url,
                                const std::string& entity,
                                const ODataQuery& query, std::size_t skip);

    /// @brief Copy of `entity` without its `@odata.*` annotations.
    nlohmann::json strip_odata_metadata(const nlohmann::json& entity);

    /**
     * @brief Read every entity of an OData collection with $top/$skip paging.
     *
     * Paging stops on an empty page, on a short page without
     * `@odata.nextLink`, or at max_pages. A failure on the first page is
     * thrown; a later failure ends paging with the entities already read.
     * @throws EngineError when the first page cannot be read.
     */
    std::vector<nlohmann::json> fetch_odata_entities(
        const RequestEngine& engine, const std::string& base_url,
        const std::string& entity, const ODataQuery& query = {},
        const Headers& headers = {}, const CancellationToken& token = {});

    /// @brief Field and condition pairs, in the order they are joined.
    using ODataConditions = std::vector<std::pair<std::string, nlohmann::json>>;

    /**
     * @brief `$filter` clause from field conditions joined with " and ".
     *
     * A string starting with a comparison operator (`eq`, `ne`, `gt`, `ge`,
     * `lt`, `le`) is used as given: {"age", "gt 30"} -> `age gt 30`. Other
     * strings compare for equality as quoted literals, numbers and booleans
     * as bare literals.
     * @return std::nullopt for no conditions.
     */
    std::optional<std::string> odata_filter_from(
        const ODataConditions& conditions);

    /// @brief Outcome of create_or_update.
    struct UpsertResult {
        bool success{false};
        /// "created", "updated" or "failed".
        std::string operation;
        std::string entity_id;
        std::string message;
        int status_code{0};
        /// Body returned by the create or update call.
        nlohmann::json raw_result;
    };

    /**
     * @brief Update the entity whose `key_field` equals `key_value`, or
     * create it when none exists.
     *
     * An existing entity is PATCHed at its `@odata.id` (else at
     * `<url>(<id>)`), with `If-Match` set to its `@odata.etag`. Failures are
     * reported in the result, never thrown.
     */
    UpsertResult create_or_update(const RequestEngine& engine,
                                  const std::string& url,
                                  const std::string& entity_name,
                                  const std::string& key_field,
                                  const std::string& key_value,
                                  const nlohmann::json& payload,
                                  const CancellationToken& token = {});

}  // namespace resilient_rest
