#include "resilient_rest/odata.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include "resilient_rest/backoff.hpp"
#include "resilient_rest/logging.hpp"
#include "resilient_rest/pagination.hpp"
#include "resilient_rest/request_engine.hpp"
#include "resilient_rest/url.hpp"

namespace resilient_rest {

    namespace {
        constexpr std::array<std::string_view, 6> kOperators{"eq", "ne", "gt",
                                                             "ge", "lt", "le"};

        bool starts_with_operator(std::string_view condition) {
            auto first = condition.substr(0, condition.find(' '));
            return condition.size() > first.size() &&
                   std::find(kOperators.begin(), kOperators.end(), first) !=
                       kOperators.end();
        }

        // OData string literals escape a quote by doubling it.
        std::string quote_literal(std::string_view value) {
            std::string out = "'";
            for (char c : value) {
                if (c == '\'') out += '\'';
                out += c;
            }
            out += '\'';
            return out;
        }

        std::string join(const std::vector<std::string>& parts,
                         std::string_view sep) {
            std::string out;
            for (const auto& p : parts) {
                if (!out.empty()) out += sep;
                out += p;
            }
            return out;
        }

        std::string literal_text(const nlohmann::json& value) {
            return value.is_string() ? value.get<std::string>() : value.dump();
        }
    }  // namespace

    std::string build_odata_url(const std::string& base_url,
                                const std::string& entity,
                                const ODataQuery& query, std::size_t skip) {
        const std::size_t top = std::min(query.page_size, kMaxODataPageSize);

        std::string url = url_utils::trim_trailing_slashes(base_url) + "/" +
                          entity + "?";
        if (query.filter && !query.filter->empty()) {
            url += "$filter=" + url_utils::url_encode(*query.filter) + "&";
        }
        if (!query.select.empty()) {
            url += "$select=" + join(query.select, ",") + "&";
        }
        url += "$top=" + std::to_string(top) + "&$skip=" + std::to_string(skip);
        return url;
    }

    nlohmann::json strip_odata_metadata(const nlohmann::json& entity) {
        if (!entity.is_object()) return entity;
        nlohmann::json out = nlohmann::json::object();
        for (auto it = entity.begin(); it != entity.end(); ++it) {
            if (it.key().rfind("@odata.", 0) != 0) out[it.key()] = it.value();
        }
        return out;
    }

    std::vector<nlohmann::json> fetch_odata_entities(
        const RequestEngine& engine, const std::string& base_url,
        const std::string& entity, const ODataQuery& query,
        const Headers& headers, const CancellationToken& token) {
        const std::size_t page_size =
            std::max<std::size_t>(1, std::min(query.page_size, kMaxODataPageSize));
        Jitter jitter(engine.config().jitter);
        auto logger = log::logger();

        std::vector<nlohmann::json> entities;
        std::size_t skip = 0;
        std::size_t page_num = 1;

        logger->info("Starting paginated fetch of {}", entity);
        if (query.filter) logger->debug("Filter: {}", *query.filter);

        while (true) {
            if (query.max_pages && page_num > *query.max_pages) {
                logger->info("Reached max pages limit ({})", *query.max_pages);
                break;
            }

            const std::string url =
                build_odata_url(base_url, entity, query, skip);
            Page page;
            try {
                logger->debug("Fetching page {} (skip={}, top={})", page_num,
                              skip, page_size);
                page = page_from(engine.get(url, headers, token));
            } catch (const EngineError& e) {
                logger->error("Failed to fetch page {} of {}: {}", page_num,
                              entity, e.what());
                if (page_num == 1) throw;
                logger->warn("Continuing with {} entities from successful pages",
                             entities.size());
                break;
            }

            if (page.items.empty()) {
                logger->info("No more {} found, pagination complete", entity);
                break;
            }
            const std::size_t received = page.items.size();
            for (const auto& item : page.items) {
                entities.push_back(strip_odata_metadata(item));
            }
            logger->debug("Page {}: retrieved {} entities (total: {})",
                          page_num, received, entities.size());

            if (!page.next_url && received < page_size) {
                logger->debug("Last page reached (got {} < {})", received,
                              page_size);
                break;
            }

            skip += page_size;
            ++page_num;

            if (received == page_size && query.page_delay.count() > 0) {
                const auto delay = jitter.apply(query.page_delay);
                logger->debug("Sleeping {} ms between pages", delay.count());
                if (!token.wait_for(delay)) {
                    logger->warn("Paging of {} stopped by caller", entity);
                    break;
                }
            }
        }

        logger->info("Retrieved total of {} {} entities across {} pages",
                     entities.size(), entity, page_num);
        return entities;
    }

    std::optional<std::string> odata_filter_from(
        const ODataConditions& conditions) {
        std::vector<std::string> parts;
        parts.reserve(conditions.size());
        for (const auto& [field, condition] : conditions) {
            if (condition.is_string()) {
                const auto& text = condition.get_ref<const std::string&>();
                parts.push_back(starts_with_operator(text)
                                    ? field + " " + text
                                    : field + " eq " + quote_literal(text));
            } else {
                parts.push_back(field + " eq " + condition.dump());
            }
        }
        if (parts.empty()) return std::nullopt;
        return join(parts, " and ");
    }

    UpsertResult create_or_update(const RequestEngine& engine,
                                  const std::string& url,
                                  const std::string& entity_name,
                                  const std::string& key_field,
                                  const std::string& key_value,
                                  const nlohmann::json& payload,
                                  const CancellationToken& token) {
        auto logger = log::logger();
        UpsertResult out;
        out.entity_id = key_value;

        try {
            const std::string filter_url =
                url + (url.find('?') == std::string::npos ? "?" : "&") +
                "$filter=" +
                url_utils::url_encode(key_field + " eq " +
                                      quote_literal(key_value));
            logger->debug("Checking for existing {} with {}='{}'", entity_name,
                          key_field, key_value);

            Page existing = page_from(engine.get(filter_url, {}, token));

            if (!existing.items.empty() && existing.items.front().is_object()) {
                const nlohmann::json& found = existing.items.front();

                std::string update_url;
                if (auto id = found.find("@odata.id"); id != found.end()) {
                    update_url = literal_text(*id);
                } else {
                    auto plain = found.find("id");
                    update_url = url + "(" +
                                 (plain != found.end() ? literal_text(*plain)
                                                       : key_value) +
                                 ")";
                }

                Headers headers;
                if (auto etag = found.find("@odata.etag");
                    etag != found.end() && etag->is_string()) {
                    headers = with_if_match(std::move(headers),
                                            etag->get<std::string>());
                }

                logger->debug("Updating existing {} {}", entity_name, key_value);
                OperationResult updated =
                    engine.patch(update_url, payload.dump(), headers, token);

                out.success = true;
                out.operation = "updated";
                out.message = "Updated existing " + entity_name;
                out.status_code = updated.status_code.value_or(200);
                out.raw_result = updated.json();
                return out;
            }

            logger->debug("Creating new {} {}", entity_name, key_value);
            OperationResult created =
                engine.post(url, payload.dump(), {}, token);

            out.success = true;
            out.operation = "created";
            out.message = "Created new " + entity_name;
            out.status_code = created.status_code.value_or(201);
            out.raw_result = created.json();
        } catch (const EngineError& e) {
            logger->error("Failed to create/update {} {}: {}", entity_name,
                          key_value, e.what());
            out.success = false;
            out.operation = "failed";
            out.message = e.what();
            out.status_code = e.status_code().value_or(0);
        }
        return out;
    }

}  // namespace resilient_rest
