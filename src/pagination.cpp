#include "resilient_rest/pagination.hpp"

#include "resilient_rest/request_engine.hpp"
#include "resilient_rest/url.hpp"

namespace resilient_rest {

    std::optional<std::string> LinkHeader::get_next_url(const Headers& headers) {
        auto link = find_header(headers, "Link");
        if (!link) return std::nullopt;

        const std::string& link_header = *link;
        // Link header can contain multiple links separated by comma
        // Format: <url>; rel="next", <url>; rel="prev"
        size_t start = 0;
        while (start < link_header.size()) {
            size_t end = link_header.find(',', start);
            std::string_view section = std::string_view(link_header).substr(
                start, (end == std::string::npos) ? std::string::npos
                                                  : (end - start));

            size_t url_start = section.find('<');
            size_t url_end = section.find('>');
            if (url_start != std::string::npos &&
                url_end != std::string::npos && url_end > url_start) {
                std::string_view url =
                    section.substr(url_start + 1, url_end - url_start - 1);

                if (section.find("rel=\"next\"") != std::string::npos ||
                    section.find("rel=next") != std::string::npos) {
                    return std::string(url);
                }
            }

            if (end == std::string::npos) {
                break;
            }
            start = end + 1;
        }
        return std::nullopt;
    }

    Page page_from(const OperationResult& result) {
        Page page;
        nlohmann::json body = result.json();

        if (body.is_array()) {
            page.items.assign(body.begin(), body.end());
        } else if (body.is_object()) {
            auto value = body.find("value");
            if (value != body.end() && value->is_array()) {
                page.items.assign(value->begin(), value->end());
            }
            auto next = body.find("@odata.nextLink");
            if (next != body.end() && next->is_string()) {
                page.next_url = next->get<std::string>();
            }
        }

        if (!page.next_url) {
            page.next_url = LinkHeader::get_next_url(result.headers);
        }
        return page;
    }

    Pager::Pager(const RequestEngine& engine, std::string initial_url,
                 Headers headers, CancellationToken token)
        : engine_(engine),
          next_url_(std::move(initial_url)),
          headers_(std::move(headers)),
          token_(std::move(token)) {}

    Result<UrlComponents> Pager::absolute_url_(const std::string& url) const {
        if (url_utils::is_absolute_url_with_protocol(url)) return parse_url(url);
        const auto& base_url = engine_.config().base_url;
        if (!base_url) {
            return url_utils::make_url_error("No base_url to resolve " + url);
        }
        auto base = url_utils::parse_base_url(*base_url);
        if (base.has_error()) return base;
        return url_utils::resolve_url(url, &base.value());
    }

    std::optional<Page> Pager::next() {
        if (!next_url_) return std::nullopt;

        // Stop on failure so a caller that catches does not loop forever.
        std::string url = std::move(*next_url_);
        next_url_.reset();

        OperationResult result = engine_.get(url, headers_, token_);
        Page page = page_from(result);
        ++fetched_;

        // Relative next links are relative to the page that named them.
        if (page.next_url &&
            !url_utils::is_absolute_url_with_protocol(*page.next_url)) {
            auto current = absolute_url_(url);
            if (current.has_value()) {
                auto resolved = url_utils::resolve_reference(current.value(),
                                                             *page.next_url);
                if (resolved.has_value()) {
                    page.next_url = url_utils::to_string(resolved.value());
                }
            }
        }
        next_url_ = page.next_url;
        return page;
    }

}  // namespace resilient_rest
