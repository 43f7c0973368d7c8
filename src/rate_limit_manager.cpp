#include "resilient_rest/rate_limit_manager.hpp"

#include <algorithm>
#include <charconv>
#include <stdexcept>

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        /// host[:port] as written in the URL, or the URL itself if unparsable.
        std::string authority_of(std::string_view url) {
            std::string_view s = url;
            if (s.rfind("https://", 0) == 0) {
                s.remove_prefix(8);
            } else if (s.rfind("http://", 0) == 0) {
                s.remove_prefix(7);
            } else {
                return std::string(url);
            }
            return std::string(s.substr(0, s.find_first_of("/?#")));
        }

        std::optional<long> header_number(const Headers& headers,
                                          std::string_view name) {
            auto raw = find_header(headers, name);
            if (!raw) return std::nullopt;
            long value = 0;
            const char* first = raw->data();
            const char* last = raw->data() + raw->size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc{} || ptr != last) return std::nullopt;
            return value;
        }

        /// Make room for one more key by dropping the least recently used.
        template <typename Map>
        void evict_oldest_if_full(Map& map, std::size_t max_keys) {
            if (map.size() < max_keys) return;
            auto oldest = std::min_element(
                map.begin(), map.end(), [](const auto& a, const auto& b) {
                    return a.second.last_used < b.second.last_used;
                });
            log::logger()->debug("Rate limit registry full ({}), dropping {}",
                                 max_keys, oldest->first);
            map.erase(oldest);
        }
    }  // namespace

    RateLimitManager::RateLimitManager(RateLimitConfiguration defaults,
                                       std::size_t max_tracked_keys)
        : defaults_(defaults), max_keys_(max_tracked_keys) {
        if (max_keys_ == 0) {
            throw std::invalid_argument(
                "RateLimitManager: max_tracked_keys must be > 0");
        }
    }

    void RateLimitManager::configure_endpoint(std::string pattern,
                                              EndpointLimits limits) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = std::find_if(patterns_.begin(), patterns_.end(),
                               [&](const auto& p) { return p.first == pattern; });
        if (it != patterns_.end()) {
            it->second = std::move(limits);
        } else {
            patterns_.emplace_back(std::move(pattern), std::move(limits));
        }
    }

    RateLimitManager::Match RateLimitManager::match_(
        std::string_view url) const {
        const std::string authority = authority_of(url);
        std::string host = authority;
        if (auto colon = host.rfind(':'); colon != std::string::npos) {
            host.erase(colon);
        }

        const EndpointLimits* found = nullptr;
        for (const auto& [pattern, limits] : patterns_) {
            if (pattern == authority || pattern == host) {
                found = &limits;
                break;
            }
        }
        if (!found) {
            for (const auto& [pattern, limits] : patterns_) {
                if (url.find(pattern) != std::string_view::npos) {
                    found = &limits;
                    break;
                }
            }
        }

        Match m;
        if (found) {
            m.limits = *found;
        } else {
            m.limits.calls_per_second =
                defaults_.enabled ? defaults_.calls_per_second : 0.0;
            m.limits.burst_size = defaults_.burst_size;
        }
        m.key = m.limits.shared_pool ? *m.limits.shared_pool : authority;
        return m;
    }

    std::shared_ptr<RateLimiter> RateLimitManager::limiter_for(
        std::string_view url) {
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lk(mu_);
        Match m = match_(url);
        if (auto it = limiters_.find(m.key); it != limiters_.end()) {
            it->second.last_used = now;
            return it->second.value;
        }

        evict_oldest_if_full(limiters_, max_keys_);
        auto limiter = std::make_shared<RateLimiter>(m.limits.calls_per_second,
                                                     m.limits.burst_size);
        limiters_.emplace(m.key, Tracked<std::shared_ptr<RateLimiter>>{
                                     limiter, now});
        log::logger()->debug("Created rate limiter for {}: {} cps, burst={}",
                             m.key, m.limits.calls_per_second,
                             m.limits.burst_size);
        return limiter;
    }

    std::optional<RateLimitSnapshot> RateLimitManager::update_from_headers(
        std::string_view url, const Headers& headers) {
        auto limit = header_number(headers, "X-RateLimit-Limit");
        auto remaining = header_number(headers, "X-RateLimit-Remaining");
        if (!limit || !remaining) return std::nullopt;

        RateLimitSnapshot snap{*limit, *remaining,
                               header_number(headers, "X-RateLimit-Reset")};
        {
            const auto now = std::chrono::steady_clock::now();
            std::lock_guard<std::mutex> lk(mu_);
            std::string key = match_(url).key;
            if (auto it = reported_.find(key); it != reported_.end()) {
                it->second = Tracked<RateLimitSnapshot>{snap, now};
            } else {
                evict_oldest_if_full(reported_, max_keys_);
                reported_.emplace(std::move(key),
                                  Tracked<RateLimitSnapshot>{snap, now});
            }
        }
        log::logger()->debug("Rate limit for {}: {}/{} remaining", url,
                             snap.remaining, snap.limit);
        return snap;
    }

    std::optional<RateLimitSnapshot> RateLimitManager::last_reported(
        std::string_view url) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = reported_.find(match_(url).key);
        if (it == reported_.end()) return std::nullopt;
        return it->second.value;
    }

    std::size_t RateLimitManager::limiter_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return limiters_.size();
    }

}  // namespace resilient_rest
