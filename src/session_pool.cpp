#include "resilient_rest/connection/session_pool.hpp"

#include <stdexcept>

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    SessionPool::SessionPool(SessionPoolConfiguration cfg,
                             TransportFactory factory)
        : cfg_(cfg), factory_(std::move(factory)) {
        if (cfg_.max_sessions == 0) {
            throw std::invalid_argument("SessionPool requires max_sessions >= 1");
        }
        if (!factory_) {
            throw std::invalid_argument("SessionPool requires a transport factory");
        }
    }

    SessionPool::~SessionPool() { close_all(); }

    SessionPool::Lease SessionPool::lease(const Endpoint& endpoint) {
        Endpoint ep = endpoint;
        ep.normalize_default_port();
        ep.normalize_host();
        std::string key = ep.key();

        std::shared_ptr<Transport> out;
        std::shared_ptr<Transport> evicted;
        std::shared_ptr<Transport> stale;
        std::string evicted_key;
        {
            std::lock_guard<std::mutex> lk(mu_);
            const auto now = std::chrono::steady_clock::now();

            if (auto it = index_.find(key); it != index_.end()) {
                auto entry = it->second;
                if (!entry->transport->is_closed()) {
                    lru_.splice(lru_.begin(), lru_, entry);
                    entry->last_used = now;
                    metrics_.reused.fetch_add(1, std::memory_order_relaxed);
                    return Lease(entry->transport, std::move(key));
                }
                // Closed behind our back: rebuild below
                stale = std::move(entry->transport);
                lru_.erase(entry);
                index_.erase(it);
                metrics_.replaced.fetch_add(1, std::memory_order_relaxed);
            }

            out = factory_(ep);
            if (!out) {
                throw std::runtime_error("Transport factory returned no transport for " +
                                         key);
            }

            if (lru_.size() >= cfg_.max_sessions) {
                Entry& victim = lru_.back();
                evicted = std::move(victim.transport);
                evicted_key = std::move(victim.key);
                index_.erase(evicted_key);
                lru_.pop_back();
                metrics_.evicted.fetch_add(1, std::memory_order_relaxed);
            }

            lru_.push_front(Entry{key, out, now});
            index_[key] = lru_.begin();
            metrics_.created.fetch_add(1, std::memory_order_relaxed);
        }

        if (evicted) {
            log::logger()->debug("Session pool full ({}), evicting {}",
                                 cfg_.max_sessions, evicted_key);
            evicted->close();
        }
        return Lease(std::move(out), std::move(key));
    }

    std::size_t SessionPool::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return lru_.size();
    }

    bool SessionPool::contains(const std::string& key) const {
        std::lock_guard<std::mutex> lk(mu_);
        return index_.count(key) != 0;
    }

    std::vector<std::string> SessionPool::keys() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::vector<std::string> out;
        out.reserve(lru_.size());
        for (const auto& e : lru_) out.push_back(e.key);
        return out;
    }

    void SessionPool::close_all() {
        std::list<Entry> dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped.swap(lru_);
            index_.clear();
        }
        for (auto& e : dropped) {
            if (e.transport) e.transport->close();
        }
        if (!dropped.empty()) {
            log::logger()->debug("Closed {} cached sessions", dropped.size());
        }
    }

}  // namespace resilient_rest
