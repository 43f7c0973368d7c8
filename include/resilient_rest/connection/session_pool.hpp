#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "resilient_rest/config.hpp"
#include "resilient_rest/endpoint.hpp"
#include "transport.hpp"

namespace resilient_rest {

    /// @brief Counters for monitoring session cache behavior.
    struct SessionPoolMetrics {
        std::atomic<std::uint64_t> created{0};   ///< Cache misses
        std::atomic<std::uint64_t> reused{0};    ///< Cache hits
        std::atomic<std::uint64_t> evicted{0};   ///< LRU evictions (closed)
        std::atomic<std::uint64_t> replaced{0};  ///< Closed entries rebuilt
    };

    /**
     * Bounded, thread-safe LRU cache of transports keyed by host.
     *
     * INVARIANTS:
     * 1. size() <= max_sessions at every observation point
     * 2. An entry leaves the cache only through eviction or close_all(), and
     *    its transport is closed when it does
     * 3. Lookup, eviction and insertion happen as one step under the lock;
     *    closing the evicted transport happens after the lock is released
     *
     * A Lease shares ownership of its transport, so an entry evicted while a
     * request is in flight stays valid until that request returns.
     */
    class SessionPool {
       public:
        /// @brief Borrowed transport, valid for one request.
        class Lease {
           public:
            Lease() = default;

            Lease(Lease&&) noexcept = default;
            Lease& operator=(Lease&&) noexcept = default;

            Lease(Lease const&) = delete;
            Lease& operator=(Lease const&) = delete;

            Transport* operator->() const noexcept { return transport_.get(); }

            Transport& operator*() const { return *transport_; }

            Transport* get() const noexcept { return transport_.get(); }

            explicit operator bool() const noexcept {
                return transport_ != nullptr;
            }

            /// @brief Host key of the leased session.
            const std::string& key() const noexcept { return key_; }

           private:
            friend class SessionPool;

            Lease(std::shared_ptr<Transport> transport, std::string key)
                : transport_(std::move(transport)), key_(std::move(key)) {}

            std::shared_ptr<Transport> transport_;
            std::string key_;
        };

        /// @brief Pool building transports with `factory`, usually
        /// make_http_transport_factory().
        /// @throws std::invalid_argument if max_sessions is 0 or factory is empty.
        SessionPool(SessionPoolConfiguration cfg, TransportFactory factory);

        ~SessionPool();

        SessionPool(const SessionPool&) = delete;
        SessionPool& operator=(const SessionPool&) = delete;

        /// @brief Cached transport for `endpoint`'s host key, created on miss
        /// and marked most recently used.
        /// @throws std::runtime_error if the factory returns no transport.
        Lease lease(const Endpoint& endpoint);

        std::size_t size() const;

        std::size_t capacity() const noexcept { return cfg_.max_sessions; }

        bool contains(const std::string& key) const;

        /// @brief Cached host keys, most recently used first.
        std::vector<std::string> keys() const;

        /// @brief Close and drop every cached transport.
        void close_all();

        const SessionPoolMetrics& metrics() const noexcept { return metrics_; }

       private:
        struct Entry {
            std::string key;
            std::shared_ptr<Transport> transport;
            std::chrono::steady_clock::time_point last_used;
        };

        SessionPoolConfiguration cfg_;
        TransportFactory factory_;

        mutable std::mutex mu_;
        std::list<Entry> lru_;  // front = most recently used
        std::unordered_map<std::string, std::list<Entry>::iterator> index_;

        SessionPoolMetrics metrics_;
    };

}  // namespace resilient_rest
