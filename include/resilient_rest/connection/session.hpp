#pragma once

#include <atomic>
#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "connection.hpp"
#include "transport.hpp"

namespace resilient_rest {

    /**
     * @brief Transport for one host: a small stack of idle keep-alive
     * HttpConnections.
     *
     * send() checks out an idle connection (or opens a new one), performs
     * the exchange without holding the lock, and checks the connection back
     * in if it is still open. A failure on a reused connection is retried
     * once on a fresh connection when the request is idempotent.
     *
     * SAFETY: all methods are thread-safe. Connections are never shared
     * between concurrent sends.
     */
    class HttpSession : public Transport {
       public:
        HttpSession(Endpoint endpoint,
                    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                    std::size_t max_idle_connections);

        ~HttpSession() override;

        HttpSession(const HttpSession&) = delete;
        HttpSession& operator=(const HttpSession&) = delete;

        Result<Response> send(const PreparedRequest& request,
                              const SendOptions& options) override;

        /// @brief Drop idle connections; in-flight ones close on check-in.
        void close() noexcept override;

        bool is_closed() const noexcept override {
            return closed_.load(std::memory_order_acquire);
        }

        std::size_t idle_connections() const;

        const Endpoint& endpoint() const noexcept { return endpoint_; }

       private:
        std::unique_ptr<HttpConnection> checkout_();
        void checkin_(std::unique_ptr<HttpConnection> conn);

        Endpoint endpoint_;
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
        std::size_t max_idle_;

        mutable std::mutex mu_;
        std::vector<std::unique_ptr<HttpConnection>> idle_;
        std::atomic<bool> closed_{false};
    };

    /// @brief TLS client context shared by every session of a pool.
    /// @throws std::runtime_error if the system CA store cannot be loaded.
    std::shared_ptr<boost::asio::ssl::context> make_client_ssl_context(
        bool verify_tls);

    /// @brief Factory producing HttpSessions that share one TLS context.
    TransportFactory make_http_transport_factory(
        bool verify_tls, std::size_t max_idle_connections_per_session);

}  // namespace resilient_rest
