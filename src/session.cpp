#include "resilient_rest/connection/session.hpp"

#include "resilient_rest/logging.hpp"

namespace resilient_rest {

    namespace {
        bool is_reuse_failure(Error::Code code) {
            return code == Error::Code::SendFailed ||
                   code == Error::Code::ReceiveFailed;
        }
    }  // namespace

    HttpSession::HttpSession(Endpoint endpoint,
                             std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                             std::size_t max_idle_connections)
        : endpoint_(std::move(endpoint)),
          ssl_ctx_(std::move(ssl_ctx)),
          max_idle_(max_idle_connections) {
        endpoint_.normalize_default_port();
        endpoint_.normalize_host();
    }

    HttpSession::~HttpSession() { close(); }

    Result<Response> HttpSession::send(const PreparedRequest& request,
                                       const SendOptions& options) {
        auto conn = checkout_();
        if (!conn) conn = std::make_unique<HttpConnection>(*ssl_ctx_, endpoint_);

        const bool reused = conn->completed_requests() > 0;
        auto result = conn->request(request, options);

        if (result.has_error() && reused && options.idempotent &&
            is_reuse_failure(result.error().code) &&
            !options.token.stop_requested()) {
            log::logger()->debug(
                "Reused connection to {} failed ({}), retrying on a new one",
                endpoint_.key(), result.error().message);
            conn = std::make_unique<HttpConnection>(*ssl_ctx_, endpoint_);
            result = conn->request(request, options);
        }

        if (conn->is_open()) checkin_(std::move(conn));
        return result;
    }

    std::unique_ptr<HttpConnection> HttpSession::checkout_() {
        std::lock_guard<std::mutex> lk(mu_);
        if (idle_.empty()) return nullptr;
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return conn;
    }

    void HttpSession::checkin_(std::unique_ptr<HttpConnection> conn) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!is_closed() && idle_.size() < max_idle_) {
                idle_.push_back(std::move(conn));
                return;
            }
        }
        // Closed or full: conn is destroyed (and its socket closed) here,
        // outside the lock.
    }

    void HttpSession::close() noexcept {
        closed_.store(true, std::memory_order_release);
        std::vector<std::unique_ptr<HttpConnection>> dropped;
        {
            std::lock_guard<std::mutex> lk(mu_);
            dropped.swap(idle_);
        }
        dropped.clear();
    }

    std::size_t HttpSession::idle_connections() const {
        std::lock_guard<std::mutex> lk(mu_);
        return idle_.size();
    }

    std::shared_ptr<boost::asio::ssl::context> make_client_ssl_context(
        bool verify_tls) {
        auto ctx = std::make_shared<boost::asio::ssl::context>(
            boost::asio::ssl::context::tls_client);
        init_tls_on_ssl_context(*ctx, verify_tls);
        return ctx;
    }

    TransportFactory make_http_transport_factory(
        bool verify_tls, std::size_t max_idle_connections_per_session) {
        auto ssl_ctx = make_client_ssl_context(verify_tls);
        return [ssl_ctx, max_idle_connections_per_session](
                   const Endpoint& endpoint) -> std::shared_ptr<Transport> {
            return std::make_shared<HttpSession>(
                endpoint, ssl_ctx, max_idle_connections_per_session);
        };
    }

}  // namespace resilient_rest
