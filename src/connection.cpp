#include "resilient_rest/connection/connection.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <type_traits>

#include "resilient_rest/logging.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace resilient_rest {

    namespace {
        // How long the driver blocks in the io_context before re-checking
        // cancellation and the deadline.
        constexpr auto kDriveSlice = std::chrono::milliseconds(20);
    }  // namespace

    HttpConnection::HttpConnection(ssl::context& ssl_ctx, Endpoint endpoint)
        : m_ssl_ctx(ssl_ctx),
          m_endpoint(std::move(endpoint)),
          m_resolver(m_io) {
        m_endpoint.normalize_default_port();
        m_endpoint.normalize_host();
    }

    HttpConnection::~HttpConnection() noexcept { close(); }

    void HttpConnection::close() noexcept {
        if (auto* s = lowest_layer_()) {
            beast::error_code ec;
            s->socket().shutdown(tcp::socket::shutdown_both, ec);
            s->socket().close(ec);
        }
        m_stream.emplace<std::monostate>();
        m_buffer.consume(m_buffer.size());
        m_completed = 0;
    }

    bool HttpConnection::is_open() const noexcept {
        const auto* s = lowest_layer_();
        return s != nullptr && s->socket().is_open();
    }

    HttpConnection::HttpStream* HttpConnection::lowest_layer_() noexcept {
        if (auto* s = std::get_if<HttpStream>(&m_stream)) return s;
        if (auto* s = std::get_if<HttpsStream>(&m_stream))
            return &beast::get_lowest_layer(*s);
        return nullptr;
    }

    const HttpConnection::HttpStream* HttpConnection::lowest_layer_()
        const noexcept {
        return const_cast<HttpConnection*>(this)->lowest_layer_();
    }

    HttpConnection::Interrupt HttpConnection::run_until_done_(
        const bool& done, const SendOptions& options,
        clock::time_point deadline) {
        Interrupt why = Interrupt::None;
        m_io.restart();
        while (!done) {
            if (why == Interrupt::None) {
                if (options.token.cancelled()) {
                    why = Interrupt::Cancelled;
                } else if (options.token.deadline_exceeded() ||
                           clock::now() >= deadline) {
                    why = Interrupt::Deadline;
                }
                if (why != Interrupt::None) cancel_io_();
            }
            m_io.run_one_for(kDriveSlice);
            // Out of work without completing: the handler can never run
            if (m_io.stopped() && !done) break;
        }
        return why;
    }

    void HttpConnection::cancel_io_() noexcept {
        m_resolver.cancel();
        if (auto* s = lowest_layer_()) {
            beast::error_code ec;
            s->cancel();
            s->socket().close(ec);
        }
    }

    bool HttpConnection::is_stale_() noexcept {
        auto* lowest = lowest_layer_();
        if (lowest == nullptr) return true;

        auto& sock = lowest->socket();
        beast::error_code ec;
        sock.non_blocking(true, ec);
        if (ec) return true;

        // An idle keep-alive socket has nothing to read. EOF or stray bytes
        // mean the server is done with it.
        char probe = 0;
        sock.receive(net::buffer(&probe, 1), tcp::socket::message_peek, ec);

        beast::error_code restore;
        sock.non_blocking(false, restore);
        return ec != net::error::would_block;
    }

    Status HttpConnection::ensure_connected_(const SendOptions& options,
                                             clock::time_point deadline) {
        if (is_open()) {
            if (!is_stale_()) return ok_status();
            log::logger()->debug("Dropping stale keep-alive connection to {}",
                                 m_endpoint.key());
        }
        close();

        beast::error_code ec;
        bool done = false;

        tcp::resolver::results_type results;
        m_resolver.async_resolve(
            m_endpoint.host, m_endpoint.port,
            [&](const beast::error_code& e, tcp::resolver::results_type r) {
                ec = e;
                results = std::move(r);
                done = true;
            });
        Interrupt why = run_until_done_(done, options, deadline);
        if (!done) ec = net::error::operation_aborted;
        if (ec || why != Interrupt::None) {
            return Status::err(map_error_(Phase::Resolve, ec, why, options));
        }

        if (m_endpoint.https) {
            auto& tls = m_stream.emplace<HttpsStream>(m_io, m_ssl_ctx);
            if (!set_sni(tls, m_endpoint.host, ec)) {
                auto err = map_error_(Phase::Handshake, ec, Interrupt::None,
                                      options);
                close();
                return Status::err(std::move(err));
            }
            tls.set_verify_callback(
                ssl::host_name_verification(m_endpoint.host));
        } else {
            m_stream.emplace<HttpStream>(m_io);
        }

        auto* lowest = lowest_layer_();
        lowest->expires_at(deadline);
        done = false;
        lowest->async_connect(
            results, [&](const beast::error_code& e, const tcp::endpoint&) {
                ec = e;
                done = true;
            });
        why = run_until_done_(done, options, deadline);
        if (!done) ec = net::error::operation_aborted;
        if (ec || why != Interrupt::None) {
            auto err = map_error_(Phase::Connect, ec, why, options);
            close();
            return Status::err(std::move(err));
        }

        if (auto* tls = std::get_if<HttpsStream>(&m_stream)) {
            lowest->expires_at(deadline);
            done = false;
            tls->async_handshake(ssl::stream_base::client,
                                 [&](const beast::error_code& e) {
                                     ec = e;
                                     done = true;
                                 });
            why = run_until_done_(done, options, deadline);
            if (!done) ec = net::error::operation_aborted;
            if (ec || why != Interrupt::None) {
                auto err = map_error_(Phase::Handshake, ec, why, options);
                close();
                return Status::err(std::move(err));
            }
        }

        log::logger()->debug("Connected to {}", m_endpoint.key());
        return ok_status();
    }

    Result<Response> HttpConnection::request(const PreparedRequest& preq,
                                             const SendOptions& options) {
        if (preq.endpoint != m_endpoint) {
            return Result<Response>::err(
                Error::Code::InvalidUrl,
                "PreparedRequest endpoint does not match Connection endpoint");
        }
        if (options.token.stop_requested()) {
            return Result<Response>::err(map_error_(
                Phase::Connect, {},
                options.token.cancelled() ? Interrupt::Cancelled
                                          : Interrupt::Deadline,
                options));
        }

        auto deadline = clock::now() + options.timeout;
        if (auto d = options.token.deadline(); d && *d < deadline) {
            deadline = *d;
        }

        auto connected = ensure_connected_(options, deadline);
        if (connected.has_error()) return connected.forward_error<Response>();

        beast::error_code ec;
        bool done = false;
        auto* lowest = lowest_layer_();

        lowest->expires_at(deadline);
        std::visit(
            [&](auto& stream) {
                using T = std::decay_t<decltype(stream)>;
                if constexpr (!std::is_same_v<T, std::monostate>) {
                    http::async_write(
                        stream, preq.beast_req,
                        [&](const beast::error_code& e, std::size_t) {
                            ec = e;
                            done = true;
                        });
                }
            },
            m_stream);
        Interrupt why = run_until_done_(done, options, deadline);
        if (!done) ec = net::error::operation_aborted;
        if (ec || why != Interrupt::None) {
            auto err = map_error_(Phase::Write, ec, why, options);
            close();
            return Result<Response>::err(std::move(err));
        }

        http::response_parser<http::string_body> parser;
        parser.body_limit(options.max_body_bytes);
        if (preq.beast_req.method() == http::verb::head) parser.skip(true);

        lowest->expires_at(deadline);
        done = false;
        std::visit(
            [&](auto& stream) {
                using T = std::decay_t<decltype(stream)>;
                if constexpr (!std::is_same_v<T, std::monostate>) {
                    http::async_read(
                        stream, m_buffer, parser,
                        [&](const beast::error_code& e, std::size_t) {
                            ec = e;
                            done = true;
                        });
                }
            },
            m_stream);
        why = run_until_done_(done, options, deadline);
        if (!done) ec = net::error::operation_aborted;
        if (ec || why != Interrupt::None) {
            auto err = map_error_(Phase::Read, ec, why, options);
            close();
            return Result<Response>::err(std::move(err));
        }

        ++m_completed;
        auto beast_res = parser.release();
        const bool keep_alive = beast_res.keep_alive();
        Response out = parse_beast_response(std::move(beast_res));

        if (keep_alive) {
            lowest->expires_never();
        } else {
            close();
        }
        return Result<Response>::ok(std::move(out));
    }

    Error HttpConnection::map_error_(Phase phase, const beast::error_code& ec,
                                     Interrupt why,
                                     const SendOptions& options) const {
        const std::string where = m_endpoint.key();

        if (why == Interrupt::Cancelled || options.token.cancelled()) {
            return Error{Error::Code::Cancelled,
                         "Request to " + where + " cancelled"};
        }
        if (options.token.deadline_exceeded()) {
            return Error{Error::Code::Cancelled,
                         "Caller deadline exceeded during request to " + where};
        }

        const bool timed_out =
            why == Interrupt::Deadline || ec == beast::error::timeout;
        const std::string detail = timed_out ? "timed out" : ec.message();

        switch (phase) {
            case Phase::Resolve:
                return Error{Error::Code::ConnectionFailed,
                             "Resolve " + where + " failed: " + detail};
            case Phase::Connect:
                return Error{Error::Code::ConnectionFailed,
                             "Connect to " + where + " failed: " + detail};
            case Phase::Handshake:
                return Error{Error::Code::TlsHandshakeFailed,
                             "TLS handshake with " + where + " failed: " +
                                 detail};
            case Phase::Write:
                return Error{timed_out ? Error::Code::Timeout
                                       : Error::Code::SendFailed,
                             "Write to " + where + " failed: " + detail};
            case Phase::Read:
                return Error{timed_out ? Error::Code::Timeout
                                       : Error::Code::ReceiveFailed,
                             "Read from " + where + " failed: " + detail};
        }
        return Error{Error::Code::Unknown, "Request to " + where + " failed"};
    }

}  // namespace resilient_rest
