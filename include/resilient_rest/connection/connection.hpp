#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <cstddef>
#include <variant>

#include "../endpoint.hpp"  // Endpoint, set_sni
#include "../request.hpp"   // PreparedRequest
#include "../response.hpp"  // Response, parse_beast_response
#include "../result.hpp"    // Result, Error
#include "transport.hpp"    // SendOptions

namespace resilient_rest {

    /**
     * @brief One keep-alive HTTP/1.1 connection to a single endpoint.
     *
     * Blocking from the caller's point of view, but every network operation
     * is an asynchronous Beast operation driven on a private io_context in
     * short slices. Between slices the connection checks the caller's
     * CancellationToken and the attempt deadline, and aborts the pending
     * operation when either fires. Not thread-safe: one request at a time.
     */
    class HttpConnection {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;
        using clock = std::chrono::steady_clock;

        /// Which step of the exchange failed; decides the Error::Code.
        enum class Phase { Resolve, Connect, Handshake, Write, Read };

        /// Why the driver loop aborted a pending operation, if it did.
        enum class Interrupt { None, Cancelled, Deadline };

       public:
        /**
         * @brief Constructs an unconnected HttpConnection.
         * @param ssl_ctx TLS context for https endpoints; must outlive this.
         * @param endpoint The target endpoint.
         */
        HttpConnection(boost::asio::ssl::context& ssl_ctx, Endpoint endpoint);

        HttpConnection(const HttpConnection&) = delete;
        HttpConnection& operator=(const HttpConnection&) = delete;
        HttpConnection(HttpConnection&&) = delete;
        HttpConnection& operator=(HttpConnection&&) = delete;

        ~HttpConnection() noexcept;

        /**
         * @brief Perform one request/response exchange, connecting first if
         * needed.
         *
         * The socket is closed after any failure and after a response that
         * does not allow keep-alive.
         */
        Result<Response> request(const PreparedRequest& preq,
                                 const SendOptions& options);

        /// @brief Close the socket if open (best-effort, no TLS shutdown).
        void close() noexcept;

        bool is_open() const noexcept;

        /// @brief Exchanges completed on the current socket.
        std::size_t completed_requests() const noexcept { return m_completed; }

        const Endpoint& endpoint() const noexcept { return m_endpoint; }

       private:
        Status ensure_connected_(const SendOptions& options,
                                 clock::time_point deadline);

        /// @brief Peer closed an idle keep-alive socket, or sent stray data.
        bool is_stale_() noexcept;

        HttpStream* lowest_layer_() noexcept;
        const HttpStream* lowest_layer_() const noexcept;

        /// @brief Run the io_context until `done` flips, aborting the pending
        /// operation on cancellation or once `deadline` passes.
        Interrupt run_until_done_(const bool& done, const SendOptions& options,
                                  clock::time_point deadline);

        void cancel_io_() noexcept;

        Error map_error_(Phase phase, const boost::beast::error_code& ec,
                         Interrupt why, const SendOptions& options) const;

        boost::asio::ssl::context& m_ssl_ctx;
        Endpoint m_endpoint{};

        boost::asio::io_context m_io{1};
        tcp::resolver m_resolver;
        boost::beast::flat_buffer m_buffer{};
        Stream m_stream;
        std::size_t m_completed{0};
    };

}  // namespace resilient_rest
