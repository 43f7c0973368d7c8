#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

#include "resilient_rest/cancellation.hpp"
#include "resilient_rest/endpoint.hpp"
#include "resilient_rest/request.hpp"
#include "resilient_rest/response.hpp"
#include "resilient_rest/result.hpp"

namespace resilient_rest {

    /// @brief Per-attempt knobs passed down to the wire.
    struct SendOptions {
        /** @brief Budget for the whole attempt: resolve, connect, TLS, write, read. */
        std::chrono::milliseconds timeout{60000};
        /** @brief Maximum size of the response body in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};
        /** @brief Whether a stale keep-alive connection may be retried. */
        bool idempotent{true};
        CancellationToken token{};
    };

    /**
     * @brief A reusable handle to one host. What the SessionPool caches.
     *
     * send() must be safe to call from several threads at once. close() may
     * race with in-flight sends: those finish, and the transport drops its
     * connections afterwards instead of keeping them.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        virtual Result<Response> send(const PreparedRequest& request,
                                      const SendOptions& options) = 0;

        virtual void close() noexcept = 0;

        virtual bool is_closed() const noexcept = 0;
    };

    using TransportFactory =
        std::function<std::shared_ptr<Transport>(const Endpoint&)>;

}  // namespace resilient_rest
