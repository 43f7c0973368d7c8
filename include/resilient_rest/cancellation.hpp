#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace resilient_rest {

    /**
     * @brief Cooperative cancellation signal shared between a caller and the
     * engine.
     *
     * Copies share state: cancelling any copy cancels all of them. A token
     * may also carry an absolute deadline, after which stop_requested() is
     * true without anyone calling cancel(). Every suspension point of a call
     * (rate limiter wait, backoff and poll sleeps, network I/O) observes it.
     *
     * A default-constructed token is never cancelled unless cancel() is
     * called on it or a copy of it.
     */
    class CancellationToken {
       public:
        using clock = std::chrono::steady_clock;

        CancellationToken();

        /// @brief Token that stops once `timeout` has passed from now.
        static CancellationToken with_timeout(clock::duration timeout);

        /// @brief Token that stops at `deadline`.
        static CancellationToken with_deadline(clock::time_point deadline);

        /// @brief Request cancellation and wake every waiter.
        void cancel() const;

        [[nodiscard]] bool cancelled() const noexcept;

        [[nodiscard]] bool deadline_exceeded() const noexcept;

        /// @brief cancelled() || deadline_exceeded()
        [[nodiscard]] bool stop_requested() const noexcept;

        [[nodiscard]] std::optional<clock::time_point> deadline()
            const noexcept;

        /// @brief Time left before the deadline, zero once passed.
        /// std::nullopt when the token has no deadline.
        [[nodiscard]] std::optional<clock::duration> remaining() const;

        /// @brief Sleep for `duration`, waking early on cancel or deadline.
        /// @return true if the full duration elapsed, false if stopped early.
        bool wait_for(clock::duration duration) const;

       private:
        struct State {
            std::mutex mu;
            std::condition_variable cv;
            std::atomic<bool> cancelled{false};
            std::optional<clock::time_point> deadline;
        };

        explicit CancellationToken(std::shared_ptr<State> state);

        std::shared_ptr<State> m_state;
    };

}  // namespace resilient_rest
