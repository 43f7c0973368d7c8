#include "resilient_rest/cancellation.hpp"

#include <algorithm>

namespace resilient_rest {

    CancellationToken::CancellationToken()
        : m_state(std::make_shared<State>()) {}

    CancellationToken::CancellationToken(std::shared_ptr<State> state)
        : m_state(std::move(state)) {}

    CancellationToken CancellationToken::with_timeout(clock::duration timeout) {
        return with_deadline(clock::now() + timeout);
    }

    CancellationToken CancellationToken::with_deadline(
        clock::time_point deadline) {
        auto state = std::make_shared<State>();
        state->deadline = deadline;
        return CancellationToken(std::move(state));
    }

    void CancellationToken::cancel() const {
        {
            std::lock_guard<std::mutex> lk(m_state->mu);
            m_state->cancelled.store(true, std::memory_order_release);
        }
        m_state->cv.notify_all();
    }

    bool CancellationToken::cancelled() const noexcept {
        return m_state->cancelled.load(std::memory_order_acquire);
    }

    bool CancellationToken::deadline_exceeded() const noexcept {
        return m_state->deadline && clock::now() >= *m_state->deadline;
    }

    bool CancellationToken::stop_requested() const noexcept {
        return cancelled() || deadline_exceeded();
    }

    std::optional<CancellationToken::clock::time_point>
    CancellationToken::deadline() const noexcept {
        return m_state->deadline;
    }

    std::optional<CancellationToken::clock::duration>
    CancellationToken::remaining() const {
        if (!m_state->deadline) return std::nullopt;
        const auto now = clock::now();
        if (now >= *m_state->deadline) return clock::duration::zero();
        return *m_state->deadline - now;
    }

    bool CancellationToken::wait_for(clock::duration duration) const {
        // Keeps now() + duration inside the clock's range.
        constexpr clock::duration kLongestWait = std::chrono::hours(24 * 365);
        duration = std::clamp(duration, clock::duration::zero(), kLongestWait);
        const auto until = clock::now() + duration;
        const bool deadline_first =
            m_state->deadline && *m_state->deadline <= until;
        const auto wake_at = deadline_first ? *m_state->deadline : until;

        std::unique_lock<std::mutex> lk(m_state->mu);
        m_state->cv.wait_until(lk, wake_at, [&] {
            return m_state->cancelled.load(std::memory_order_acquire);
        });

        if (m_state->cancelled.load(std::memory_order_acquire)) return false;
        return !deadline_first;
    }

}  // namespace resilient_rest
