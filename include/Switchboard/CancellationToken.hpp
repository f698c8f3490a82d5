// =================================================================
// include/Switchboard/CancellationToken.hpp
// =================================================================
// Shared cancellation signal for agent tasks and escalation waits.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Switchboard {

/**
 * @brief One-shot cancellation flag that sleeping waiters can observe
 *
 * Shared between a session and every task it spawns. Once cancelled it stays
 * cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /**
     * @brief Signal cancellation and wake every waiter
     */
    void cancel() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_cancelled.store(true);
        }
        m_cv.notify_all();
    }

    bool isCancelled() const {
        return m_cancelled.load();
    }

    /**
     * @brief Sleep for up to the given duration, waking early on cancellation
     * @param duration Maximum time to wait
     * @return True if the token was cancelled
     */
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) const {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, duration, [this] { return m_cancelled.load(); });
    }

private:
    std::atomic<bool> m_cancelled{false};
    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
};

} // namespace Switchboard
