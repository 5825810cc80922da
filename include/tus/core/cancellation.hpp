#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tus {

/**
 * @brief Cooperative cancellation flag shared between a caller and an upload
 *
 * The transfer loop polls is_cancelled() between chunks, waits on the
 * token during backoff and hands it to the Transport, so cancel() also
 * interrupts a retry delay or a request that is still in flight.
 *
 * THREAD SAFETY:
 * cancel() may be called from any thread while another thread waits.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard lock(mutex_);
            cancelled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_cancelled() const noexcept { return cancelled_.load(); }

    /**
     * @brief Sleep for up to @p duration
     * @return true if the token was cancelled before or during the wait
     */
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

} // namespace tus
