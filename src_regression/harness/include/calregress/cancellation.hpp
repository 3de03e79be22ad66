#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace calregress {

/**
 * \brief Run-abort signal shared by the producer, the workers and the caller.
 *
 * Once cancelled it stays cancelled. wait_for() lets a worker sleep on a
 * poll interval and wake immediately on cancellation.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    /// Sleeps up to `timeout`; returns true if the token was cancelled.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return cancelled(); });
    }

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

}  // namespace calregress
