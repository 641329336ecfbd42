#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a wait is cut short by cancellation. Never retried.
 */
class DownloadInterrupted : public std::runtime_error {
public:
    explicit DownloadInterrupted(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Cooperative cancellation flag with an interruptible wait.
 */
class CancellationToken {
public:
    /**
     * @brief Sets the flag and wakes any waiter.
     */
    void request_cancel();

    /**
     * @brief Sets the flag only. Safe to call from a signal handler; waiters
     * notice it on their next polling slice.
     */
    void request_cancel_from_signal() noexcept { cancelled_.store(true); }

    bool is_cancelled() const noexcept { return cancelled_.load(); }

    void reset();

    /**
     * @brief Blocks for up to duration.
     * @return true when cancellation ended the wait early.
     */
    bool wait_for(std::chrono::milliseconds duration);

private:
    static constexpr std::chrono::milliseconds kPollSlice{50};

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};
