#include "CancellationToken.hpp"

#include <algorithm>

void CancellationToken::request_cancel()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true);
    }
    cv_.notify_all();
}


void CancellationToken::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.store(false);
}


bool CancellationToken::wait_for(std::chrono::milliseconds duration)
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + duration;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!cancelled_.load()) {
        const auto now = clock::now();
        if (now >= deadline) {
            return false;
        }
        // Sliced so a flag set from a signal handler (no notify) is still seen.
        const auto slice = std::min<clock::duration>(deadline - now, kPollSlice);
        cv_.wait_for(lock, slice);
    }
    return true;
}
