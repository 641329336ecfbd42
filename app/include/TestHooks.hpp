#pragma once

#include <chrono>
#include <functional>

namespace TestHooks {

/**
 * @brief Replaces the real retry wait. Receives the requested delay and
 * returns true to simulate a cancellation arriving during the wait.
 */
using RetryWaitOverride = std::function<bool(std::chrono::milliseconds delay)>;
void set_retry_wait_override(RetryWaitOverride hook);
void reset_retry_wait_override();

} // namespace TestHooks
