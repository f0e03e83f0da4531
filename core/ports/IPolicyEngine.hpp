#pragma once

#include <chrono>

namespace fleetalert::ports {

struct RetryPolicy {
    virtual ~RetryPolicy() = default;

    /// Delay before the attempt that follows `retryCount` failed retries
    virtual std::chrono::milliseconds getBackoffDelay(int retryCount) const = 0;
    virtual bool shouldRetry(int retryCount) const = 0;
};

} // namespace fleetalert::ports
