#pragma once

#include "../ports/IPolicyEngine.hpp"
#include <utility>
#include <vector>

namespace fleetalert::adapters {

/**
 * Retries follow an explicit ordered list of delays. Once the list is
 * exhausted shouldRetry() is false and the caller moves to its terminal state.
 */
class FixedScheduleRetryPolicy : public ports::RetryPolicy {
public:
    explicit FixedScheduleRetryPolicy(std::vector<std::chrono::milliseconds> delays = {
                                          std::chrono::minutes(1),
                                          std::chrono::minutes(5),
                                          std::chrono::minutes(15)})
        : delays_(std::move(delays)) {}

    std::chrono::milliseconds getBackoffDelay(int retryCount) const override {
        if (delays_.empty()) {
            return std::chrono::milliseconds(0);
        }
        if (retryCount < 0) {
            return delays_.front();
        }
        if (static_cast<size_t>(retryCount) >= delays_.size()) {
            return delays_.back();
        }
        return delays_[static_cast<size_t>(retryCount)];
    }

    bool shouldRetry(int retryCount) const override {
        return retryCount >= 0 && static_cast<size_t>(retryCount) < delays_.size();
    }

    size_t maxRetries() const { return delays_.size(); }

private:
    std::vector<std::chrono::milliseconds> delays_;
};

} // namespace fleetalert::adapters
