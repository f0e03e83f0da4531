#pragma once

#include "EventHandler.hpp"
#include "NotificationManager.hpp"
#include "../ports/ICacheManager.hpp"
#include <cstdint>
#include <memory>
#include <vector>

namespace fleetalert::domain {

/**
 * @brief Runs every rule evaluator over an incoming position
 *
 * Raised events are collected per position and handed to the notification
 * manager after the position has been recorded as the device's latest fix.
 * Handlers see the previous latest fix through the cache, which the edge
 * triggered maintenance rules depend on.
 */
class PositionPipeline {
public:
    PositionPipeline(std::shared_ptr<ports::ICacheManager> cacheManager,
                     std::shared_ptr<NotificationManager> notificationManager);

    void addHandler(std::shared_ptr<EventHandler> handler);

    /// @return Events raised for this position
    std::vector<Event> process(const Position& position);

    void onDeviceRemoved(int64_t deviceId);

private:
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::shared_ptr<NotificationManager> notificationManager_;
    std::vector<std::shared_ptr<EventHandler>> handlers_;
};

} // namespace fleetalert::domain
