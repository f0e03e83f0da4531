#include "PositionPipeline.hpp"
#include <iostream>
#include <utility>

namespace fleetalert::domain {

PositionPipeline::PositionPipeline(std::shared_ptr<ports::ICacheManager> cacheManager,
                                   std::shared_ptr<NotificationManager> notificationManager)
    : cacheManager_(std::move(cacheManager)),
      notificationManager_(std::move(notificationManager)) {
}

void PositionPipeline::addHandler(std::shared_ptr<EventHandler> handler) {
    handlers_.push_back(std::move(handler));
}

std::vector<Event> PositionPipeline::process(const Position& position) {
    std::vector<Event> events;
    for (const auto& handler : handlers_) {
        try {
            handler->onPosition(position, [&events](Event event) {
                events.push_back(std::move(event));
            });
        } catch (const std::exception& e) {
            std::cerr << "[Pipeline] Handler failed deviceId=" << position.deviceId
                      << " positionId=" << position.id << ": " << e.what() << std::endl;
        }
    }

    try {
        auto last = cacheManager_->getLastPosition(position.deviceId);
        if (!last || position.fixTime >= last->fixTime) {
            cacheManager_->updatePosition(position);
        }
    } catch (const std::exception& e) {
        std::cerr << "[Pipeline] Latest position update failed deviceId=" << position.deviceId
                  << ": " << e.what() << std::endl;
    }

    if (notificationManager_) {
        for (const auto& event : events) {
            try {
                notificationManager_->updateEvent(event, &position);
            } catch (const std::exception& e) {
                std::cerr << "[Pipeline] Event delivery failed type=" << event.type
                          << " deviceId=" << event.deviceId << ": " << e.what() << std::endl;
            }
        }
    }
    return events;
}

void PositionPipeline::onDeviceRemoved(int64_t deviceId) {
    for (const auto& handler : handlers_) {
        handler->onDeviceRemoved(deviceId);
    }
}

} // namespace fleetalert::domain
