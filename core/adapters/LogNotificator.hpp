#pragma once

#include "EventMessages.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/INotificator.hpp"
#include <iostream>
#include <memory>
#include <utility>

namespace fleetalert::adapters {

/// Channel that writes rendered messages to stdout; used by the replay CLI
class LogNotificator : public ports::INotificator {
public:
    explicit LogNotificator(std::shared_ptr<ports::ICacheManager> cacheManager)
        : cacheManager_(std::move(cacheManager)) {}

    void send(const Notification& notification, const User& user,
              const Event& event, const Position* position) override {
        std::optional<Geofence> geofence;
        if (event.geofenceId != 0) {
            geofence = cacheManager_->getGeofence(event.geofenceId);
        }
        send(user, EventMessages::render(notification, event, cacheManager_->getDevice(event.deviceId),
                                         geofence, position));
    }

    void send(const User& user, const ports::NotificationMessage& message) override {
        std::cout << "[Notify] message userId=" << user.id << " subject=\"" << message.subject
                  << "\" body=\"" << message.body << "\"" << std::endl;
    }

private:
    std::shared_ptr<ports::ICacheManager> cacheManager_;
};

} // namespace fleetalert::adapters
