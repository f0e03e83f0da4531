#include "NotificationManager.hpp"
#include "../Attributes.hpp"
#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

namespace fleetalert::domain {

NotificationManager::NotificationManager(std::shared_ptr<ports::IObjectStore> store,
                                         std::shared_ptr<ports::ICacheManager> cacheManager,
                                         std::shared_ptr<ports::NotificatorRegistry> notificators,
                                         std::shared_ptr<IClock> clock,
                                         NotificationConfig config,
                                         std::shared_ptr<ports::IEventForwarder> forwarder)
    : store_(std::move(store)),
      cacheManager_(std::move(cacheManager)),
      notificators_(std::move(notificators)),
      clock_(std::move(clock)),
      config_(std::move(config)),
      forwarder_(std::move(forwarder)) {
}

bool NotificationManager::matchesType(const std::string& notificationType, const std::string& eventType) {
    if (notificationType == eventType) {
        return true;
    }
    if (notificationType == Notification::TYPE_LEGACY_OVERSPEED) {
        return eventType == Event::TYPE_DEVICE_OVERSPEED;
    }
    if (notificationType == Notification::TYPE_MAINTENANCE) {
        return eventType == Event::TYPE_OIL_CHANGE_SOON
            || eventType == Event::TYPE_OIL_CHANGE_DUE
            || eventType == Event::TYPE_TIRE_ROTATION_SOON
            || eventType == Event::TYPE_TIRE_ROTATION_DUE;
    }
    return false;
}

bool NotificationManager::matchesAlarm(const Notification& notification, const Event& event) {
    if (event.type != Event::TYPE_ALARM) {
        return true;
    }
    auto alarms = Attributes::getString(notification.attributes, ATTRIBUTE_ALARMS);
    auto alarm = Attributes::getString(event.attributes, Position::KEY_ALARM);
    if (!alarms || !alarm) {
        return false;
    }
    auto allowed = splitCsv(*alarms);
    return std::find(allowed.begin(), allowed.end(), *alarm) != allowed.end();
}

void NotificationManager::forwardEvent(const Event& event, const Position* position) {
    ports::EventData data;
    data.event = event;
    if (position) {
        data.position = *position;
    }
    data.device = cacheManager_->getDevice(event.deviceId);
    if (event.geofenceId != 0) {
        data.geofence = cacheManager_->getGeofence(event.geofenceId);
    }

    int64_t eventId = event.id;
    forwarder_->forward(data, [eventId](bool success, const std::string& error) {
        if (!success) {
            std::cerr << "[Notify] Event forwarding failed eventId=" << eventId << ": " << error << std::endl;
        }
    });
}

int NotificationManager::updateEvent(Event event, const Position* position) {
    try {
        event.id = store_->addEvent(event);
    } catch (const ports::StorageException& e) {
        std::cerr << "[Notify] Event save error type=" << event.type << " deviceId=" << event.deviceId
                  << ": " << e.what() << std::endl;
        return 0;
    }

    if (forwarder_) {
        try {
            forwardEvent(event, position);
        } catch (const std::exception& e) {
            std::cerr << "[Notify] Event forwarding error eventId=" << event.id << ": " << e.what() << std::endl;
        }
    }

    int64_t age = clock_->epochMillis() - event.eventTime;
    if (config_.timeThresholdMillis > 0 && age > config_.timeThresholdMillis) {
        std::cout << "[Notify] Skipping stale event eventId=" << event.id << " ageMs=" << age << std::endl;
        return 0;
    }

    try {
        return dispatch(event, position);
    } catch (const ports::StorageException& e) {
        std::cerr << "[Notify] Notification lookup error eventId=" << event.id << " deviceId=" << event.deviceId
                  << ": " << e.what() << std::endl;
        return 0;
    }
}

int NotificationManager::dispatch(const Event& event, const Position* position) {
    auto candidates = cacheManager_->getDeviceNotifications(event.deviceId);
    std::vector<Notification> matched;
    for (const auto& notification : candidates) {
        if (!matchesType(notification.type, event.type) || !matchesAlarm(notification, event)) {
            continue;
        }
        if (notification.calendarId != 0) {
            auto calendar = cacheManager_->getCalendar(notification.calendarId);
            if (calendar && !calendar->checkMoment(event.eventTime)) {
                continue;
            }
        }
        matched.push_back(notification);
    }

    std::cout << "[Notify] notify_lookup eventId=" << event.id << " type=" << event.type
              << " deviceId=" << event.deviceId << " candidates=" << candidates.size()
              << " matched=" << matched.size() << std::endl;

    int delivered = 0;
    for (const auto& notification : matched) {
        for (const auto& user : cacheManager_->getNotificationUsers(notification.id, event.deviceId)) {
            if (config_.blockedUsers.count(user.id) > 0) {
                continue;
            }
            std::cout << "[Notify] notify_dispatch eventId=" << event.id << " notificationId=" << notification.id
                      << " userId=" << user.id << " channels=" << joinCsv(notification.notificators) << std::endl;

            for (const auto& channel : notification.notificators) {
                try {
                    notificators_->get(channel)->send(notification, user, event, position);
                    ++delivered;
                    std::cout << "[Notify] notify_send eventId=" << event.id << " userId=" << user.id
                              << " channel=" << channel << " result=ok" << std::endl;
                } catch (const std::exception& e) {
                    std::cerr << "[Notify] notify_send eventId=" << event.id << " userId=" << user.id
                              << " channel=" << channel << " result=failed error=" << e.what() << std::endl;
                }
            }
        }
    }
    return delivered;
}

} // namespace fleetalert::domain
