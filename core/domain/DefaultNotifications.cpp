#include "DefaultNotifications.hpp"
#include <iostream>
#include <set>
#include <unordered_map>
#include <utility>

namespace fleetalert::domain {

DefaultNotifications::DefaultNotifications(std::shared_ptr<ports::IObjectStore> store,
                                           std::shared_ptr<ports::ICacheManager> cacheManager,
                                           std::vector<std::string> channels)
    : store_(std::move(store)),
      cacheManager_(std::move(cacheManager)),
      channels_(std::move(channels)) {
}

const std::vector<std::string>& DefaultNotifications::defaultTypes() {
    static const std::vector<std::string> types = {
        Event::TYPE_GEOFENCE_ENTER,
        Event::TYPE_GEOFENCE_EXIT,
        Event::TYPE_IGNITION_ON,
        Event::TYPE_IGNITION_OFF,
        Event::TYPE_DEVICE_OVERSPEED,
        Notification::TYPE_MAINTENANCE,
    };
    return types;
}

int DefaultNotifications::provision(int64_t userId) {
    std::unordered_map<int64_t, std::string> typeById;
    for (const auto& notification : store_->getNotifications()) {
        typeById[notification.id] = notification.type;
    }

    std::set<std::string> existing;
    for (const auto& permission : store_->getPermissions(ObjectType::User, ObjectType::Notification)) {
        if (permission.ownerId != userId) {
            continue;
        }
        auto it = typeById.find(permission.propertyId);
        if (it != typeById.end()) {
            existing.insert(it->second);
        }
    }

    int created = 0;
    for (const auto& type : defaultTypes()) {
        if (existing.count(type) > 0) {
            continue;
        }

        Notification notification;
        notification.type = type;
        notification.description = type;
        notification.always = true;
        notification.notificators = channels_;
        notification.id = store_->addNotification(notification);

        Permission permission{ObjectType::User, userId, ObjectType::Notification, notification.id};
        store_->addPermission(permission);
        cacheManager_->invalidatePermission(permission);
        ++created;
    }

    std::cout << "[Notify] Provisioned " << created << " default notifications for userId=" << userId << std::endl;
    return created;
}

} // namespace fleetalert::domain
