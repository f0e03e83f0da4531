#include "NotificationDeduplicateTask.hpp"
#include <algorithm>
#include <iostream>
#include <iterator>
#include <utility>

namespace fleetalert::domain {

NotificationDeduplicateTask::NotificationDeduplicateTask(std::shared_ptr<ports::IObjectStore> store,
                                                         std::shared_ptr<ports::ICacheManager> cacheManager)
    : store_(std::move(store)),
      cacheManager_(std::move(cacheManager)) {
}

bool NotificationDeduplicateTask::canReplace(const Notification& original,
                                             const std::vector<Notification>& preferred,
                                             const std::map<int64_t, std::set<int64_t>>& notificationDevices) {
    static const std::set<int64_t> empty;
    auto originalIt = notificationDevices.find(original.id);
    const auto& originalDevices = originalIt != notificationDevices.end() ? originalIt->second : empty;

    for (const auto& candidate : preferred) {
        if (original.always && !candidate.always) {
            continue;
        }
        if (candidate.always) {
            return true;
        }
        auto candidateIt = notificationDevices.find(candidate.id);
        const auto& candidateDevices = candidateIt != notificationDevices.end() ? candidateIt->second : empty;
        if (std::includes(candidateDevices.begin(), candidateDevices.end(),
                          originalDevices.begin(), originalDevices.end())) {
            return true;
        }
    }
    return false;
}

int NotificationDeduplicateTask::run() {
    std::map<int64_t, std::set<int64_t>> notificationDevices;
    std::map<int64_t, std::vector<Notification>> userNotifications;
    try {
        std::map<int64_t, Notification> overspeedById;
        for (auto& notification : store_->getNotifications()) {
            if (notification.type == Event::TYPE_DEVICE_OVERSPEED) {
                overspeedById.emplace(notification.id, std::move(notification));
            }
        }
        if (overspeedById.empty()) {
            return 0;
        }

        for (const auto& permission : store_->getPermissions(ObjectType::Device, ObjectType::Notification)) {
            notificationDevices[permission.propertyId].insert(permission.ownerId);
        }

        for (const auto& permission : store_->getPermissions(ObjectType::User, ObjectType::Notification)) {
            auto it = overspeedById.find(permission.propertyId);
            if (it != overspeedById.end()) {
                userNotifications[permission.ownerId].push_back(it->second);
            }
        }
    } catch (const ports::StorageException& e) {
        std::cerr << "[Dedup] Failed to load overspeed notifications: " << e.what() << std::endl;
        return 0;
    }

    int removed = 0;
    for (const auto& entry : userNotifications) {
        int64_t userId = entry.first;
        const auto& notifications = entry.second;

        std::vector<Notification> preferred;
        std::copy_if(notifications.begin(), notifications.end(), std::back_inserter(preferred),
                     [](const Notification& n) { return !n.hasDefaultDescription(); });
        if (preferred.empty()) {
            continue;
        }

        try {
            for (const auto& notification : notifications) {
                if (!notification.hasDefaultDescription()
                        || !canReplace(notification, preferred, notificationDevices)) {
                    continue;
                }
                Permission permission{ObjectType::User, userId, ObjectType::Notification, notification.id};
                store_->removePermission(permission);
                cacheManager_->invalidatePermission(permission);
                ++removed;
            }
        } catch (const ports::StorageException& e) {
            std::cerr << "[Dedup] Failed to deduplicate userId=" << userId << ": " << e.what() << std::endl;
        }
    }

    if (removed > 0) {
        std::cout << "[Dedup] Removed " << removed << " duplicate overspeed notification links" << std::endl;
    }
    return removed;
}

} // namespace fleetalert::domain
