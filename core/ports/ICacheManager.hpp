#pragma once

#include "../Model.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert::ports {

/**
 * @brief Hot-object cache maintained by the session layer
 *
 * Lookups never throw. Anything this core writes through IObjectStore must be
 * followed by the matching invalidate call.
 */
class ICacheManager {
public:
    virtual ~ICacheManager() = default;

    virtual std::optional<Device> getDevice(int64_t deviceId) = 0;
    virtual std::optional<Geofence> getGeofence(int64_t geofenceId) = 0;
    virtual std::optional<Calendar> getCalendar(int64_t calendarId) = 0;
    virtual std::optional<Position> getLastPosition(int64_t deviceId) = 0;

    /// Notification subscriptions linked to the device directly or through its users
    virtual std::vector<Notification> getDeviceNotifications(int64_t deviceId) = 0;

    /// Users subscribed to a notification that can also see the device
    virtual std::vector<User> getNotificationUsers(int64_t notificationId, int64_t deviceId) = 0;

    /// Attribute lookup through the device, its groups and the server record
    virtual std::optional<double> lookupDeviceAttribute(int64_t deviceId, const std::string& key) = 0;

    /// Records a processed position as the device's latest one
    virtual void updatePosition(const Position& position) = 0;

    virtual void invalidateDevice(int64_t deviceId) = 0;
    virtual void invalidateUser(int64_t userId) = 0;
    virtual void invalidatePermission(const Permission& permission) = 0;
};

} // namespace fleetalert::ports
