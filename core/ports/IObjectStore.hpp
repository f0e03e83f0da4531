#pragma once

#include "../Model.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

namespace fleetalert::ports {

class StorageException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Persistent record store consumed by the rule and notification core
 *
 * Every method may throw StorageException. Callers catch it at the unit of
 * work boundary (one event, one user tick) and abandon that unit.
 */
class IObjectStore {
public:
    virtual ~IObjectStore() = default;

    /// Persists an event and returns the server-assigned id
    virtual int64_t addEvent(const Event& event) = 0;

    /// Narrow-column update of overspeedState, overspeedTime and overspeedGeofenceId
    virtual void updateDeviceOverspeed(const Device& device) = 0;

    /// Narrow-column update of the user's attribute map
    virtual void updateUserAttributes(const User& user) = 0;

    virtual std::optional<User> getUser(int64_t userId) = 0;
    virtual std::vector<User> getUsers() = 0;
    virtual std::vector<Device> getUserDevices(int64_t userId) = 0;

    /// Positions with fixTime in [from, to), ordered by fixTime
    virtual std::vector<Position> getPositions(int64_t deviceId, int64_t from, int64_t to) = 0;

    /// Events with eventTime in [from, to)
    virtual std::vector<Event> getEvents(int64_t deviceId, int64_t from, int64_t to) = 0;

    virtual std::vector<Notification> getNotifications() = 0;
    virtual int64_t addNotification(const Notification& notification) = 0;

    virtual std::vector<Permission> getPermissions(ObjectType ownerType, ObjectType propertyType) = 0;
    virtual void addPermission(const Permission& permission) = 0;
    virtual void removePermission(const Permission& permission) = 0;
};

} // namespace fleetalert::ports
