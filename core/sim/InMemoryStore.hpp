#pragma once

#include "../Model.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/IObjectStore.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert::sim {

/**
 * @brief Object store and cache layer backed by process memory
 *
 * Serves the replay CLI and the tests. Subscription resolution follows the
 * server rules: a device sees subscriptions linked to it directly plus the
 * "always" subscriptions of every user that can see the device.
 *
 * Writes can be made to fail with StorageException to exercise error paths.
 */
class InMemoryStore : public ports::IObjectStore, public ports::ICacheManager {
public:
    InMemoryStore() = default;

    /**
     * @brief Seeds records from a fixture document
     *
     * Keys: users, devices, geofences, calendars, notifications, permissions,
     * positions, server.attributes. Missing keys are skipped.
     */
    void loadFixture(const nlohmann::json& fixture);

    void addUser(const User& user);
    void addDevice(const Device& device);
    void addGeofence(const Geofence& geofence);
    void addCalendar(const Calendar& calendar);
    void putNotification(const Notification& notification);
    int64_t addPosition(Position position);
    void setServerAttributes(nlohmann::json attributes);

    void setFailWrites(bool fail) { failWrites_ = fail; }

    std::vector<Event> events() const;
    std::vector<Permission> permissions() const;
    size_t invalidationCount() const;

    // IObjectStore
    int64_t addEvent(const Event& event) override;
    void updateDeviceOverspeed(const Device& device) override;
    void updateUserAttributes(const User& user) override;
    std::optional<User> getUser(int64_t userId) override;
    std::vector<User> getUsers() override;
    std::vector<Device> getUserDevices(int64_t userId) override;
    std::vector<Position> getPositions(int64_t deviceId, int64_t from, int64_t to) override;
    std::vector<Event> getEvents(int64_t deviceId, int64_t from, int64_t to) override;
    std::vector<Notification> getNotifications() override;
    int64_t addNotification(const Notification& notification) override;
    std::vector<Permission> getPermissions(ObjectType ownerType, ObjectType propertyType) override;
    void addPermission(const Permission& permission) override;
    void removePermission(const Permission& permission) override;

    // ICacheManager
    std::optional<Device> getDevice(int64_t deviceId) override;
    std::optional<Geofence> getGeofence(int64_t geofenceId) override;
    std::optional<Calendar> getCalendar(int64_t calendarId) override;
    std::optional<Position> getLastPosition(int64_t deviceId) override;
    std::vector<Notification> getDeviceNotifications(int64_t deviceId) override;
    std::vector<User> getNotificationUsers(int64_t notificationId, int64_t deviceId) override;
    std::optional<double> lookupDeviceAttribute(int64_t deviceId, const std::string& key) override;
    void updatePosition(const Position& position) override;
    void invalidateDevice(int64_t deviceId) override;
    void invalidateUser(int64_t userId) override;
    void invalidatePermission(const Permission& permission) override;

private:
    void checkWritable(const char* operation) const;
    bool hasPermission(ObjectType ownerType, int64_t ownerId, ObjectType propertyType, int64_t propertyId) const;

    mutable std::mutex mutex_;
    bool failWrites_ = false;

    std::map<int64_t, User> users_;
    std::map<int64_t, Device> devices_;
    std::map<int64_t, Geofence> geofences_;
    std::map<int64_t, Calendar> calendars_;
    std::map<int64_t, Notification> notifications_;
    std::map<int64_t, std::vector<Position>> positions_;
    std::map<int64_t, Position> lastPositions_;
    std::vector<Event> events_;
    std::vector<Permission> permissions_;
    nlohmann::json serverAttributes_ = nlohmann::json::object();

    int64_t nextEventId_ = 1;
    int64_t nextNotificationId_ = 1;
    int64_t nextPositionId_ = 1;
    size_t invalidations_ = 0;
};

} // namespace fleetalert::sim
