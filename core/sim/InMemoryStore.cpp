#include "InMemoryStore.hpp"
#include "../Attributes.hpp"
#include "../JsonCodec.hpp"
#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

namespace fleetalert::sim {

void InMemoryStore::loadFixture(const nlohmann::json& fixture) {
    auto each = [&fixture](const char* key, auto&& handler) {
        if (fixture.contains(key) && fixture[key].is_array()) {
            for (const auto& item : fixture[key]) {
                handler(item);
            }
        }
    };

    each("users", [this](const nlohmann::json& item) { addUser(JsonCodec::jsonToUser(item)); });
    each("devices", [this](const nlohmann::json& item) { addDevice(JsonCodec::jsonToDevice(item)); });
    each("geofences", [this](const nlohmann::json& item) { addGeofence(JsonCodec::jsonToGeofence(item)); });
    each("calendars", [this](const nlohmann::json& item) { addCalendar(JsonCodec::jsonToCalendar(item)); });
    each("notifications", [this](const nlohmann::json& item) {
        putNotification(JsonCodec::jsonToNotification(item));
    });
    each("permissions", [this](const nlohmann::json& item) {
        std::lock_guard<std::mutex> lock(mutex_);
        permissions_.push_back(JsonCodec::jsonToPermission(item));
    });
    each("positions", [this](const nlohmann::json& item) { addPosition(JsonCodec::jsonToPosition(item)); });

    if (fixture.contains("server") && fixture["server"].is_object()) {
        setServerAttributes(fixture["server"].value("attributes", nlohmann::json::object()));
    }
}

void InMemoryStore::addUser(const User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    users_[user.id] = user;
}

void InMemoryStore::addDevice(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_[device.id] = device;
}

void InMemoryStore::addGeofence(const Geofence& geofence) {
    std::lock_guard<std::mutex> lock(mutex_);
    geofences_[geofence.id] = geofence;
}

void InMemoryStore::addCalendar(const Calendar& calendar) {
    std::lock_guard<std::mutex> lock(mutex_);
    calendars_[calendar.id] = calendar;
}

void InMemoryStore::putNotification(const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifications_[notification.id] = notification;
    nextNotificationId_ = std::max(nextNotificationId_, notification.id + 1);
}

int64_t InMemoryStore::addPosition(Position position) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (position.id == 0) {
        position.id = nextPositionId_;
    }
    nextPositionId_ = std::max(nextPositionId_, position.id + 1);

    auto& history = positions_[position.deviceId];
    auto at = std::upper_bound(history.begin(), history.end(), position.fixTime,
                               [](int64_t fixTime, const Position& p) { return fixTime < p.fixTime; });
    history.insert(at, position);
    return position.id;
}

void InMemoryStore::setServerAttributes(nlohmann::json attributes) {
    std::lock_guard<std::mutex> lock(mutex_);
    serverAttributes_ = std::move(attributes);
}

std::vector<Event> InMemoryStore::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<Permission> InMemoryStore::permissions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permissions_;
}

size_t InMemoryStore::invalidationCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return invalidations_;
}

void InMemoryStore::checkWritable(const char* operation) const {
    if (failWrites_) {
        throw ports::StorageException(std::string("Simulated storage failure in ") + operation);
    }
}

bool InMemoryStore::hasPermission(ObjectType ownerType, int64_t ownerId,
                                  ObjectType propertyType, int64_t propertyId) const {
    Permission wanted{ownerType, ownerId, propertyType, propertyId};
    return std::find(permissions_.begin(), permissions_.end(), wanted) != permissions_.end();
}

int64_t InMemoryStore::addEvent(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("addEvent");
    Event stored = event;
    stored.id = nextEventId_++;
    events_.push_back(stored);
    return stored.id;
}

void InMemoryStore::updateDeviceOverspeed(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("updateDeviceOverspeed");
    auto it = devices_.find(device.id);
    if (it == devices_.end()) {
        throw ports::StorageException("Unknown device " + std::to_string(device.id));
    }
    it->second.overspeedState = device.overspeedState;
    it->second.overspeedTime = device.overspeedTime;
    it->second.overspeedGeofenceId = device.overspeedGeofenceId;
}

void InMemoryStore::updateUserAttributes(const User& user) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("updateUserAttributes");
    auto it = users_.find(user.id);
    if (it == users_.end()) {
        throw ports::StorageException("Unknown user " + std::to_string(user.id));
    }
    it->second.attributes = user.attributes;
}

std::optional<User> InMemoryStore::getUser(int64_t userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(userId);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<User> InMemoryStore::getUsers() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> result;
    for (const auto& entry : users_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<Device> InMemoryStore::getUserDevices(int64_t userId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Device> result;
    for (const auto& entry : devices_) {
        if (hasPermission(ObjectType::User, userId, ObjectType::Device, entry.first)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Position> InMemoryStore::getPositions(int64_t deviceId, int64_t from, int64_t to) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    auto it = positions_.find(deviceId);
    if (it == positions_.end()) {
        return result;
    }
    for (const auto& position : it->second) {
        if (position.fixTime >= from && position.fixTime < to) {
            result.push_back(position);
        }
    }
    return result;
}

std::vector<Event> InMemoryStore::getEvents(int64_t deviceId, int64_t from, int64_t to) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> result;
    for (const auto& event : events_) {
        if (event.deviceId == deviceId && event.eventTime >= from && event.eventTime < to) {
            result.push_back(event);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Event& a, const Event& b) { return a.eventTime < b.eventTime; });
    return result;
}

std::vector<Notification> InMemoryStore::getNotifications() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Notification> result;
    for (const auto& entry : notifications_) {
        result.push_back(entry.second);
    }
    return result;
}

int64_t InMemoryStore::addNotification(const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("addNotification");
    Notification stored = notification;
    stored.id = nextNotificationId_++;
    notifications_[stored.id] = stored;
    return stored.id;
}

std::vector<Permission> InMemoryStore::getPermissions(ObjectType ownerType, ObjectType propertyType) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Permission> result;
    std::copy_if(permissions_.begin(), permissions_.end(), std::back_inserter(result),
                 [&](const Permission& p) { return p.ownerType == ownerType && p.propertyType == propertyType; });
    return result;
}

void InMemoryStore::addPermission(const Permission& permission) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("addPermission");
    if (std::find(permissions_.begin(), permissions_.end(), permission) == permissions_.end()) {
        permissions_.push_back(permission);
    }
}

void InMemoryStore::removePermission(const Permission& permission) {
    std::lock_guard<std::mutex> lock(mutex_);
    checkWritable("removePermission");
    permissions_.erase(std::remove(permissions_.begin(), permissions_.end(), permission), permissions_.end());
}

std::optional<Device> InMemoryStore::getDevice(int64_t deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(deviceId);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Geofence> InMemoryStore::getGeofence(int64_t geofenceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = geofences_.find(geofenceId);
    if (it == geofences_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Calendar> InMemoryStore::getCalendar(int64_t calendarId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calendars_.find(calendarId);
    if (it == calendars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Position> InMemoryStore::getLastPosition(int64_t deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastPositions_.find(deviceId);
    if (it == lastPositions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Notification> InMemoryStore::getDeviceNotifications(int64_t deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::set<int64_t> viewers;
    for (const auto& permission : permissions_) {
        if (permission.ownerType == ObjectType::User && permission.propertyType == ObjectType::Device
                && permission.propertyId == deviceId) {
            viewers.insert(permission.ownerId);
        }
    }

    std::vector<Notification> result;
    for (const auto& entry : notifications_) {
        const auto& notification = entry.second;
        bool linked = hasPermission(ObjectType::Device, deviceId, ObjectType::Notification, notification.id);
        if (!linked && notification.always) {
            linked = std::any_of(viewers.begin(), viewers.end(), [&](int64_t userId) {
                return hasPermission(ObjectType::User, userId, ObjectType::Notification, notification.id);
            });
        }
        if (linked) {
            result.push_back(notification);
        }
    }
    return result;
}

std::vector<User> InMemoryStore::getNotificationUsers(int64_t notificationId, int64_t deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<User> result;
    for (const auto& entry : users_) {
        const auto& user = entry.second;
        if (user.disabled) {
            continue;
        }
        if (hasPermission(ObjectType::User, user.id, ObjectType::Notification, notificationId)
                && hasPermission(ObjectType::User, user.id, ObjectType::Device, deviceId)) {
            result.push_back(user);
        }
    }
    return result;
}

std::optional<double> InMemoryStore::lookupDeviceAttribute(int64_t deviceId, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(deviceId);
    if (it != devices_.end()) {
        auto value = Attributes::getDouble(it->second.attributes, key);
        if (value) {
            return value;
        }
    }
    return Attributes::getDouble(serverAttributes_, key);
}

void InMemoryStore::updatePosition(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    lastPositions_[position.deviceId] = position;
}

void InMemoryStore::invalidateDevice(int64_t deviceId) {
    (void)deviceId;
    std::lock_guard<std::mutex> lock(mutex_);
    ++invalidations_;
}

void InMemoryStore::invalidateUser(int64_t userId) {
    (void)userId;
    std::lock_guard<std::mutex> lock(mutex_);
    ++invalidations_;
}

void InMemoryStore::invalidatePermission(const Permission& permission) {
    (void)permission;
    std::lock_guard<std::mutex> lock(mutex_);
    ++invalidations_;
}

} // namespace fleetalert::sim
