#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert {

struct Position {
    int64_t id = 0;
    int64_t deviceId = 0;
    int64_t fixTime = 0;            // epoch millis
    double latitude = 0.0;
    double longitude = 0.0;
    double speed = 0.0;             // knots
    std::vector<int64_t> geofenceIds;
    nlohmann::json attributes = nlohmann::json::object();

    static constexpr const char* KEY_SPEED_LIMIT = "speedLimit";
    static constexpr const char* KEY_ODOMETER = "odometer";
    static constexpr const char* KEY_TOTAL_DISTANCE = "totalDistance";
    static constexpr const char* KEY_ALARM = "alarm";
};

struct Device {
    int64_t id = 0;
    std::string name;
    nlohmann::json attributes = nlohmann::json::object();

    // Narrow columns written back by the overspeed evaluator.
    bool overspeedState = false;
    std::optional<int64_t> overspeedTime;
    int64_t overspeedGeofenceId = 0;
};

struct Geofence {
    int64_t id = 0;
    std::string name;
    nlohmann::json attributes = nlohmann::json::object();
};

struct Event {
    int64_t id = 0;
    std::string type;
    int64_t deviceId = 0;
    int64_t positionId = 0;
    int64_t geofenceId = 0;         // 0 means no geofence
    int64_t eventTime = 0;          // epoch millis
    nlohmann::json attributes = nlohmann::json::object();

    static constexpr const char* TYPE_DEVICE_OVERSPEED = "deviceOverspeed";
    static constexpr const char* TYPE_GEOFENCE_ENTER = "geofenceEnter";
    static constexpr const char* TYPE_GEOFENCE_EXIT = "geofenceExit";
    static constexpr const char* TYPE_IGNITION_ON = "ignitionOn";
    static constexpr const char* TYPE_IGNITION_OFF = "ignitionOff";
    static constexpr const char* TYPE_ALARM = "alarm";
    static constexpr const char* TYPE_OIL_CHANGE_SOON = "oilChangeSoon";
    static constexpr const char* TYPE_OIL_CHANGE_DUE = "oilChangeDue";
    static constexpr const char* TYPE_TIRE_ROTATION_SOON = "tireRotationSoon";
    static constexpr const char* TYPE_TIRE_ROTATION_DUE = "tireRotationDue";

    Event() = default;
    Event(std::string eventType, const Position& position);
};

struct Notification {
    int64_t id = 0;
    std::string type;
    std::string description;
    bool always = false;
    int64_t calendarId = 0;
    std::vector<std::string> notificators;
    nlohmann::json attributes = nlohmann::json::object();

    // Subscription types that are matched by more than one event type.
    static constexpr const char* TYPE_LEGACY_OVERSPEED = "overspeed";
    static constexpr const char* TYPE_MAINTENANCE = "maintenance";

    bool hasDefaultDescription() const;
};

struct User {
    int64_t id = 0;
    std::string name;
    std::string email;
    std::string phone;
    bool disabled = false;
    bool temporary = false;
    nlohmann::json attributes = nlohmann::json::object();
};

enum class Recurrence {
    None,
    Daily,
    Weekly
};

struct CalendarPeriod {
    int64_t start = 0;              // epoch millis, inclusive
    int64_t end = 0;                // epoch millis, exclusive
    Recurrence recurrence = Recurrence::None;
};

struct Calendar {
    int64_t id = 0;
    std::string name;
    std::vector<CalendarPeriod> periods;

    bool checkMoment(int64_t epochMillis) const;
};

enum class ObjectType {
    User,
    Device,
    Notification,
    Geofence,
    Calendar
};

struct Permission {
    ObjectType ownerType = ObjectType::User;
    int64_t ownerId = 0;
    ObjectType propertyType = ObjectType::Notification;
    int64_t propertyId = 0;

    bool operator==(const Permission& other) const {
        return ownerType == other.ownerType && ownerId == other.ownerId
            && propertyType == other.propertyType && propertyId == other.propertyId;
    }
};

std::string objectTypeToString(ObjectType type);
std::vector<std::string> splitCsv(const std::string& value);
std::string joinCsv(const std::vector<std::string>& values);

} // namespace fleetalert
