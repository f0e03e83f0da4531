#include "JsonCodec.hpp"
#include "Geo.hpp"
#include "IClock.hpp"
#include <cmath>
#include <stdexcept>

namespace fleetalert {

namespace {

double roundTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

nlohmann::json attributesOf(const nlohmann::json& json) {
    if (json.contains("attributes") && json["attributes"].is_object()) {
        return json["attributes"];
    }
    return nlohmann::json::object();
}

} // namespace

int64_t JsonCodec::jsonToTime(const nlohmann::json& json) {
    if (json.is_number()) {
        return json.get<int64_t>();
    }
    if (json.is_string()) {
        auto parsed = Iso8601::parse(json.get<std::string>());
        if (parsed) {
            return *parsed;
        }
    }
    throw std::invalid_argument("Invalid timestamp: " + json.dump());
}

std::string JsonCodec::serialize(const ports::EventData& data) {
    nlohmann::json j;
    j["event"] = eventToJson(data.event);
    if (data.position) {
        j["position"] = positionToJson(*data.position);
    }
    if (data.device) {
        j["device"] = deviceToJson(*data.device);
    }
    if (data.geofence) {
        j["geofence"] = geofenceToJson(*data.geofence);
    }
    return j.dump();
}

nlohmann::json JsonCodec::eventToJson(const Event& event) {
    nlohmann::json j;
    j["id"] = event.id;
    j["type"] = event.type;
    j["deviceId"] = event.deviceId;
    j["positionId"] = event.positionId;
    j["geofenceId"] = event.geofenceId;
    j["eventTime"] = Iso8601::format(event.eventTime);
    j["attributes"] = event.attributes;
    return j;
}

Event JsonCodec::jsonToEvent(const nlohmann::json& json) {
    Event event;
    event.id = json.value("id", int64_t{0});
    event.type = json.at("type").get<std::string>();
    event.deviceId = json.at("deviceId").get<int64_t>();
    event.positionId = json.value("positionId", int64_t{0});
    event.geofenceId = json.value("geofenceId", int64_t{0});
    event.eventTime = jsonToTime(json.at("eventTime"));
    event.attributes = attributesOf(json);
    return event;
}

nlohmann::json JsonCodec::positionToJson(const Position& position) {
    nlohmann::json j;
    j["id"] = position.id;
    j["deviceId"] = position.deviceId;
    j["fixTime"] = Iso8601::format(position.fixTime);
    j["latitude"] = position.latitude;
    j["longitude"] = position.longitude;
    j["speed"] = position.speed;
    j["geofenceIds"] = position.geofenceIds;
    j["attributes"] = position.attributes;
    return j;
}

Position JsonCodec::jsonToPosition(const nlohmann::json& json) {
    Position position;
    position.id = json.value("id", int64_t{0});
    position.deviceId = json.at("deviceId").get<int64_t>();
    position.fixTime = jsonToTime(json.at("fixTime"));
    position.latitude = json.value("latitude", 0.0);
    position.longitude = json.value("longitude", 0.0);
    if (json.contains("speedKph")) {
        position.speed = Geo::knotsFromKph(json["speedKph"].get<double>());
    } else {
        position.speed = json.value("speed", 0.0);
    }
    if (json.contains("geofenceIds") && json["geofenceIds"].is_array()) {
        position.geofenceIds = json["geofenceIds"].get<std::vector<int64_t>>();
    }
    position.attributes = attributesOf(json);
    return position;
}

nlohmann::json JsonCodec::deviceToJson(const Device& device) {
    nlohmann::json j;
    j["id"] = device.id;
    j["name"] = device.name;
    j["attributes"] = device.attributes;
    j["overspeedState"] = device.overspeedState;
    if (device.overspeedTime) {
        j["overspeedTime"] = Iso8601::format(*device.overspeedTime);
    } else {
        j["overspeedTime"] = nullptr;
    }
    j["overspeedGeofenceId"] = device.overspeedGeofenceId;
    return j;
}

Device JsonCodec::jsonToDevice(const nlohmann::json& json) {
    Device device;
    device.id = json.at("id").get<int64_t>();
    device.name = json.value("name", "");
    device.attributes = attributesOf(json);
    device.overspeedState = json.value("overspeedState", false);
    if (json.contains("overspeedTime") && !json["overspeedTime"].is_null()) {
        device.overspeedTime = jsonToTime(json["overspeedTime"]);
    }
    device.overspeedGeofenceId = json.value("overspeedGeofenceId", int64_t{0});
    return device;
}

nlohmann::json JsonCodec::geofenceToJson(const Geofence& geofence) {
    nlohmann::json j;
    j["id"] = geofence.id;
    j["name"] = geofence.name;
    j["attributes"] = geofence.attributes;
    return j;
}

Geofence JsonCodec::jsonToGeofence(const nlohmann::json& json) {
    Geofence geofence;
    geofence.id = json.at("id").get<int64_t>();
    geofence.name = json.value("name", "");
    geofence.attributes = attributesOf(json);
    return geofence;
}

User JsonCodec::jsonToUser(const nlohmann::json& json) {
    User user;
    user.id = json.at("id").get<int64_t>();
    user.name = json.value("name", "");
    user.email = json.value("email", "");
    user.phone = json.value("phone", "");
    user.disabled = json.value("disabled", false);
    user.temporary = json.value("temporary", false);
    user.attributes = attributesOf(json);
    return user;
}

Notification JsonCodec::jsonToNotification(const nlohmann::json& json) {
    Notification notification;
    notification.id = json.at("id").get<int64_t>();
    notification.type = json.at("type").get<std::string>();
    notification.description = json.value("description", "");
    notification.always = json.value("always", false);
    notification.calendarId = json.value("calendarId", int64_t{0});
    const auto& notificators = json.contains("notificators") ? json["notificators"] : nlohmann::json();
    if (notificators.is_array()) {
        notification.notificators = notificators.get<std::vector<std::string>>();
    } else if (notificators.is_string()) {
        notification.notificators = splitCsv(notificators.get<std::string>());
    }
    notification.attributes = attributesOf(json);
    return notification;
}

Calendar JsonCodec::jsonToCalendar(const nlohmann::json& json) {
    Calendar calendar;
    calendar.id = json.at("id").get<int64_t>();
    calendar.name = json.value("name", "");
    if (json.contains("periods") && json["periods"].is_array()) {
        for (const auto& item : json["periods"]) {
            CalendarPeriod period;
            period.start = jsonToTime(item.at("start"));
            period.end = jsonToTime(item.at("end"));
            std::string recurrence = item.value("recurrence", "none");
            if (recurrence == "daily") {
                period.recurrence = Recurrence::Daily;
            } else if (recurrence == "weekly") {
                period.recurrence = Recurrence::Weekly;
            } else if (recurrence == "none") {
                period.recurrence = Recurrence::None;
            } else {
                throw std::invalid_argument("Unknown recurrence: " + recurrence);
            }
            calendar.periods.push_back(period);
        }
    }
    return calendar;
}

ObjectType JsonCodec::stringToObjectType(const std::string& value) {
    if (value == "user") return ObjectType::User;
    if (value == "device") return ObjectType::Device;
    if (value == "notification") return ObjectType::Notification;
    if (value == "geofence") return ObjectType::Geofence;
    if (value == "calendar") return ObjectType::Calendar;
    throw std::invalid_argument("Unknown object type: " + value);
}

Permission JsonCodec::jsonToPermission(const nlohmann::json& json) {
    Permission permission;
    permission.ownerType = stringToObjectType(json.at("owner").get<std::string>());
    permission.ownerId = json.at("ownerId").get<int64_t>();
    permission.propertyType = stringToObjectType(json.at("property").get<std::string>());
    permission.propertyId = json.at("propertyId").get<int64_t>();
    return permission;
}

nlohmann::json JsonCodec::dailySummaryPayload(const User& user, const domain::UserSummary& summary,
                                              const LocalDate& reportDate) {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto& device : summary.devices) {
        nlohmann::json item;
        item["deviceId"] = device.deviceId;
        item["vehicleName"] = device.name;
        item["distanceKm"] = roundTenth(device.distanceKm);
        item["motionSeconds"] = device.motionSeconds;
        item["motionFormatted"] = domain::DailySummary::formatMotion(device.motionSeconds);
        item["geofenceEnterCount"] = device.geofenceEnterCount;
        item["geofenceExitCount"] = device.geofenceExitCount;
        item["geofenceTotal"] = device.geofenceTotal();
        item["avgSpeedKmh"] = domain::DailySummary::averageSpeedKph(device.distanceKm, device.motionSeconds);
        item["maxSpeedKmh"] = device.maxSpeedKph;
        devices.push_back(item);
    }

    nlohmann::json totals;
    totals["distanceKm"] = roundTenth(summary.totalDistanceKm);
    totals["motionSeconds"] = summary.totalMotionSeconds;
    totals["motionFormatted"] = domain::DailySummary::formatMotion(summary.totalMotionSeconds);
    totals["avgSpeedKmh"] = domain::DailySummary::averageSpeedKph(summary.totalDistanceKm,
                                                                  summary.totalMotionSeconds);
    totals["maxSpeedKmh"] = summary.maxSpeedKph();
    auto delta = domain::DailySummary::distanceDeltaPercent(summary.totalDistanceKm,
                                                            summary.totalPreviousDistanceKm);
    if (delta) {
        totals["distanceDeltaPercent"] = *delta;
    } else {
        totals["distanceDeltaPercent"] = nullptr;
    }
    totals["longStops"] = summary.totalLongStops;

    nlohmann::json payload;
    payload["userId"] = user.id;
    payload["userName"] = user.name;
    payload["userPhone"] = user.phone;
    payload["userEmail"] = user.email;
    payload["dateRef"] = reportDate.toString();
    payload["devices"] = devices;
    payload["totals"] = totals;
    return payload;
}

} // namespace fleetalert
