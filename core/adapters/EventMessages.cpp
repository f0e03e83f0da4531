#include "EventMessages.hpp"
#include "../Attributes.hpp"
#include "../Geo.hpp"
#include "../IClock.hpp"
#include <cmath>
#include <sstream>

namespace fleetalert::adapters {

std::string EventMessages::title(const Event& event) {
    const std::string& type = event.type;
    if (type == Event::TYPE_DEVICE_OVERSPEED) {
        return Attributes::has(event.attributes, "radarId") ? "Radar speed limit exceeded" : "Speed limit exceeded";
    }
    if (type == Event::TYPE_GEOFENCE_ENTER) return "Entered geofence";
    if (type == Event::TYPE_GEOFENCE_EXIT) return "Left geofence";
    if (type == Event::TYPE_IGNITION_ON) return "Ignition on";
    if (type == Event::TYPE_IGNITION_OFF) return "Ignition off";
    if (type == Event::TYPE_ALARM) return "Alarm";
    if (type == Event::TYPE_OIL_CHANGE_SOON) return "Oil change soon";
    if (type == Event::TYPE_OIL_CHANGE_DUE) return "Oil change due";
    if (type == Event::TYPE_TIRE_ROTATION_SOON) return "Tire rotation soon";
    if (type == Event::TYPE_TIRE_ROTATION_DUE) return "Tire rotation due";
    return type;
}

ports::NotificationMessage EventMessages::render(const Notification& notification,
                                                 const Event& event,
                                                 const std::optional<Device>& device,
                                                 const std::optional<Geofence>& geofence,
                                                 const Position* position) {
    std::string deviceName = device && !device->name.empty() ? device->name : "Device " + std::to_string(event.deviceId);

    ports::NotificationMessage message;
    message.subject = deviceName + ": " + title(event);

    std::ostringstream body;
    body << title(event);
    if (geofence) {
        body << " (" << geofence->name << ")";
    }
    if (event.type == Event::TYPE_DEVICE_OVERSPEED) {
        auto speed = Attributes::getDouble(event.attributes, "speed");
        auto limit = Attributes::getDouble(event.attributes, "speedLimit");
        if (speed && limit) {
            body << ": " << std::lround(Geo::kphFromKnots(*speed)) << " km/h, limit "
                 << std::lround(Geo::kphFromKnots(*limit)) << " km/h";
        }
    } else if (event.type == Event::TYPE_ALARM) {
        auto alarm = Attributes::getString(event.attributes, Position::KEY_ALARM);
        if (alarm) {
            body << ": " << *alarm;
        }
    } else if (auto name = Attributes::getString(event.attributes, "maintenanceName")) {
        body << ": " << *name;
    }
    body << " at " << Iso8601::format(event.eventTime);
    message.body = body.str();
    message.priority = event.type == Event::TYPE_DEVICE_OVERSPEED || event.type == Event::TYPE_ALARM;

    message.data["eventId"] = std::to_string(event.id);
    message.data["eventType"] = event.type;
    message.data["deviceId"] = std::to_string(event.deviceId);
    message.data["notificationId"] = std::to_string(notification.id);
    if (position) {
        message.data["latitude"] = std::to_string(position->latitude);
        message.data["longitude"] = std::to_string(position->longitude);
    }
    return message;
}

} // namespace fleetalert::adapters
