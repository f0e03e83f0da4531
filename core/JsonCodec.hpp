#pragma once

#include "Model.hpp"
#include "TimeZone.hpp"
#include "domain/DailySummary.hpp"
#include "ports/IEventForwarder.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace fleetalert {

/**
 * @brief JSON mapping for records crossing the process boundary
 *
 * Timestamps are written as ISO-8601 UTC strings. When reading, both ISO
 * strings and epoch millis are accepted. Decoding throws
 * nlohmann::json::exception or std::invalid_argument on malformed input.
 */
class JsonCodec {
public:
    /// Forwarder payload: {"event", "position", "device", "geofence"}
    static std::string serialize(const ports::EventData& data);

    static nlohmann::json eventToJson(const Event& event);
    static Event jsonToEvent(const nlohmann::json& json);

    static nlohmann::json positionToJson(const Position& position);
    static Position jsonToPosition(const nlohmann::json& json);

    static nlohmann::json deviceToJson(const Device& device);
    static Device jsonToDevice(const nlohmann::json& json);

    static nlohmann::json geofenceToJson(const Geofence& geofence);
    static Geofence jsonToGeofence(const nlohmann::json& json);

    static User jsonToUser(const nlohmann::json& json);
    static Notification jsonToNotification(const nlohmann::json& json);
    static Calendar jsonToCalendar(const nlohmann::json& json);
    static Permission jsonToPermission(const nlohmann::json& json);
    static ObjectType stringToObjectType(const std::string& value);

    /// Webhook body for the daily summary fan-out
    static nlohmann::json dailySummaryPayload(const User& user, const domain::UserSummary& summary,
                                              const LocalDate& reportDate);

private:
    static int64_t jsonToTime(const nlohmann::json& json);
};

} // namespace fleetalert
