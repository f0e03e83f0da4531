#pragma once

#include "EventHandler.hpp"
#include "OverspeedState.hpp"
#include "StaticRadarIndex.hpp"
#include "../ConcurrentMap.hpp"
#include "../IClock.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/IObjectStore.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fleetalert::domain {

struct OverspeedConfig {
    double thresholdMultiplier = 1.0;       ///< Alert above speedLimit * multiplier
    int64_t minimalDurationMillis = 0;      ///< Episode debounce
    bool preferLowest = false;              ///< Geofence limit policy when several intersect
    int64_t radarCooldownMillis = 60000;    ///< 0 disables the radar rate limit
};

enum class RadarKind {
    Geofence,
    Static
};

/// Cooldown bucket: one per device and radar source
struct RadarCooldownKey {
    int64_t deviceId = 0;
    RadarKind kind = RadarKind::Geofence;
    int64_t radarId = 0;

    bool operator==(const RadarCooldownKey& other) const {
        return deviceId == other.deviceId && kind == other.kind && radarId == other.radarId;
    }
};

struct RadarCooldownKeyHash {
    size_t operator()(const RadarCooldownKey& key) const {
        size_t hash = std::hash<int64_t>()(key.deviceId);
        hash ^= std::hash<int64_t>()(key.radarId) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
        hash ^= static_cast<size_t>(key.kind) + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
        return hash;
    }
};

/**
 * @brief Raises deviceOverspeed events
 *
 * The effective limit is the device-level "speedLimit" attribute, replaced by
 * a positive position "speedLimit", replaced by the limit of the winning
 * intersected geofence. Radar geofences (and static catalog radars) win over
 * plain speed-limit geofences.
 *
 * Every limit goes through the episode debouncer in OverspeedProcessor, so an
 * episode raises at most one event, after minimalDuration. When the episode
 * started inside a radar (or the winning limit is a static catalog radar) the
 * event carries the radar attributes and is additionally rate limited per
 * (device, radar) by the radar cooldown.
 */
class OverspeedEvaluator : public EventHandler {
public:
    static constexpr const char* ATTRIBUTE_RADAR = "radar";
    static constexpr const char* ATTRIBUTE_RADAR_ACTIVE = "radarActive";
    static constexpr const char* ATTRIBUTE_RADAR_SPEED_LIMIT_KPH = "radarSpeedLimitKph";
    static constexpr const char* ATTRIBUTE_RADAR_ID = "radarId";
    static constexpr const char* ATTRIBUTE_RADAR_NAME = "radarName";
    static constexpr const char* ATTRIBUTE_RADAR_SOURCE = "radarSource";
    static constexpr const char* ATTRIBUTE_RADAR_EXTERNAL_ID = "radarExternalId";
    static constexpr const char* ATTRIBUTE_LIMIT_KPH = "limitKph";
    static constexpr const char* ATTRIBUTE_SPEED_KPH = "speedKph";

    OverspeedEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager,
                       std::shared_ptr<ports::IObjectStore> store,
                       std::shared_ptr<IClock> clock,
                       OverspeedConfig config,
                       std::shared_ptr<StaticRadarIndex> radarIndex = nullptr);

    void onPosition(const Position& position, const Callback& callback) override;
    void onDeviceRemoved(int64_t deviceId) override;

    static bool isRadarEnabled(const Geofence& geofence);

private:
    struct RadarSource {
        RadarKind kind = RadarKind::Geofence;
        int64_t id = 0;
        std::string name;
        std::string externalId;
        double limitKph = 0.0;
    };

    struct LimitSelection {
        double speedLimit = 0.0;            // knots
        int64_t geofenceId = 0;
        std::optional<RadarSource> radar;
    };

    static std::optional<RadarSource> radarForGeofence(const Geofence& geofence);
    LimitSelection selectGeofenceSpeedLimit(const Position& position);
    bool shouldReplaceLimit(double candidate, double selected) const;
    bool inRadarCooldown(const RadarCooldownKey& key);
    void persistState(Device device, const OverspeedState& state);
    static void appendRadarAttributes(Event& event, const RadarSource& radar);

    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::shared_ptr<ports::IObjectStore> store_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<StaticRadarIndex> radarIndex_;
    OverspeedConfig config_;
    OverspeedProcessor processor_;

    ConcurrentMap<RadarCooldownKey, int64_t, RadarCooldownKeyHash> radarCooldowns_;
};

} // namespace fleetalert::domain
