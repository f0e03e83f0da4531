#include "OverspeedEvaluator.hpp"
#include "../Attributes.hpp"
#include "../Geo.hpp"
#include <iostream>
#include <utility>

namespace fleetalert::domain {

OverspeedEvaluator::OverspeedEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager,
                                       std::shared_ptr<ports::IObjectStore> store,
                                       std::shared_ptr<IClock> clock,
                                       OverspeedConfig config,
                                       std::shared_ptr<StaticRadarIndex> radarIndex)
    : cacheManager_(std::move(cacheManager)),
      store_(std::move(store)),
      clock_(std::move(clock)),
      radarIndex_(std::move(radarIndex)),
      config_(config),
      processor_(config.thresholdMultiplier, config.minimalDurationMillis) {
}

bool OverspeedEvaluator::isRadarEnabled(const Geofence& geofence) {
    return Attributes::getBoolean(geofence.attributes, ATTRIBUTE_RADAR)
        && (!Attributes::has(geofence.attributes, ATTRIBUTE_RADAR_ACTIVE)
            || Attributes::getBoolean(geofence.attributes, ATTRIBUTE_RADAR_ACTIVE));
}

bool OverspeedEvaluator::shouldReplaceLimit(double candidate, double selected) const {
    return candidate > 0 && (selected == 0
        || (config_.preferLowest && candidate < selected)
        || (!config_.preferLowest && candidate > selected));
}

std::optional<OverspeedEvaluator::RadarSource> OverspeedEvaluator::radarForGeofence(const Geofence& geofence) {
    if (!isRadarEnabled(geofence)) {
        return std::nullopt;
    }
    double limitKph = Attributes::doubleOr(geofence.attributes, ATTRIBUTE_RADAR_SPEED_LIMIT_KPH, 0.0);
    if (limitKph <= 0) {
        double limitKnots = Attributes::doubleOr(geofence.attributes, Position::KEY_SPEED_LIMIT, 0.0);
        if (limitKnots <= 0) {
            return std::nullopt;
        }
        limitKph = Geo::kphFromKnots(limitKnots);
    }
    return RadarSource{RadarKind::Geofence, geofence.id, geofence.name, "", limitKph};
}

OverspeedEvaluator::LimitSelection OverspeedEvaluator::selectGeofenceSpeedLimit(const Position& position) {
    LimitSelection regular;
    LimitSelection radar;

    for (int64_t geofenceId : position.geofenceIds) {
        auto geofence = cacheManager_->getGeofence(geofenceId);
        if (!geofence) {
            continue;
        }

        if (auto source = radarForGeofence(*geofence)) {
            double radarKph = Attributes::doubleOr(geofence->attributes, ATTRIBUTE_RADAR_SPEED_LIMIT_KPH, 0.0);
            double limitKnots = radarKph > 0
                ? Geo::knotsFromKph(radarKph)
                : Attributes::doubleOr(geofence->attributes, Position::KEY_SPEED_LIMIT, 0.0);
            if (shouldReplaceLimit(limitKnots, radar.speedLimit)) {
                radar.speedLimit = limitKnots;
                radar.geofenceId = geofenceId;
                radar.radar = std::move(source);
            }
        } else if (!isRadarEnabled(*geofence)) {
            double limitKnots = Attributes::doubleOr(geofence->attributes, Position::KEY_SPEED_LIMIT, 0.0);
            if (shouldReplaceLimit(limitKnots, regular.speedLimit)) {
                regular.speedLimit = limitKnots;
                regular.geofenceId = geofenceId;
            }
        }
    }

    if (radarIndex_ && radarIndex_->isEnabled()) {
        auto match = radarIndex_->match(position.latitude, position.longitude);
        if (match && match->speedLimitKph > 0) {
            double limitKnots = Geo::knotsFromKph(match->speedLimitKph);
            if (shouldReplaceLimit(limitKnots, radar.speedLimit)) {
                radar.speedLimit = limitKnots;
                radar.geofenceId = 0;
                radar.radar = RadarSource{RadarKind::Static, match->radarId, match->radarName,
                                          match->externalId, match->speedLimitKph};
            }
        }
    }

    return radar.speedLimit > 0 ? radar : regular;
}

bool OverspeedEvaluator::inRadarCooldown(const RadarCooldownKey& key) {
    if (config_.radarCooldownMillis <= 0) {
        return false;
    }
    int64_t now = clock_->epochMillis();
    return radarCooldowns_.update(key, [&](std::optional<int64_t>& last) {
        if (last && now - *last < config_.radarCooldownMillis) {
            return true;
        }
        last = now;
        return false;
    });
}

void OverspeedEvaluator::appendRadarAttributes(Event& event, const RadarSource& radar) {
    event.attributes[ATTRIBUTE_RADAR_ID] = radar.id;
    event.attributes[ATTRIBUTE_RADAR_NAME] = radar.name;
    event.attributes[ATTRIBUTE_RADAR_SOURCE] = radar.kind == RadarKind::Static ? "static" : "geofence";
    if (!radar.externalId.empty()) {
        event.attributes[ATTRIBUTE_RADAR_EXTERNAL_ID] = radar.externalId;
    }

    double limitKph = radar.limitKph;
    if (limitKph <= 0) {
        double limitKnots = Attributes::doubleOr(event.attributes, OverspeedProcessor::ATTRIBUTE_SPEED_LIMIT, 0.0);
        if (limitKnots > 0) {
            limitKph = Geo::kphFromKnots(limitKnots);
        }
    }
    if (limitKph > 0) {
        event.attributes[ATTRIBUTE_RADAR_SPEED_LIMIT_KPH] = limitKph;
        event.attributes[ATTRIBUTE_LIMIT_KPH] = limitKph;
    }

    double speedKnots = Attributes::doubleOr(event.attributes, OverspeedProcessor::ATTRIBUTE_SPEED, 0.0);
    if (speedKnots > 0) {
        event.attributes[ATTRIBUTE_SPEED_KPH] = Geo::kphFromKnots(speedKnots);
    }
}

void OverspeedEvaluator::persistState(Device device, const OverspeedState& state) {
    state.toDevice(device);
    try {
        store_->updateDeviceOverspeed(device);
        cacheManager_->invalidateDevice(device.id);
    } catch (const ports::StorageException& e) {
        std::cerr << "[Overspeed] Update device overspeed error: " << e.what() << std::endl;
    }
}

void OverspeedEvaluator::onPosition(const Position& position, const Callback& callback) {
    int64_t deviceId = position.deviceId;
    auto device = cacheManager_->getDevice(deviceId);
    if (!device) {
        return;
    }
    if (!isLatest(*cacheManager_, position)) {
        return;
    }

    double speedLimit = cacheManager_->lookupDeviceAttribute(deviceId, Position::KEY_SPEED_LIMIT).value_or(0.0);

    double positionSpeedLimit = Attributes::doubleOr(position.attributes, Position::KEY_SPEED_LIMIT, 0.0);
    if (positionSpeedLimit > 0) {
        speedLimit = positionSpeedLimit;
    }

    LimitSelection selection = selectGeofenceSpeedLimit(position);
    if (selection.speedLimit > 0) {
        speedLimit = selection.speedLimit;
    }

    if (speedLimit <= 0) {
        return;
    }

    OverspeedState state = OverspeedState::fromDevice(*device);
    auto event = processor_.update(state, position, speedLimit, selection.geofenceId);
    if (state.isChanged()) {
        persistState(*device, state);
    }

    if (!event) {
        return;
    }

    // The alert belongs to the geofence the episode started in
    std::optional<RadarSource> radar;
    if (event->geofenceId != 0) {
        if (auto geofence = cacheManager_->getGeofence(event->geofenceId)) {
            radar = radarForGeofence(*geofence);
        }
    } else if (selection.radar && selection.radar->kind == RadarKind::Static) {
        radar = selection.radar;
    }

    if (radar) {
        if (inRadarCooldown(RadarCooldownKey{deviceId, radar->kind, radar->id})) {
            return;
        }
        appendRadarAttributes(*event, *radar);
    }
    callback(std::move(*event));
}

void OverspeedEvaluator::onDeviceRemoved(int64_t deviceId) {
    radarCooldowns_.eraseIf([deviceId](const RadarCooldownKey& key, int64_t) {
        return key.deviceId == deviceId;
    });
}

} // namespace fleetalert::domain
