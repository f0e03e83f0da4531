#include "OilChangeEvaluator.hpp"
#include "../Attributes.hpp"
#include "../IClock.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <utility>

namespace fleetalert::domain {

namespace {

constexpr int64_t kDayMillis = 24LL * 60 * 60 * 1000;

std::string optionalText(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "null";
}

std::string optionalDate(const std::optional<int64_t>& value) {
    return value ? Iso8601::format(*value) : "null";
}

/// True when `threshold` lies in (previous, current]
bool crossed(const std::optional<int64_t>& previous, const std::optional<int64_t>& current,
             const std::optional<int64_t>& threshold) {
    return threshold && previous && current && *previous < *threshold && *threshold <= *current;
}

} // namespace

OilChangeEvaluator::OilChangeEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager, bool verbose)
    : cacheManager_(std::move(cacheManager)), verbose_(verbose) {
}

std::optional<int64_t> OilChangeEvaluator::positionOdometerKm(const Position& position) {
    auto odometerKm = MaintenanceConfig::kmFromMeters(Attributes::getDouble(position.attributes, Position::KEY_ODOMETER));
    auto distanceKm = MaintenanceConfig::kmFromMeters(Attributes::getDouble(position.attributes, Position::KEY_TOTAL_DISTANCE));
    if (!odometerKm) {
        return distanceKm;
    }
    if (!distanceKm) {
        return odometerKm;
    }
    return std::max(*odometerKm, *distanceKm);
}

std::optional<int64_t> OilChangeEvaluator::resolveCurrentKm(const OilChangeConfig& config, const Position& position) {
    auto positionKm = positionOdometerKm(position);

    std::optional<int64_t> baselineKm;
    if (positionKm && config.baselineDistanceKm && config.baselineOdometerKm) {
        baselineKm = *config.baselineOdometerKm + std::max<int64_t>(0, *positionKm - *config.baselineDistanceKm);
    }

    std::optional<int64_t> result = config.odometerCurrentKm;
    for (const auto& candidate : {positionKm, baselineKm}) {
        if (candidate) {
            result = result ? std::max(*result, *candidate) : *candidate;
        }
    }
    return result;
}

void OilChangeEvaluator::onPosition(const Position& position, const Callback& callback) {
    auto lastPosition = cacheManager_->getLastPosition(position.deviceId);
    if (!lastPosition || position.fixTime < lastPosition->fixTime) {
        return;
    }

    auto device = cacheManager_->getDevice(position.deviceId);
    if (!device) {
        return;
    }

    auto config = OilChangeConfig::fromDevice(*device);
    if (!config || !config->enabled) {
        return;
    }

    auto dueKm = config->dueKm();
    auto dueDate = config->dueDate();
    std::optional<int64_t> soonKm;
    if (dueKm) {
        soonKm = std::max<int64_t>(0, *dueKm - PRE_DUE_KM_THRESHOLD);
    }
    std::optional<int64_t> soonDate;
    if (dueDate) {
        soonDate = *dueDate - PRE_DUE_DAYS_THRESHOLD * kDayMillis;
    }

    auto oldKm = resolveCurrentKm(*config, *lastPosition);
    auto currentKm = resolveCurrentKm(*config, position);
    int64_t oldTime = lastPosition->fixTime;
    int64_t newTime = position.fixTime;

    bool dueByKm = crossed(oldKm, currentKm, dueKm);
    bool dueByDate = crossed(oldTime, newTime, dueDate);
    bool soonByKm = !dueByKm && crossed(oldKm, currentKm, soonKm) && (!dueKm || *currentKm < *dueKm);
    bool soonByDate = !dueByDate && crossed(oldTime, newTime, soonDate) && (!dueDate || newTime < *dueDate);

    bool due = dueByKm || dueByDate;
    if (!due && !soonByKm && !soonByDate) {
        logEvaluation(device->id, *config, dueKm, dueDate, oldKm, currentKm, oldTime, newTime, "none");
        return;
    }
    bool byKm = due ? dueByKm : soonByKm;
    bool byDate = due ? dueByDate : soonByDate;
    const char* eventType = due ? Event::TYPE_OIL_CHANGE_DUE : Event::TYPE_OIL_CHANGE_SOON;

    if (!shouldNotifyToday(OilCycleKey{device->id, dueKm, dueDate, eventType}, newTime)) {
        logEvaluation(device->id, *config, dueKm, dueDate, oldKm, currentKm, oldTime, newTime,
                      due ? "due_suppressed" : "soon_suppressed");
        return;
    }

    Event event(eventType, position);
    event.attributes["oilReason"] = byKm && byDate ? "km,date" : (byKm ? "km" : "date");
    event.attributes["maintenanceName"] = MAINTENANCE_NAME;
    if (dueKm) {
        event.attributes["oilDueKm"] = *dueKm;
    }
    if (currentKm) {
        event.attributes["oilCurrentKm"] = *currentKm;
    }
    if (dueDate) {
        event.attributes["oilDueDate"] = Iso8601::format(*dueDate);
        event.attributes["oilDaysRemaining"] = static_cast<int64_t>(
            std::llround(static_cast<double>(*dueDate - event.eventTime) / kDayMillis));
    }
    if (dueKm && currentKm) {
        event.attributes["oilKmRemaining"] = *dueKm - *currentKm;
    }

    logEvaluation(device->id, *config, dueKm, dueDate, oldKm, currentKm, oldTime, newTime, due ? "due" : "soon");
    callback(std::move(event));
}

bool OilChangeEvaluator::shouldNotifyToday(const OilCycleKey& key, int64_t when) {
    LocalDate today = TimeZone::utc().localDate(when);
    return notifiedDay_.update(key, [&](std::optional<LocalDate>& previous) {
        if (previous && *previous == today) {
            return false;
        }
        previous = today;
        return true;
    });
}

void OilChangeEvaluator::onDeviceRemoved(int64_t deviceId) {
    notifiedDay_.eraseIf([deviceId](const OilCycleKey& key, const LocalDate&) {
        return key.deviceId == deviceId;
    });
}

void OilChangeEvaluator::logEvaluation(int64_t deviceId, const OilChangeConfig& config,
                                       std::optional<int64_t> dueKm, std::optional<int64_t> dueDate,
                                       std::optional<int64_t> oldKm, std::optional<int64_t> currentKm,
                                       int64_t oldTime, int64_t newTime, const char* decision) const {
    if (!verbose_) {
        return;
    }
    std::ostringstream line;
    line << "[OilChange] oil_maintenance_eval deviceId=" << deviceId
         << " dueKm=" << optionalText(dueKm)
         << " dueDate=" << optionalDate(dueDate)
         << " oldKm=" << optionalText(oldKm)
         << " currentKm=" << optionalText(currentKm)
         << " oldTime=" << Iso8601::format(oldTime)
         << " newTime=" << Iso8601::format(newTime)
         << " intervalKm=" << optionalText(config.intervalKm)
         << " intervalMonths=" << (config.intervalMonths ? std::to_string(*config.intervalMonths) : "null")
         << " decision=" << decision;
    std::cout << line.str() << std::endl;
}

} // namespace fleetalert::domain
