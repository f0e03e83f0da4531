#include "TireRotationEvaluator.hpp"
#include "../Attributes.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace fleetalert::domain {

std::string tireStatusToString(TireStatus status) {
    switch (status) {
        case TireStatus::Ok: return "OK";
        case TireStatus::DueSoon: return "DUE_SOON";
        case TireStatus::Overdue: return "OVERDUE";
    }
    return "OK";
}

TireRotationEvaluator::TireRotationEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager)
    : cacheManager_(std::move(cacheManager)) {
}

std::optional<int64_t> TireRotationEvaluator::positionOdometerKm(const Position& position) {
    auto meters = Attributes::getDouble(position.attributes, Position::KEY_ODOMETER);
    if (!meters) {
        meters = Attributes::getDouble(position.attributes, Position::KEY_TOTAL_DISTANCE);
    }
    if (!meters) {
        return std::nullopt;
    }
    return std::max<int64_t>(0, std::llround(*meters / 1000.0));
}

TireSchedule TireRotationEvaluator::computeSchedule(const TireRotationConfig& config, int64_t currentKm) {
    int64_t interval = config.intervalKm > 0 ? config.intervalKm : TireRotationConfig::DEFAULT_INTERVAL_KM;
    int64_t reminder = config.reminderThresholdKm > 0
        ? config.reminderThresholdKm : TireRotationConfig::DEFAULT_REMINDER_KM;

    TireSchedule schedule;
    schedule.nextDueOdometerKm = config.lastRotationOdometerKm + interval;
    schedule.kmRemaining = schedule.nextDueOdometerKm - currentKm;
    if (schedule.kmRemaining > reminder) {
        schedule.status = TireStatus::Ok;
    } else if (schedule.kmRemaining > 0) {
        schedule.status = TireStatus::DueSoon;
    } else {
        schedule.status = TireStatus::Overdue;
    }
    return schedule;
}

void TireRotationEvaluator::onPosition(const Position& position, const Callback& callback) {
    auto device = cacheManager_->getDevice(position.deviceId);
    if (!device) {
        return;
    }
    auto config = TireRotationConfig::fromDevice(*device);
    if (!config) {
        return;
    }
    auto currentKm = positionOdometerKm(position);
    if (!currentKm) {
        return;
    }

    TireSchedule schedule = computeSchedule(*config, *currentKm);

    bool changed = lastNotified_.update(position.deviceId, [&](std::optional<TireStatus>& last) {
        if (last && *last == schedule.status) {
            return false;
        }
        last = schedule.status;
        return true;
    });
    if (!changed || schedule.status == TireStatus::Ok) {
        return;
    }

    Event event(schedule.status == TireStatus::Overdue ? Event::TYPE_TIRE_ROTATION_DUE : Event::TYPE_TIRE_ROTATION_SOON,
                position);
    event.attributes["tireStatus"] = tireStatusToString(schedule.status);
    event.attributes["tireNextKm"] = schedule.nextDueOdometerKm;
    event.attributes["tireKmRemaining"] = schedule.kmRemaining;
    event.attributes["tireIntervalKm"] = config->intervalKm;
    event.attributes["tireReminderKm"] = config->reminderThresholdKm;
    callback(std::move(event));
}

void TireRotationEvaluator::onDeviceRemoved(int64_t deviceId) {
    lastNotified_.erase(deviceId);
}

} // namespace fleetalert::domain
