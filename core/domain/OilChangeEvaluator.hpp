#pragma once

#include "EventHandler.hpp"
#include "MaintenanceConfig.hpp"
#include "../ConcurrentMap.hpp"
#include "../TimeZone.hpp"
#include "../ports/ICacheManager.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace fleetalert::domain {

/// One service cycle of one device: changes whenever the service record is updated
struct OilCycleKey {
    int64_t deviceId = 0;
    std::optional<int64_t> dueKm;
    std::optional<int64_t> dueDate;
    std::string eventType;

    bool operator==(const OilCycleKey& other) const {
        return deviceId == other.deviceId && dueKm == other.dueKm
            && dueDate == other.dueDate && eventType == other.eventType;
    }
};

struct OilCycleKeyHash {
    size_t operator()(const OilCycleKey& key) const {
        size_t hash = std::hash<int64_t>()(key.deviceId);
        auto mix = [&hash](size_t value) {
            hash ^= value + 0x9e3779b97f4a7c15ULL + (hash << 6) + (hash >> 2);
        };
        mix(key.dueKm ? std::hash<int64_t>()(*key.dueKm) : 0x51ed27);
        mix(key.dueDate ? std::hash<int64_t>()(*key.dueDate) : 0x2b992d);
        mix(std::hash<std::string>()(key.eventType));
        return hash;
    }
};

/**
 * @brief Raises oilChangeSoon / oilChangeDue when the odometer or the calendar
 * crosses a service threshold between the previous and the current fix
 *
 * Due thresholds are lastServiceOdometer + intervalKm and lastServiceDate +
 * intervalMonths (UTC). Soon thresholds sit 50 km and 7 days earlier. An alert
 * for one cycle and type fires at most once per UTC day.
 */
class OilChangeEvaluator : public EventHandler {
public:
    static constexpr int64_t PRE_DUE_KM_THRESHOLD = 50;
    static constexpr int64_t PRE_DUE_DAYS_THRESHOLD = 7;
    static constexpr const char* MAINTENANCE_NAME = "Oil change";

    OilChangeEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager, bool verbose = false);

    void onPosition(const Position& position, const Callback& callback) override;
    void onDeviceRemoved(int64_t deviceId) override;

    /// Highest of the configured odometer, the position odometer and the baseline estimate
    static std::optional<int64_t> resolveCurrentKm(const OilChangeConfig& config, const Position& position);
    static std::optional<int64_t> positionOdometerKm(const Position& position);

private:
    bool shouldNotifyToday(const OilCycleKey& key, int64_t when);
    void logEvaluation(int64_t deviceId, const OilChangeConfig& config,
                       std::optional<int64_t> dueKm, std::optional<int64_t> dueDate,
                       std::optional<int64_t> oldKm, std::optional<int64_t> currentKm,
                       int64_t oldTime, int64_t newTime, const char* decision) const;

    std::shared_ptr<ports::ICacheManager> cacheManager_;
    bool verbose_;
    ConcurrentMap<OilCycleKey, LocalDate, OilCycleKeyHash> notifiedDay_;
};

} // namespace fleetalert::domain
