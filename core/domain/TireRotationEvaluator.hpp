#pragma once

#include "EventHandler.hpp"
#include "MaintenanceConfig.hpp"
#include "../ConcurrentMap.hpp"
#include "../ports/ICacheManager.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fleetalert::domain {

enum class TireStatus {
    Ok,
    DueSoon,
    Overdue
};

std::string tireStatusToString(TireStatus status);

struct TireSchedule {
    int64_t nextDueOdometerKm = 0;
    int64_t kmRemaining = 0;
    TireStatus status = TireStatus::Ok;
};

/**
 * @brief Raises tireRotationSoon / tireRotationDue on band changes
 *
 * The band is derived from the km remaining until the next rotation: above the
 * reminder buffer is OK, inside it is DUE_SOON, at or past zero is OVERDUE.
 * Only a change of band raises an event; returning to OK is silent.
 */
class TireRotationEvaluator : public EventHandler {
public:
    explicit TireRotationEvaluator(std::shared_ptr<ports::ICacheManager> cacheManager);

    void onPosition(const Position& position, const Callback& callback) override;
    void onDeviceRemoved(int64_t deviceId) override;

    static TireSchedule computeSchedule(const TireRotationConfig& config, int64_t currentKm);
    static std::optional<int64_t> positionOdometerKm(const Position& position);

private:
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    ConcurrentMap<int64_t, TireStatus> lastNotified_;
};

} // namespace fleetalert::domain
