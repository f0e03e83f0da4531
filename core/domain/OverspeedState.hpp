#pragma once

#include "../Model.hpp"
#include <cstdint>
#include <optional>
#include <variant>

namespace fleetalert::domain {

/// Speed at or below the limit
struct OverspeedIdle {
    bool operator==(const OverspeedIdle&) const { return true; }
};

/// Over the limit since `since`, alert not raised yet
struct OverspeedExceeding {
    int64_t since = 0;
    int64_t geofenceId = 0;

    bool operator==(const OverspeedExceeding& other) const {
        return since == other.since && geofenceId == other.geofenceId;
    }
};

/// Still over the limit, alert already raised for this episode
struct OverspeedAlerted {
    bool operator==(const OverspeedAlerted&) const { return true; }
};

using OverspeedPhase = std::variant<OverspeedIdle, OverspeedExceeding, OverspeedAlerted>;

class OverspeedState {
public:
    OverspeedState() = default;
    explicit OverspeedState(OverspeedPhase phase) : phase_(phase) {}

    /// Reads the persisted overspeedState/overspeedTime/overspeedGeofenceId columns
    static OverspeedState fromDevice(const Device& device);
    void toDevice(Device& device) const;

    const OverspeedPhase& phase() const { return phase_; }
    bool isOverspeeding() const { return !std::holds_alternative<OverspeedIdle>(phase_); }
    int64_t geofenceId() const;

    /// True once any transition changed the phase since construction
    bool isChanged() const { return changed_; }

    void transitionTo(OverspeedPhase next);

private:
    OverspeedPhase phase_ = OverspeedIdle{};
    bool changed_ = false;
};

/**
 * @brief Episode debouncer for overspeed alerts
 *
 * Idle -> Exceeding when the speed first goes above limit * multiplier, then
 * Exceeding -> Alerted (raising one event) once the episode has lasted
 * minimalDuration. Any sample at or below the threshold returns to Idle.
 */
class OverspeedProcessor {
public:
    static constexpr const char* ATTRIBUTE_SPEED = "speed";
    static constexpr const char* ATTRIBUTE_SPEED_LIMIT = "speedLimit";

    OverspeedProcessor(double multiplier, int64_t minimalDurationMillis)
        : multiplier_(multiplier), minimalDuration_(minimalDurationMillis) {}

    /// @return The overspeed event when this sample completes the debounce
    std::optional<Event> update(OverspeedState& state, const Position& position,
                                double speedLimit, int64_t geofenceId) const;

    bool isOverLimit(const Position& position, double speedLimit) const {
        return position.speed > speedLimit * multiplier_;
    }

private:
    double multiplier_;
    int64_t minimalDuration_;
};

} // namespace fleetalert::domain
