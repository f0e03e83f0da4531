#include "OverspeedState.hpp"

namespace fleetalert::domain {

OverspeedState OverspeedState::fromDevice(const Device& device) {
    if (!device.overspeedState) {
        return OverspeedState(OverspeedIdle{});
    }
    if (device.overspeedTime) {
        return OverspeedState(OverspeedExceeding{*device.overspeedTime, device.overspeedGeofenceId});
    }
    return OverspeedState(OverspeedAlerted{});
}

void OverspeedState::toDevice(Device& device) const {
    device.overspeedState = isOverspeeding();
    if (const auto* exceeding = std::get_if<OverspeedExceeding>(&phase_)) {
        device.overspeedTime = exceeding->since;
        device.overspeedGeofenceId = exceeding->geofenceId;
    } else {
        device.overspeedTime.reset();
        device.overspeedGeofenceId = 0;
    }
}

int64_t OverspeedState::geofenceId() const {
    if (const auto* exceeding = std::get_if<OverspeedExceeding>(&phase_)) {
        return exceeding->geofenceId;
    }
    return 0;
}

void OverspeedState::transitionTo(OverspeedPhase next) {
    if (!(next == phase_)) {
        phase_ = next;
        changed_ = true;
    }
}

std::optional<Event> OverspeedProcessor::update(OverspeedState& state, const Position& position,
                                                double speedLimit, int64_t geofenceId) const {
    if (!isOverLimit(position, speedLimit)) {
        state.transitionTo(OverspeedIdle{});
        return std::nullopt;
    }

    if (std::holds_alternative<OverspeedIdle>(state.phase())) {
        state.transitionTo(OverspeedExceeding{position.fixTime, geofenceId});
    }

    const auto* exceeding = std::get_if<OverspeedExceeding>(&state.phase());
    if (!exceeding || position.fixTime - exceeding->since < minimalDuration_) {
        return std::nullopt;
    }

    Event event(Event::TYPE_DEVICE_OVERSPEED, position);
    event.geofenceId = exceeding->geofenceId;
    event.attributes[ATTRIBUTE_SPEED] = position.speed;
    event.attributes[ATTRIBUTE_SPEED_LIMIT] = speedLimit;
    state.transitionTo(OverspeedAlerted{});
    return event;
}

} // namespace fleetalert::domain
