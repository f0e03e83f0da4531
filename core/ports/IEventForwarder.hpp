#pragma once

#include "../Model.hpp"
#include <functional>
#include <optional>
#include <string>

namespace fleetalert::ports {

struct EventData {
    Event event;
    std::optional<Position> position;
    std::optional<Device> device;
    std::optional<Geofence> geofence;
};

class IEventForwarder {
public:
    virtual ~IEventForwarder() = default;

    using ResultHandler = std::function<void(bool success, const std::string& error)>;

    /// Fire-and-forget; the handler may run on another thread
    virtual void forward(const EventData& data, ResultHandler handler) = 0;
};

} // namespace fleetalert::ports
