#pragma once

#include "../Model.hpp"
#include "../ports/INotificator.hpp"
#include <optional>
#include <string>

namespace fleetalert::adapters {

/// Renders an event into the subject/body/data shape every channel sends
class EventMessages {
public:
    static ports::NotificationMessage render(const Notification& notification,
                                             const Event& event,
                                             const std::optional<Device>& device,
                                             const std::optional<Geofence>& geofence,
                                             const Position* position);

    static std::string title(const Event& event);
};

} // namespace fleetalert::adapters
