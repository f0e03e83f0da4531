#pragma once

#include "../IClock.hpp"
#include "../Model.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/IEventForwarder.hpp"
#include "../ports/INotificator.hpp"
#include "../ports/IObjectStore.hpp"
#include <cstdint>
#include <memory>
#include <set>
#include <string>

namespace fleetalert::domain {

struct NotificationConfig {
    int64_t timeThresholdMillis = 15 * 60 * 1000;  ///< Older events are stored but not delivered
    std::set<int64_t> blockedUsers;                 ///< Users that never receive deliveries
};

/**
 * @brief Turns one raised event into delivered messages
 *
 * Order of work for each event:
 * 1. persist it (a storage failure abandons the event)
 * 2. hand a copy to the optional external forwarder, without waiting
 * 3. drop stale events
 * 4. match the device's subscriptions by type, alias and alarm code
 * 5. apply calendar windows
 * 6. deliver to every subscribed, non-blocked user on every channel of the
 *    subscription, isolating failures per channel
 */
class NotificationManager {
public:
    static constexpr const char* ATTRIBUTE_ALARMS = "alarms";

    NotificationManager(std::shared_ptr<ports::IObjectStore> store,
                        std::shared_ptr<ports::ICacheManager> cacheManager,
                        std::shared_ptr<ports::NotificatorRegistry> notificators,
                        std::shared_ptr<IClock> clock,
                        NotificationConfig config,
                        std::shared_ptr<ports::IEventForwarder> forwarder = nullptr);

    /// @return Number of successful channel deliveries
    int updateEvent(Event event, const Position* position);

    static bool matchesType(const std::string& notificationType, const std::string& eventType);
    static bool matchesAlarm(const Notification& notification, const Event& event);

private:
    void forwardEvent(const Event& event, const Position* position);
    int dispatch(const Event& event, const Position* position);

    std::shared_ptr<ports::IObjectStore> store_;
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::shared_ptr<ports::NotificatorRegistry> notificators_;
    std::shared_ptr<IClock> clock_;
    NotificationConfig config_;
    std::shared_ptr<ports::IEventForwarder> forwarder_;
};

} // namespace fleetalert::domain
