#pragma once

#include "../Model.hpp"
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fleetalert::ports {

class DeliveryException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NotificationMessage {
    std::string subject;
    std::string body;
    bool priority = false;
    std::map<std::string, std::string> data;
};

/**
 * @brief Delivery channel keyed by a string identifier ("push", "firebase", ...)
 *
 * Both operations may throw DeliveryException. Timeouts and transport retries
 * belong to the implementation.
 */
class INotificator {
public:
    virtual ~INotificator() = default;

    /// Delivers an event raised for a notification subscription
    virtual void send(const Notification& notification, const User& user,
                      const Event& event, const Position* position) = 0;

    /// Delivers a pre-rendered message that is not tied to an event
    virtual void send(const User& user, const NotificationMessage& message) = 0;
};

class NotificatorRegistry {
public:
    void add(const std::string& type, std::shared_ptr<INotificator> notificator) {
        notificators_[type] = std::move(notificator);
    }

    bool has(const std::string& type) const {
        return notificators_.count(type) > 0;
    }

    /// @throws std::invalid_argument for unregistered channel types
    std::shared_ptr<INotificator> get(const std::string& type) const {
        auto it = notificators_.find(type);
        if (it == notificators_.end()) {
            throw std::invalid_argument("Unknown notificator: " + type);
        }
        return it->second;
    }

private:
    std::unordered_map<std::string, std::shared_ptr<INotificator>> notificators_;
};

} // namespace fleetalert::ports
