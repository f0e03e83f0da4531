#pragma once

#include "../IMqttClient.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/INotificator.hpp"
#include <memory>
#include <string>

namespace fleetalert::adapters {

/**
 * @brief Push channel that hands rendered messages to an MQTT gateway
 *
 * Publishes {"userId", "subject", "body", "priority", "data"} to
 * "<topicPrefix>/<userId>". The mobile push gateway subscribed there owns
 * token lookup and fan-out. A disconnected broker is a delivery failure so
 * callers can schedule their own retry.
 */
class MqttPushNotificator : public ports::INotificator {
public:
    MqttPushNotificator(std::shared_ptr<IMqttClient> mqttClient,
                        std::shared_ptr<ports::ICacheManager> cacheManager,
                        std::string topicPrefix);

    void send(const Notification& notification, const User& user,
              const Event& event, const Position* position) override;

    void send(const User& user, const ports::NotificationMessage& message) override;

    std::string topicFor(int64_t userId) const;

private:
    std::shared_ptr<IMqttClient> mqttClient_;
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::string topicPrefix_;
};

} // namespace fleetalert::adapters
