#include "MqttPushNotificator.hpp"
#include "EventMessages.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <utility>

namespace fleetalert::adapters {

MqttPushNotificator::MqttPushNotificator(std::shared_ptr<IMqttClient> mqttClient,
                                         std::shared_ptr<ports::ICacheManager> cacheManager,
                                         std::string topicPrefix)
    : mqttClient_(std::move(mqttClient)),
      cacheManager_(std::move(cacheManager)),
      topicPrefix_(std::move(topicPrefix)) {
    while (!topicPrefix_.empty() && topicPrefix_.back() == '/') {
        topicPrefix_.pop_back();
    }
}

std::string MqttPushNotificator::topicFor(int64_t userId) const {
    return topicPrefix_ + "/" + std::to_string(userId);
}

void MqttPushNotificator::send(const Notification& notification, const User& user,
                               const Event& event, const Position* position) {
    std::optional<Geofence> geofence;
    if (event.geofenceId != 0) {
        geofence = cacheManager_->getGeofence(event.geofenceId);
    }
    send(user, EventMessages::render(notification, event, cacheManager_->getDevice(event.deviceId),
                                     geofence, position));
}

void MqttPushNotificator::send(const User& user, const ports::NotificationMessage& message) {
    if (!mqttClient_->isConnected()) {
        throw ports::DeliveryException("Push broker not connected");
    }

    nlohmann::json payload;
    payload["userId"] = user.id;
    payload["subject"] = message.subject;
    payload["body"] = message.body;
    payload["priority"] = message.priority;
    payload["data"] = message.data;

    MqttMessage mqttMessage;
    mqttMessage.topic = topicFor(user.id);
    mqttMessage.payload = payload.dump();
    mqttMessage.qos = 1;

    int64_t userId = user.id;
    bool accepted = mqttClient_->publish(mqttMessage, [userId](bool delivered, const std::string& error) {
        if (!delivered) {
            std::cerr << "[MQTT] Push delivery failed userId=" << userId << ": " << error << std::endl;
        }
    });
    if (!accepted) {
        throw ports::DeliveryException("Push publish rejected for userId=" + std::to_string(user.id));
    }
}

} // namespace fleetalert::adapters
