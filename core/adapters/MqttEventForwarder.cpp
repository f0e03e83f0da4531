#include "MqttEventForwarder.hpp"
#include "../JsonCodec.hpp"
#include <iostream>
#include <utility>

namespace fleetalert::adapters {

MqttEventForwarder::MqttEventForwarder(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix, int qos)
    : mqttClient_(std::move(mqttClient)),
      topicPrefix_(std::move(topicPrefix)),
      qos_(qos) {
    while (!topicPrefix_.empty() && topicPrefix_.back() == '/') {
        topicPrefix_.pop_back();
    }
}

std::string MqttEventForwarder::topicFor(int64_t deviceId) const {
    return topicPrefix_ + "/" + std::to_string(deviceId);
}

void MqttEventForwarder::forward(const ports::EventData& data, ResultHandler handler) {
    MqttMessage message;
    message.topic = topicFor(data.event.deviceId);
    message.payload = JsonCodec::serialize(data);
    message.qos = qos_;

    if (!mqttClient_->isConnected()) {
        std::cout << "[Forwarder] Broker offline, queueing eventId=" << data.event.id << std::endl;
    }
    mqttClient_->publish(message, [handler](bool delivered, const std::string& error) {
        if (handler) {
            handler(delivered, error);
        }
    });
}

} // namespace fleetalert::adapters
