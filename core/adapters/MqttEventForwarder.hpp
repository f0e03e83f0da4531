#pragma once

#include "../IMqttClient.hpp"
#include "../ports/IEventForwarder.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace fleetalert::adapters {

/**
 * @brief Publishes each event with its context to "<topicPrefix>/<deviceId>"
 *
 * The payload is JsonCodec::serialize(EventData). Delivery is reported
 * through the result handler once the broker acknowledges or rejects it.
 */
class MqttEventForwarder : public ports::IEventForwarder {
public:
    MqttEventForwarder(std::shared_ptr<IMqttClient> mqttClient, std::string topicPrefix, int qos = 1);

    void forward(const ports::EventData& data, ResultHandler handler) override;

    std::string topicFor(int64_t deviceId) const;

private:
    std::shared_ptr<IMqttClient> mqttClient_;
    std::string topicPrefix_;
    int qos_;
};

} // namespace fleetalert::adapters
