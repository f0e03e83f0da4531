#include "MockMqttClient.hpp"
#include <utility>

namespace fleetalert::sim {

bool MockMqttClient::connect(const MqttConnectOptions& options) {
    lastOptions_ = options;
    setConnected(true);
    return true;
}

void MockMqttClient::disconnect() {
    setConnected(false);
}

bool MockMqttClient::isConnected() const {
    return connected_;
}

bool MockMqttClient::publish(const MqttMessage& message, PublishCallback callback) {
    if (!connected_ || failPublish_) {
        if (callback) {
            callback(false, connected_ ? "Mock publish failure" : "Not connected");
        }
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back(message);
    }
    if (callback) {
        callback(true, "");
    }
    return true;
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::setConnected(bool connected) {
    if (connected_ == connected) {
        return;
    }
    connected_ = connected;
    if (connectionCallback_) {
        connectionCallback_(connected, connected ? "Mock connection established" : "Disconnected");
    }
}

std::vector<MqttMessage> MockMqttClient::publishedMessages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return published_;
}

} // namespace fleetalert::sim
