#pragma once

#include "../IMqttClient.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace fleetalert::sim {

/// In-process IMqttClient that records publishes and acknowledges them synchronously
class MockMqttClient : public IMqttClient {
public:
    MockMqttClient() = default;
    ~MockMqttClient() override = default;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const MqttMessage& message, PublishCallback callback = nullptr) override;

    void setConnectionCallback(ConnectionCallback callback) override;

    // Test controls
    void setConnected(bool connected);
    void setFailPublish(bool fail) { failPublish_ = fail; }

    std::vector<MqttMessage> publishedMessages() const;
    const MqttConnectOptions& lastOptions() const { return lastOptions_; }

private:
    bool connected_ = false;
    bool failPublish_ = false;
    ConnectionCallback connectionCallback_;
    MqttConnectOptions lastOptions_;

    mutable std::mutex mutex_;
    std::vector<MqttMessage> published_;
};

} // namespace fleetalert::sim
