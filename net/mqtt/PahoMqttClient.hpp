/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 */

#pragma once

#include "../../core/IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <string>

namespace fleetalert {

/**
 * @brief Paho MQTTAsync client
 *
 * Features:
 * - Offline queue with a fixed capacity, oldest message dropped first
 * - Automatic reconnection handled by the Paho library
 * - Per-message delivery callbacks driven by MQTTAsync response options
 *
 * @note Thread-safe
 */
class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();

    /// Disconnects and destroys the Paho handle
    ~PahoMqttClient() override;

    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;

    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const MqttMessage& message, PublishCallback callback = nullptr) override;

    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 100;

    static constexpr int kKeepAliveIntervalSeconds = 60;
    static constexpr int kConnectionTimeoutSeconds = 30;

    struct QueuedMessage {
        MqttMessage message;
        PublishCallback callback;
    };

    /// Heap-allocated per publish, owned by the Paho callbacks once sent
    struct PublishContext {
        PublishCallback callback;
    };

    MQTTAsync client_ = nullptr;
    std::atomic<bool> connected_{false};

    ConnectionCallback connectionCallback_;

    std::queue<QueuedMessage> offlineQueue_;
    std::mutex queueMutex_;

    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);

    static void onPublishSuccess(void* context, MQTTAsync_successData* response);
    static void onPublishFailure(void* context, MQTTAsync_failureData* response);

    bool send(const MqttMessage& message, PublishCallback callback);
    void flushOfflineQueue();
    void queueMessage(const MqttMessage& message, PublishCallback callback);
    bool validateCertificateFiles(const TlsConfig& tlsConfig) const;
};

} // namespace fleetalert
