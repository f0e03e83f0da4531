#include "PahoMqttClient.hpp"
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

namespace fleetalert {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const MqttConnectOptions& options) {
    if (options.tls.enabled && !validateCertificateFiles(options.tls)) {
        return false;
    }

    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }

    std::string scheme = options.tls.enabled ? "ssl://" : "tcp://";
    std::string serverURI = scheme + options.host + ":" + std::to_string(options.port);

    std::cout << "[MQTT] Connecting to " << serverURI << " as " << options.clientId << std::endl;

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.automaticReconnect = 1;
    conn_opts.minRetryInterval = 1;
    conn_opts.maxRetryInterval = 60;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!options.username.empty()) {
        conn_opts.username = options.username.c_str();
    }
    if (!options.password.empty()) {
        conn_opts.password = options.password.c_str();
    }

    if (options.tls.enabled) {
        if (!options.tls.caPath.empty()) {
            ssl_opts.trustStore = options.tls.caPath.c_str();
        }
        if (!options.tls.certPath.empty()) {
            ssl_opts.keyStore = options.tls.certPath.c_str();
            ssl_opts.privateKey = options.tls.keyPath.c_str();
        }
        ssl_opts.enableServerCertAuth = options.tls.verifyServer ? 1 : 0;
        ssl_opts.verify = options.tls.verifyServer ? 1 : 0;
        ssl_opts.sslVersion = MQTT_SSL_VERSION_TLS_1_2;
        conn_opts.ssl = &ssl_opts;
    }

    rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        MQTTAsync_disconnect(client_, &disc_opts);
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const MqttMessage& message, PublishCallback callback) {
    if (!connected_) {
        queueMessage(message, std::move(callback));
        return false;
    }
    return send(message, std::move(callback));
}

bool PahoMqttClient::send(const MqttMessage& message, PublishCallback callback) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(message.payload.data()));
    pubmsg.payloadlen = static_cast<int>(message.payload.size());
    pubmsg.qos = message.qos;
    pubmsg.retained = message.retained ? 1 : 0;

    auto* context = new PublishContext{std::move(callback)};
    opts.onSuccess = onPublishSuccess;
    opts.onFailure = onPublishFailure;
    opts.context = context;

    int rc = MQTTAsync_sendMessage(client_, message.topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        // Paho never calls back for a rejected send.
        if (context->callback) {
            context->callback(false, "MQTTAsync_sendMessage error code " + std::to_string(rc));
        }
        delete context;
        return false;
    }
    return true;
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    (void)context;
    (void)topicLen;
    // Publish-only client: nothing is subscribed, drop anything the broker pushes.
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    std::cout << "[MQTT] Connected" << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }

    client->flushOfflineQueue();
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = "Connection failed";
    if (response) {
        reason = "CONNACK return code " + std::to_string(response->code);
        if (response->message) {
            reason += " (" + std::string(response->message) + ")";
        }
    }
    std::cerr << "[MQTT] " << reason << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << std::endl;

    if (client->connectionCallback_) {
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::onPublishSuccess(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* publish = static_cast<PublishContext*>(context);
    if (publish->callback) {
        publish->callback(true, "");
    }
    delete publish;
}

void PahoMqttClient::onPublishFailure(void* context, MQTTAsync_failureData* response) {
    auto* publish = static_cast<PublishContext*>(context);
    if (publish->callback) {
        std::string error = "Publish failed";
        if (response) {
            error += ", code " + std::to_string(response->code);
            if (response->message) {
                error += " (" + std::string(response->message) + ")";
            }
        }
        publish->callback(false, error);
    }
    delete publish;
}

void PahoMqttClient::flushOfflineQueue() {
    std::vector<QueuedMessage> pending;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        while (!offlineQueue_.empty()) {
            pending.push_back(std::move(offlineQueue_.front()));
            offlineQueue_.pop();
        }
    }

    for (auto& item : pending) {
        publish(item.message, std::move(item.callback));
    }
}

void PahoMqttClient::queueMessage(const MqttMessage& message, PublishCallback callback) {
    std::lock_guard<std::mutex> lock(queueMutex_);

    // Drop the oldest message when full
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        auto& dropped = offlineQueue_.front();
        if (dropped.callback) {
            dropped.callback(false, "Offline queue full");
        }
        offlineQueue_.pop();
    }

    offlineQueue_.push(QueuedMessage{message, std::move(callback)});
}

bool PahoMqttClient::validateCertificateFiles(const TlsConfig& tlsConfig) const {
    for (const auto& path : {tlsConfig.caPath, tlsConfig.certPath, tlsConfig.keyPath}) {
        if (path.empty()) {
            continue;
        }
        std::ifstream file(path);
        if (!file.good()) {
            std::cerr << "[MQTT] ERROR: TLS file not found: " << path << std::endl;
            return false;
        }
    }
    return true;
}

} // namespace fleetalert
