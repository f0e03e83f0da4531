/**
 * @file IMqttClient.hpp
 * @brief Publish-side MQTT client interface used by the outbound adapters
 *
 * The event forwarder and the push channel only publish; neither consumes
 * inbound traffic, so the interface carries no subscription API.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace fleetalert {

/**
 * @brief Outbound MQTT message
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< e.g. "fleetalert/events/42"
    std::string payload;            ///< UTF-8 JSON document
    int qos = 1;                    ///< Quality of Service level
    bool retained = false;          ///< Retain flag
};

/**
 * @brief TLS settings for the broker connection
 *
 * All paths are PEM files. Empty certificate and key paths mean the client
 * authenticates with username/password only.
 */
struct TlsConfig {
    bool enabled = true;            ///< ssl:// when true, tcp:// otherwise
    std::string caPath;             ///< Trusted CA bundle, empty for the system default
    std::string certPath;           ///< Optional client certificate
    std::string keyPath;            ///< Optional client private key
    bool verifyServer = true;       ///< Validate the broker certificate
};

struct MqttConnectOptions {
    std::string host;
    std::uint16_t port = 8883;
    std::string clientId;
    std::string username;
    std::string password;
    TlsConfig tls;
};

/**
 * @brief Asynchronous MQTT publisher
 *
 * Implementations queue messages published while disconnected and flush them
 * once the connection is (re)established.
 *
 * @note Callbacks run on the client library's thread
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;

    /// Connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /// Delivery outcome of one publish; error is empty on success
    using PublishCallback = std::function<void(bool delivered, const std::string& error)>;

    /**
     * @brief Start connecting to the broker
     * @return true if the connection attempt was initiated
     * @note The outcome is reported through the connection callback
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief Publish a message
     * @param callback Invoked once with the broker acknowledgement or the failure
     * @return true if the message was handed to the network layer, false if it
     *         was queued for later or rejected
     */
    virtual bool publish(const MqttMessage& message, PublishCallback callback = nullptr) = 0;

    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
};

} // namespace fleetalert
