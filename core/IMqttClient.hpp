/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used by the collector transport
 *
 * Thin abstraction over an asynchronous MQTT client so the collector transport
 * can be exercised without a broker. The desktop build provides a Paho MQTT C
 * implementation in net/mqtt.
 *
 * @note Callbacks are invoked from the client's network thread
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace uplink {

/**
 * @brief Single MQTT message, inbound or outbound
 */
struct MqttMessage {
    std::string topic;              ///< Full topic including any property bag
    std::string payload;            ///< Raw payload bytes (JSON for the collector)
    int qos = 0;                    ///< Quality of Service level (0, 1, or 2)
    bool retained = false;          ///< Retain flag
};

/**
 * @brief Connection parameters for the collector broker
 */
struct MqttConnectOptions {
    std::string host;               ///< Broker hostname
    std::uint16_t port = 8883;      ///< Broker port (8883 for TLS, 1883 plain)
    std::string clientId;           ///< Unique client identifier
    std::string username;           ///< MQTT username
    std::string password;           ///< MQTT password (collector token)
    bool useTls = true;             ///< Connect over ssl:// instead of tcp://
    std::string caPath;             ///< Optional trust store for server verification
    bool verifyServer = true;       ///< Enable server certificate validation
};

/**
 * @brief Platform-independent asynchronous MQTT client
 */
class IMqttClient {
public:
    virtual ~IMqttClient() = default;
    
    /// Callback function type for incoming MQTT messages
    using MessageCallback = std::function<void(const MqttMessage&)>;
    
    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;
    
    /**
     * @brief Start connecting to the broker
     * @param options Host, credentials and TLS settings
     * @return true if the connection attempt was initiated
     * @note Completion is reported through the connection callback
     */
    virtual bool connect(const MqttConnectOptions& options) = 0;
    
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;
    
    /**
     * @brief Publish a message
     * @return true if the client accepted the message for delivery
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos = 0, bool retained = false) = 0;
    
    virtual bool subscribe(const std::string& topic, int qos = 0) = 0;
    virtual bool unsubscribe(const std::string& topic) = 0;
    
    virtual void setMessageCallback(MessageCallback callback) = 0;
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

protected:
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace uplink
