/**
 * @file PahoMqttClient.hpp
 * @brief Eclipse Paho MQTT C (async) implementation of IMqttClient
 *
 * Desktop MQTT client used by the collector transport. Publishing while
 * disconnected fails immediately instead of queueing: the event store is the
 * only buffer in this system and a failed publish simply becomes a failed
 * upload cycle with backoff.
 *
 * @note Paho invokes the static callbacks on its own network thread
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <atomic>
#include <mutex>
#include <string>

namespace uplink {

class PahoMqttClient : public IMqttClient {
public:
    PahoMqttClient();
    
    /**
     * @brief Disconnects if needed and destroys the Paho handle
     */
    ~PahoMqttClient() override;
    
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;
    
    bool connect(const MqttConnectOptions& options) override;
    void disconnect() override;
    bool isConnected() const override;
    
    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;
    
    bool subscribe(const std::string& topic, int qos = 0) override;
    bool unsubscribe(const std::string& topic) override;
    
    void setMessageCallback(MessageCallback callback) override;
    void setConnectionCallback(ConnectionCallback callback) override;

private:
    /// Keep-alive interval negotiated with the broker (seconds)
    static constexpr int kKeepAliveIntervalSeconds = 240;
    
    /// Connection attempt timeout (seconds)
    static constexpr int kConnectionTimeoutSeconds = 30;
    
    MQTTAsync client_ = nullptr;            ///< Paho client handle
    MqttConnectOptions options_;            ///< Options of the current connection
    std::atomic<bool> connected_{false};    ///< Current connection state
    
    mutable std::mutex callbackMutex_;      ///< Guards the user callbacks
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
    
    void destroyClient();
    void notifyConnection(bool connected, const std::string& reason);
    
    /**
     * @brief Static callback for incoming messages
     * @return 1 to tell Paho the message was consumed
     */
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    
    static void onConnected(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void connectionLost(void* context, char* cause);
    static void onDisconnected(void* context, MQTTAsync_successData* response);
};

} // namespace uplink
