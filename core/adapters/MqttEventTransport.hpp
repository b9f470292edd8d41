/**
 * @file MqttEventTransport.hpp
 * @brief Collector transport over MQTT request/response topics
 *
 * Each batch is published as a JSON array to
 * `collector/{clientId}/events/?$rid={n}`. The collector answers on
 * `collector/{clientId}/res/{status}/?$rid={n}` with an optional JSON body
 * carrying updated tuning values:
 *
 *   {"maxTotalSize": 5242880, "maxBatchSize": 512000,
 *    "maxWait": 604800000, "minBatchInterval": 60000}
 *
 * send() blocks the calling worker until the matching response arrives, the
 * connection drops or the response timeout elapses. The last two are reported
 * as a transport failure (empty optional).
 */

#pragma once

#include "../IMqttClient.hpp"
#include "../ports/IEventTransport.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace uplink::adapters {

class MqttEventTransport : public ports::IEventTransport {
public:
    struct Options {
        std::string clientId;                                   ///< Used in both topics
        std::chrono::milliseconds responseTimeout{30000};       ///< Upper bound for one send
        int qos = 1;
    };
    
    /**
     * @param mqttClient Client used for publishing and receiving responses
     * @param options Topic identity and timeout
     * @throws std::invalid_argument if the client is null or the client id is empty
     */
    MqttEventTransport(std::shared_ptr<IMqttClient> mqttClient, Options options);
    ~MqttEventTransport() override;
    
    MqttEventTransport(const MqttEventTransport&) = delete;
    MqttEventTransport& operator=(const MqttEventTransport&) = delete;
    
    std::optional<ports::UploadResponse> send(const std::vector<std::string>& payloads) override;
    
    /**
     * @brief Subscribe to the response topic
     * @return true if the subscription was accepted
     * @note Called automatically whenever the client reports a connection
     */
    bool subscribeResponses();
    
    std::string eventsTopic(uint64_t requestId) const;
    std::string responseTopicPrefix() const;
    
    /// Status code embedded in a response topic, if the topic matches the prefix
    static std::optional<int> extractStatusCode(const std::string& topic, const std::string& prefix);
    
    /// Value of the `$rid` property, or empty
    static std::string extractRequestId(const std::string& topic);

private:
    void onMqttMessage(const MqttMessage& message);
    void onMqttConnection(bool connected, const std::string& reason);
    
    std::shared_ptr<IMqttClient> mqttClient_;
    Options options_;
    
    std::mutex responseMutex_;
    std::condition_variable responseCondition_;
    uint64_t nextRequestId_ = 0;
    uint64_t pendingRequestId_ = 0;                     ///< 0 when no send is waiting
    std::optional<ports::UploadResponse> response_;
    bool connectionLost_ = false;
};

} // namespace uplink::adapters
