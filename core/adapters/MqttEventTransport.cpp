#include "MqttEventTransport.hpp"
#include "../JsonCodec.hpp"
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace uplink::adapters {

MqttEventTransport::MqttEventTransport(std::shared_ptr<IMqttClient> mqttClient, Options options)
    : mqttClient_(std::move(mqttClient)), options_(std::move(options)) {
    if (!mqttClient_) {
        throw std::invalid_argument("MqttEventTransport: MQTT client cannot be null");
    }
    if (options_.clientId.empty()) {
        throw std::invalid_argument("MqttEventTransport: client id cannot be empty");
    }
    
    mqttClient_->setMessageCallback([this](const MqttMessage& msg) {
        onMqttMessage(msg);
    });
    
    mqttClient_->setConnectionCallback([this](bool connected, const std::string& reason) {
        onMqttConnection(connected, reason);
    });
}

MqttEventTransport::~MqttEventTransport() {
    mqttClient_->setMessageCallback(nullptr);
    mqttClient_->setConnectionCallback(nullptr);
}

std::optional<ports::UploadResponse> MqttEventTransport::send(const std::vector<std::string>& payloads) {
    if (!mqttClient_->isConnected()) {
        std::cerr << "[MQTT] Cannot send batch - not connected to collector" << std::endl;
        return std::nullopt;
    }
    
    uint64_t requestId;
    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        requestId = ++nextRequestId_;
        pendingRequestId_ = requestId;
        response_.reset();
        connectionLost_ = false;
    }
    
    const std::string topic = eventsTopic(requestId);
    if (!mqttClient_->publish(topic, JsonCodec::encodeBatch(payloads), options_.qos, false)) {
        std::lock_guard<std::mutex> lock(responseMutex_);
        pendingRequestId_ = 0;
        return std::nullopt;
    }
    
    std::unique_lock<std::mutex> lock(responseMutex_);
    bool answered = responseCondition_.wait_for(lock, options_.responseTimeout, [this]() {
        return response_.has_value() || connectionLost_;
    });
    
    pendingRequestId_ = 0;
    
    if (!answered) {
        std::cerr << "[MQTT] No collector response for request " << requestId << " within "
                  << options_.responseTimeout.count() << " ms" << std::endl;
        return std::nullopt;
    }
    if (!response_) {
        std::cerr << "[MQTT] Connection lost while waiting for request " << requestId << std::endl;
        return std::nullopt;
    }
    
    auto response = std::move(response_);
    response_.reset();
    return response;
}

bool MqttEventTransport::subscribeResponses() {
    const std::string filter = responseTopicPrefix() + "#";
    if (!mqttClient_->subscribe(filter, options_.qos)) {
        std::cerr << "[MQTT] Failed to subscribe to collector responses: " << filter << std::endl;
        return false;
    }
    
    std::cout << "[MQTT] Subscribed to " << filter << std::endl;
    return true;
}

std::string MqttEventTransport::eventsTopic(uint64_t requestId) const {
    return "collector/" + options_.clientId + "/events/?$rid=" + std::to_string(requestId);
}

std::string MqttEventTransport::responseTopicPrefix() const {
    return "collector/" + options_.clientId + "/res/";
}

std::optional<int> MqttEventTransport::extractStatusCode(const std::string& topic, const std::string& prefix) {
    if (topic.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    
    std::size_t start = prefix.size();
    std::size_t end = start;
    while (end < topic.size() && std::isdigit(static_cast<unsigned char>(topic[end]))) {
        ++end;
    }
    
    if (end == start || end - start > 3) {
        return std::nullopt;
    }
    return std::stoi(topic.substr(start, end - start));
}

std::string MqttEventTransport::extractRequestId(const std::string& topic) {
    const std::string marker = "$rid=";
    std::size_t pos = topic.find(marker);
    if (pos == std::string::npos) {
        return {};
    }
    
    pos += marker.size();
    std::size_t end = topic.find('&', pos);
    return topic.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
}

void MqttEventTransport::onMqttMessage(const MqttMessage& message) {
    auto status = extractStatusCode(message.topic, responseTopicPrefix());
    if (!status) {
        return;
    }
    
    const std::string requestId = extractRequestId(message.topic);
    
    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        // Late answers to requests that already timed out are ignored
        if (pendingRequestId_ == 0 || requestId != std::to_string(pendingRequestId_)) {
            std::cout << "[MQTT] Ignoring stale collector response (rid=" << requestId << ")" << std::endl;
            return;
        }
        response_ = JsonCodec::decodeResponse(*status, message.payload);
    }
    responseCondition_.notify_all();
}

void MqttEventTransport::onMqttConnection(bool connected, const std::string& reason) {
    if (connected) {
        subscribeResponses();
        return;
    }
    
    std::cerr << "[MQTT] Collector connection down: " << reason << std::endl;
    {
        std::lock_guard<std::mutex> lock(responseMutex_);
        connectionLost_ = true;
    }
    responseCondition_.notify_all();
}

} // namespace uplink::adapters
