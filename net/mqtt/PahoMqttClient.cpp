#include "PahoMqttClient.hpp"
#include <iostream>

namespace uplink {

PahoMqttClient::PahoMqttClient() = default;

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    destroyClient();
}

bool PahoMqttClient::connect(const MqttConnectOptions& requested) {
    destroyClient();
    
    // Paho keeps pointers into these strings for reconnect attempts
    options_ = requested;
    const MqttConnectOptions& options = options_;
    
    const std::string scheme = options.useTls ? "ssl://" : "tcp://";
    const std::string serverURI = scheme + options.host + ":" + std::to_string(options.port);
    
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << options.clientId << std::endl;
    
    int rc = MQTTAsync_create(&client_, serverURI.c_str(), options.clientId.c_str(),
                              MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        client_ = nullptr;
        return false;
    }
    
    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);
    
    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_SSLOptions ssl_opts = MQTTAsync_SSLOptions_initializer;
    
    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    
    if (!options.username.empty()) {
        conn_opts.username = options.username.c_str();
    }
    if (!options.password.empty()) {
        conn_opts.password = options.password.c_str();
    }
    
    if (options.useTls) {
        if (!options.caPath.empty()) {
            ssl_opts.trustStore = options.caPath.c_str();
        }
        ssl_opts.enableServerCertAuth = options.verifyServer ? 1 : 0;
        ssl_opts.verify = options.verifyServer ? 1 : 0;
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
        
        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (!client_ || !connected_) {
        return false;
    }
    
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    
    pubmsg.payload = const_cast<void*>(static_cast<const void*>(payload.data()));
    pubmsg.payloadlen = static_cast<int>(payload.size());
    pubmsg.qos = qos;
    pubmsg.retained = retained ? 1 : 0;
    
    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

bool PahoMqttClient::subscribe(const std::string& topic, int qos) {
    if (!client_ || !connected_) {
        return false;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_subscribe(client_, topic.c_str(), qos, &opts) == MQTTASYNC_SUCCESS;
}

bool PahoMqttClient::unsubscribe(const std::string& topic) {
    if (!client_ || !connected_) {
        return false;
    }
    
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    return MQTTAsync_unsubscribe(client_, topic.c_str(), &opts) == MQTTASYNC_SUCCESS;
}

void PahoMqttClient::setMessageCallback(MessageCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    messageCallback_ = std::move(callback);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    connectionCallback_ = std::move(callback);
}

void PahoMqttClient::destroyClient() {
    if (client_) {
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
    }
}

void PahoMqttClient::notifyConnection(bool connected, const std::string& reason) {
    ConnectionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = connectionCallback_;
    }
    if (callback) {
        callback(connected, reason);
    }
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* client = static_cast<PahoMqttClient*>(context);
    
    MqttMessage msg;
    msg.topic = topicLen > 0 ? std::string(topicName, static_cast<std::size_t>(topicLen))
                             : std::string(topicName);
    msg.payload = std::string(static_cast<char*>(message->payload),
                              static_cast<std::size_t>(message->payloadlen));
    msg.qos = message->qos;
    msg.retained = message->retained != 0;
    
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    
    MessageCallback callback;
    {
        std::lock_guard<std::mutex> lock(client->callbackMutex_);
        callback = client->messageCallback_;
    }
    if (callback) {
        callback(msg);
    }
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = true;
    std::cout << "[MQTT] Connected" << std::endl;
    client->notifyConnection(true, "Connected successfully");
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
    client->notifyConnection(false, reason);
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
    
    std::string reason = cause ? std::string(cause) : "Connection lost";
    std::cerr << "[MQTT] " << reason << std::endl;
    client->notifyConnection(false, reason);
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;
    
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

} // namespace uplink
