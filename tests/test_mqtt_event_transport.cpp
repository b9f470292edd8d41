#include <gtest/gtest.h>
#include "../core/adapters/MqttEventTransport.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace uplink;
using namespace std::chrono_literals;

namespace {

// In-process broker stand-in; replies run synchronously inside publish()
class FakeMqttClient : public IMqttClient {
public:
    using Responder = std::function<void(FakeMqttClient&, const MqttMessage&)>;

    bool connect(const MqttConnectOptions&) override {
        connected = true;
        if (connectionCallback_) connectionCallback_(true, "connected");
        return true;
    }

    void disconnect() override { connected = false; }
    bool isConnected() const override { return connected; }

    bool publish(const std::string& topic, const std::string& payload, int qos, bool retained) override {
        if (!acceptPublish) {
            return false;
        }
        MqttMessage message{topic, payload, qos, retained};
        published.push_back(message);
        if (responder) {
            responder(*this, message);
        }
        return true;
    }

    bool subscribe(const std::string& topic, int) override {
        subscriptions.push_back(topic);
        return true;
    }

    bool unsubscribe(const std::string&) override { return true; }

    void setMessageCallback(MessageCallback callback) override { messageCallback_ = std::move(callback); }
    void setConnectionCallback(ConnectionCallback callback) override { connectionCallback_ = std::move(callback); }

    void deliver(const std::string& topic, const std::string& payload) {
        if (messageCallback_) messageCallback_(MqttMessage{topic, payload, 1, false});
    }

    void dropConnection() {
        connected = false;
        if (connectionCallback_) connectionCallback_(false, "network lost");
    }

    bool connected = false;
    bool acceptPublish = true;
    Responder responder;
    std::vector<MqttMessage> published;
    std::vector<std::string> subscriptions;

private:
    MessageCallback messageCallback_;
    ConnectionCallback connectionCallback_;
};

// Answers every publish on the matching response topic
FakeMqttClient::Responder replyWith(int status, const std::string& body, int ridOffset = 0) {
    return [=](FakeMqttClient& client, const MqttMessage& request) {
        std::string rid = adapters::MqttEventTransport::extractRequestId(request.topic);
        std::string replyRid = std::to_string(std::stoull(rid) + ridOffset);
        client.deliver("collector/device-01/res/" + std::to_string(status) + "/?$rid=" + replyRid, body);
    };
}

} // namespace

class MqttEventTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        client_ = std::make_shared<FakeMqttClient>();
        adapters::MqttEventTransport::Options options;
        options.clientId = "device-01";
        options.responseTimeout = 50ms;
        transport_ = std::make_unique<adapters::MqttEventTransport>(client_, options);
        client_->connect(MqttConnectOptions{});
    }

    std::shared_ptr<FakeMqttClient> client_;
    std::unique_ptr<adapters::MqttEventTransport> transport_;
};

TEST_F(MqttEventTransportTest, SubscribesToResponsesOnConnect) {
    ASSERT_EQ(client_->subscriptions.size(), 1u);
    EXPECT_EQ(client_->subscriptions[0], "collector/device-01/res/#");
}

TEST_F(MqttEventTransportTest, PublishesBatchAndReturnsCollectorAnswer) {
    client_->responder = replyWith(200, "{\"maxBatchSize\":1024,\"minBatchInterval\":30000}");

    auto response = transport_->send({"{\"speed\":42}", "raw"});

    ASSERT_TRUE(response.has_value());
    EXPECT_TRUE(response->isSuccess());
    EXPECT_EQ(response->maxBatchSize.value_or(-1), 1024);
    EXPECT_EQ(response->minBatchInterval.value_or(-1), 30000);
    EXPECT_FALSE(response->maxWait.has_value());

    ASSERT_EQ(client_->published.size(), 1u);
    EXPECT_EQ(client_->published[0].topic, "collector/device-01/events/?$rid=1");
    EXPECT_EQ(client_->published[0].qos, 1);
    auto body = nlohmann::json::parse(client_->published[0].payload);
    ASSERT_TRUE(body.is_array());
    EXPECT_EQ(body[0]["speed"], 42);
    EXPECT_EQ(body[1], "raw");
}

TEST_F(MqttEventTransportTest, RejectionStatusIsReturned) {
    client_->responder = replyWith(429, "");

    auto response = transport_->send({"{}"});

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->statusCode, 429);
    EXPECT_FALSE(response->isSuccess());
}

TEST_F(MqttEventTransportTest, RequestIdsIncrease) {
    client_->responder = replyWith(200, "");

    transport_->send({"{}"});
    transport_->send({"{}"});

    ASSERT_EQ(client_->published.size(), 2u);
    EXPECT_EQ(client_->published[1].topic, "collector/device-01/events/?$rid=2");
}

TEST_F(MqttEventTransportTest, DisconnectedClientFailsWithoutPublishing) {
    client_->connected = false;

    EXPECT_FALSE(transport_->send({"{}"}).has_value());
    EXPECT_TRUE(client_->published.empty());
}

TEST_F(MqttEventTransportTest, RejectedPublishFails) {
    client_->acceptPublish = false;

    EXPECT_FALSE(transport_->send({"{}"}).has_value());
}

TEST_F(MqttEventTransportTest, MissingResponseTimesOut) {
    EXPECT_FALSE(transport_->send({"{}"}).has_value());
}

TEST_F(MqttEventTransportTest, ResponseForOtherRequestIsIgnored) {
    client_->responder = replyWith(200, "", 100);

    EXPECT_FALSE(transport_->send({"{}"}).has_value());
}

TEST_F(MqttEventTransportTest, ConnectionLossEndsWait) {
    client_->responder = [](FakeMqttClient& client, const MqttMessage&) { client.dropConnection(); };

    EXPECT_FALSE(transport_->send({"{}"}).has_value());
}

TEST(MqttEventTransportTopics, ExtractStatusCode) {
    const std::string prefix = "collector/d/res/";
    EXPECT_EQ(adapters::MqttEventTransport::extractStatusCode("collector/d/res/200/?$rid=7", prefix).value_or(-1), 200);
    EXPECT_EQ(adapters::MqttEventTransport::extractStatusCode("collector/d/res/503/", prefix).value_or(-1), 503);
    EXPECT_FALSE(adapters::MqttEventTransport::extractStatusCode("collector/x/res/200/", prefix).has_value());
    EXPECT_FALSE(adapters::MqttEventTransport::extractStatusCode("collector/d/res/abc/", prefix).has_value());
    EXPECT_FALSE(adapters::MqttEventTransport::extractStatusCode("collector/d/res/2000/", prefix).has_value());
}

TEST(MqttEventTransportTopics, ExtractRequestId) {
    EXPECT_EQ(adapters::MqttEventTransport::extractRequestId("a/b/?$rid=42"), "42");
    EXPECT_EQ(adapters::MqttEventTransport::extractRequestId("a/b/?$rid=42&x=1"), "42");
    EXPECT_EQ(adapters::MqttEventTransport::extractRequestId("a/b/"), "");
}

TEST(MqttEventTransportConstruction, InvalidArgumentsThrow) {
    adapters::MqttEventTransport::Options options;
    options.clientId = "device-01";
    EXPECT_THROW(adapters::MqttEventTransport(nullptr, options), std::invalid_argument);

    options.clientId.clear();
    EXPECT_THROW(adapters::MqttEventTransport(std::make_shared<FakeMqttClient>(), options),
                 std::invalid_argument);
}
