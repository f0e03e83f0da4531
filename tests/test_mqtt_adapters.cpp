#include <gtest/gtest.h>
#include "../core/adapters/EventMessages.hpp"
#include "../core/adapters/MqttEventForwarder.hpp"
#include "../core/adapters/MqttPushNotificator.hpp"
#include "../core/sim/InMemoryStore.hpp"
#include "../core/sim/MockMqttClient.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace fleetalert;

class MqttAdaptersTest : public ::testing::Test {
protected:
    void SetUp() override {
        mqtt_ = std::make_shared<sim::MockMqttClient>();
        store_ = std::make_shared<sim::InMemoryStore>();

        Device device;
        device.id = 42;
        device.name = "Truck 42";
        store_->addDevice(device);

        Geofence depot;
        depot.id = 3;
        depot.name = "Depot";
        store_->addGeofence(depot);

        user_.id = 7;
        user_.name = "Ana";
    }

    Event overspeedEvent() {
        Event event;
        event.id = 99;
        event.type = Event::TYPE_DEVICE_OVERSPEED;
        event.deviceId = 42;
        event.geofenceId = 3;
        event.eventTime = 1700000000000LL;
        event.attributes["speed"] = 54.0;
        event.attributes["speedLimit"] = 43.2;
        return event;
    }

    std::shared_ptr<sim::MockMqttClient> mqtt_;
    std::shared_ptr<sim::InMemoryStore> store_;
    User user_;
};

TEST_F(MqttAdaptersTest, ForwarderPublishesEventWithContext) {
    mqtt_->setConnected(true);
    adapters::MqttEventForwarder forwarder(mqtt_, "fleetalert/events/");
    EXPECT_EQ(forwarder.topicFor(42), "fleetalert/events/42");

    ports::EventData data;
    data.event = overspeedEvent();
    data.device = store_->getDevice(42);
    data.geofence = store_->getGeofence(3);
    Position position;
    position.id = 5;
    position.deviceId = 42;
    position.fixTime = data.event.eventTime;
    position.latitude = -23.5;
    data.position = position;

    bool reported = false;
    bool success = false;
    forwarder.forward(data, [&](bool delivered, const std::string&) {
        reported = true;
        success = delivered;
    });
    EXPECT_TRUE(reported);
    EXPECT_TRUE(success);

    auto published = mqtt_->publishedMessages();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].topic, "fleetalert/events/42");
    EXPECT_EQ(published[0].qos, 1);

    auto payload = nlohmann::json::parse(published[0].payload);
    EXPECT_EQ(payload["event"]["id"], 99);
    EXPECT_EQ(payload["event"]["type"], Event::TYPE_DEVICE_OVERSPEED);
    EXPECT_EQ(payload["event"]["eventTime"], "2023-11-14T22:13:20.000Z");
    EXPECT_EQ(payload["device"]["name"], "Truck 42");
    EXPECT_EQ(payload["geofence"]["name"], "Depot");
    EXPECT_EQ(payload["position"]["id"], 5);
}

TEST_F(MqttAdaptersTest, ForwarderReportsFailureWhenOffline) {
    adapters::MqttEventForwarder forwarder(mqtt_, "fleetalert/events", 0);

    ports::EventData data;
    data.event = overspeedEvent();

    std::string failure;
    forwarder.forward(data, [&](bool delivered, const std::string& error) {
        if (!delivered) {
            failure = error;
        }
    });
    EXPECT_FALSE(failure.empty());
    EXPECT_TRUE(mqtt_->publishedMessages().empty());
}

TEST_F(MqttAdaptersTest, PushPublishesRenderedMessage) {
    mqtt_->setConnected(true);
    adapters::MqttPushNotificator push(mqtt_, store_, "fleetalert/users");

    Notification notification;
    notification.id = 11;
    notification.type = Event::TYPE_DEVICE_OVERSPEED;
    push.send(notification, user_, overspeedEvent(), nullptr);

    auto published = mqtt_->publishedMessages();
    ASSERT_EQ(published.size(), 1u);
    EXPECT_EQ(published[0].topic, "fleetalert/users/7");

    auto payload = nlohmann::json::parse(published[0].payload);
    EXPECT_EQ(payload["userId"], 7);
    EXPECT_EQ(payload["subject"], "Truck 42: Speed limit exceeded");
    EXPECT_EQ(payload["body"], "Speed limit exceeded (Depot): 100 km/h, limit 80 km/h at 2023-11-14T22:13:20.000Z");
    EXPECT_TRUE(payload["priority"].get<bool>());
    EXPECT_EQ(payload["data"]["eventId"], "99");
    EXPECT_EQ(payload["data"]["notificationId"], "11");
}

TEST_F(MqttAdaptersTest, PushFailsWhileDisconnected) {
    adapters::MqttPushNotificator push(mqtt_, store_, "fleetalert/users");
    ports::NotificationMessage message;
    message.subject = "Yesterday's summary";

    EXPECT_THROW(push.send(user_, message), ports::DeliveryException);

    mqtt_->setConnected(true);
    mqtt_->setFailPublish(true);
    EXPECT_THROW(push.send(user_, message), ports::DeliveryException);

    mqtt_->setFailPublish(false);
    EXPECT_NO_THROW(push.send(user_, message));
    EXPECT_EQ(mqtt_->publishedMessages().size(), 1u);
}

TEST_F(MqttAdaptersTest, MockClientReportsConnectionChanges) {
    std::vector<bool> states;
    mqtt_->setConnectionCallback([&](bool connected, const std::string&) { states.push_back(connected); });

    MqttConnectOptions options;
    options.host = "broker.example.com";
    options.clientId = "fleetalert-test";
    EXPECT_TRUE(mqtt_->connect(options));
    EXPECT_TRUE(mqtt_->isConnected());
    EXPECT_EQ(mqtt_->lastOptions().host, "broker.example.com");

    mqtt_->disconnect();
    EXPECT_FALSE(mqtt_->isConnected());
    EXPECT_EQ(states, (std::vector<bool>{true, false}));
}

TEST(EventMessagesTest, TitlesAndDetails) {
    Event radar;
    radar.type = Event::TYPE_DEVICE_OVERSPEED;
    radar.attributes["radarId"] = 5;
    EXPECT_EQ(adapters::EventMessages::title(radar), "Radar speed limit exceeded");

    Event custom;
    custom.type = "commandResult";
    EXPECT_EQ(adapters::EventMessages::title(custom), "commandResult");

    Notification notification;
    Event alarm;
    alarm.type = Event::TYPE_ALARM;
    alarm.deviceId = 8;
    alarm.attributes["alarm"] = "sos";
    auto message = adapters::EventMessages::render(notification, alarm, std::nullopt, std::nullopt, nullptr);
    EXPECT_EQ(message.subject, "Device 8: Alarm");
    EXPECT_EQ(message.body.rfind("Alarm: sos at ", 0), 0u);
    EXPECT_TRUE(message.priority);
    EXPECT_EQ(message.data.count("latitude"), 0u);

    Event oil;
    oil.type = Event::TYPE_OIL_CHANGE_DUE;
    oil.attributes["maintenanceName"] = "Oil change";
    Position position;
    position.latitude = 1.5;
    auto oilMessage = adapters::EventMessages::render(notification, oil, std::nullopt, std::nullopt, &position);
    EXPECT_EQ(oilMessage.body.rfind("Oil change due: Oil change at ", 0), 0u);
    EXPECT_FALSE(oilMessage.priority);
    EXPECT_EQ(oilMessage.data.count("latitude"), 1u);
}
