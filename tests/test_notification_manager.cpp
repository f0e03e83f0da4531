#include <gtest/gtest.h>
#include "../core/domain/NotificationManager.hpp"
#include "../core/domain/PositionPipeline.hpp"
#include "../core/sim/InMemoryStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace fleetalert;

namespace {

constexpr int64_t kNow = 1700000000000LL;
constexpr int64_t kDeviceId = 10;

struct Delivery {
    int64_t notificationId;
    int64_t userId;
    std::string eventType;
};

class RecordingNotificator : public ports::INotificator {
public:
    void send(const Notification& notification, const User& user,
              const Event& event, const Position*) override {
        if (fail) {
            throw ports::DeliveryException("gateway unavailable");
        }
        deliveries.push_back({notification.id, user.id, event.type});
    }

    void send(const User& user, const ports::NotificationMessage& message) override {
        (void)user;
        (void)message;
    }

    bool fail = false;
    std::vector<Delivery> deliveries;
};

class RecordingForwarder : public ports::IEventForwarder {
public:
    void forward(const ports::EventData& data, ResultHandler handler) override {
        if (throws) {
            throw std::runtime_error("client not initialised");
        }
        forwarded.push_back(data);
        handler(!fail, fail ? "broker down" : "");
    }

    bool fail = false;
    bool throws = false;
    std::vector<ports::EventData> forwarded;
};

class ScriptedHandler : public domain::EventHandler {
public:
    explicit ScriptedHandler(std::string type, bool broken = false)
        : type_(std::move(type)), broken_(broken) {}

    void onPosition(const Position& position, const Callback& callback) override {
        ++calls;
        if (broken_) {
            throw std::runtime_error("evaluator bug");
        }
        callback(Event(type_, position));
    }

    void onDeviceRemoved(int64_t deviceId) override {
        removed.push_back(deviceId);
    }

    int calls = 0;
    std::vector<int64_t> removed;

private:
    std::string type_;
    bool broken_;
};

} // namespace

class NotificationManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>(kNow);
        store_ = std::make_shared<sim::InMemoryStore>();
        push_ = std::make_shared<RecordingNotificator>();
        mail_ = std::make_shared<RecordingNotificator>();
        forwarder_ = std::make_shared<RecordingForwarder>();
        registry_ = std::make_shared<ports::NotificatorRegistry>();
        registry_->add("push", push_);
        registry_->add("mail", mail_);

        Device device;
        device.id = kDeviceId;
        device.name = "Truck 10";
        store_->addDevice(device);

        addUser(1);
    }

    void addUser(int64_t userId, bool disabled = false) {
        User user;
        user.id = userId;
        user.name = "User " + std::to_string(userId);
        user.disabled = disabled;
        store_->addUser(user);
        store_->addPermission({ObjectType::User, userId, ObjectType::Device, kDeviceId});
    }

    /// Subscription linked to the device and owned by the user
    Notification subscribe(int64_t id, const std::string& type, std::vector<std::string> channels,
                           int64_t userId = 1) {
        Notification notification;
        notification.id = id;
        notification.type = type;
        notification.notificators = std::move(channels);
        store_->putNotification(notification);
        store_->addPermission({ObjectType::User, userId, ObjectType::Notification, id});
        store_->addPermission({ObjectType::Device, kDeviceId, ObjectType::Notification, id});
        return notification;
    }

    std::unique_ptr<domain::NotificationManager> makeManager(domain::NotificationConfig config = {}) {
        return std::make_unique<domain::NotificationManager>(store_, store_, registry_, clock_, config, forwarder_);
    }

    Event event(const std::string& type, int64_t eventTime = kNow) {
        Event e;
        e.type = type;
        e.deviceId = kDeviceId;
        e.eventTime = eventTime;
        return e;
    }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<sim::InMemoryStore> store_;
    std::shared_ptr<RecordingNotificator> push_;
    std::shared_ptr<RecordingNotificator> mail_;
    std::shared_ptr<RecordingForwarder> forwarder_;
    std::shared_ptr<ports::NotificatorRegistry> registry_;
};

TEST_F(NotificationManagerTest, PersistsForwardsAndDelivers) {
    subscribe(100, Event::TYPE_DEVICE_OVERSPEED, {"push", "mail"});
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED), nullptr), 2);

    auto stored = store_->events();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_GT(stored[0].id, 0);

    ASSERT_EQ(forwarder_->forwarded.size(), 1u);
    EXPECT_EQ(forwarder_->forwarded[0].event.id, stored[0].id);
    ASSERT_TRUE(forwarder_->forwarded[0].device.has_value());
    EXPECT_EQ(forwarder_->forwarded[0].device->name, "Truck 10");

    ASSERT_EQ(push_->deliveries.size(), 1u);
    EXPECT_EQ(push_->deliveries[0].userId, 1);
    EXPECT_EQ(mail_->deliveries.size(), 1u);
}

TEST_F(NotificationManagerTest, FailingChannelDoesNotBlockSiblings) {
    subscribe(100, Event::TYPE_GEOFENCE_ENTER, {"mail", "sms", "push"});
    mail_->fail = true;
    auto manager = makeManager();

    // "mail" throws, "sms" is not registered, "push" still delivers
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_GEOFENCE_ENTER), nullptr), 1);
    EXPECT_EQ(push_->deliveries.size(), 1u);
}

TEST_F(NotificationManagerTest, ForwardingFailureIsNotFatal) {
    subscribe(100, Event::TYPE_IGNITION_ON, {"push"});
    forwarder_->fail = true;
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_IGNITION_ON), nullptr), 1);
}

TEST_F(NotificationManagerTest, ThrowingForwarderDoesNotBlockDelivery) {
    subscribe(100, Event::TYPE_IGNITION_ON, {"push"});
    forwarder_->throws = true;
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_IGNITION_ON), nullptr), 1);
    EXPECT_EQ(store_->events().size(), 1u);
    EXPECT_EQ(push_->deliveries.size(), 1u);
}

TEST_F(NotificationManagerTest, StaleEventIsStoredButNotDelivered) {
    subscribe(100, Event::TYPE_DEVICE_OVERSPEED, {"push"});
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED, kNow - 16 * 60 * 1000), nullptr), 0);
    EXPECT_EQ(store_->events().size(), 1u);
    EXPECT_EQ(forwarder_->forwarded.size(), 1u);
    EXPECT_TRUE(push_->deliveries.empty());

    // Exactly at the threshold still counts as fresh
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED, kNow - 15 * 60 * 1000), nullptr), 1);
}

TEST_F(NotificationManagerTest, StorageFailureAbandonsEvent) {
    subscribe(100, Event::TYPE_DEVICE_OVERSPEED, {"push"});
    store_->setFailWrites(true);
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED), nullptr), 0);
    EXPECT_TRUE(forwarder_->forwarded.empty());
    EXPECT_TRUE(push_->deliveries.empty());
}

TEST_F(NotificationManagerTest, TypeAliases) {
    EXPECT_TRUE(domain::NotificationManager::matchesType("overspeed", Event::TYPE_DEVICE_OVERSPEED));
    EXPECT_TRUE(domain::NotificationManager::matchesType("maintenance", Event::TYPE_OIL_CHANGE_DUE));
    EXPECT_TRUE(domain::NotificationManager::matchesType("maintenance", Event::TYPE_OIL_CHANGE_SOON));
    EXPECT_TRUE(domain::NotificationManager::matchesType("maintenance", Event::TYPE_TIRE_ROTATION_SOON));
    EXPECT_TRUE(domain::NotificationManager::matchesType("maintenance", Event::TYPE_TIRE_ROTATION_DUE));
    EXPECT_FALSE(domain::NotificationManager::matchesType("maintenance", Event::TYPE_DEVICE_OVERSPEED));
    EXPECT_FALSE(domain::NotificationManager::matchesType("overspeed", Event::TYPE_GEOFENCE_ENTER));
    EXPECT_FALSE(domain::NotificationManager::matchesType(Event::TYPE_GEOFENCE_EXIT, Event::TYPE_GEOFENCE_ENTER));

    subscribe(100, "overspeed", {"push"});
    subscribe(101, "maintenance", {"push"});
    auto manager = makeManager();
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED), nullptr), 1);
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_TIRE_ROTATION_DUE), nullptr), 1);
    ASSERT_EQ(push_->deliveries.size(), 2u);
    EXPECT_EQ(push_->deliveries[0].notificationId, 100);
    EXPECT_EQ(push_->deliveries[1].notificationId, 101);
}

TEST_F(NotificationManagerTest, AlarmAllowList) {
    auto sos = subscribe(100, Event::TYPE_ALARM, {"push"});
    Notification updated = sos;
    updated.attributes["alarms"] = "sos,powerCut";
    store_->putNotification(updated);
    auto manager = makeManager();

    auto alarm = event(Event::TYPE_ALARM);
    alarm.attributes["alarm"] = "powerCut";
    EXPECT_EQ(manager->updateEvent(alarm, nullptr), 1);

    alarm.attributes["alarm"] = "vibration";
    EXPECT_EQ(manager->updateEvent(alarm, nullptr), 0);

    Event bare = event(Event::TYPE_ALARM);
    EXPECT_FALSE(domain::NotificationManager::matchesAlarm(sos, bare));
}

TEST_F(NotificationManagerTest, CalendarScopesDelivery) {
    Calendar calendar;
    calendar.id = 5;
    calendar.periods.push_back({kNow - 60000, kNow + 60000, Recurrence::None});
    store_->addCalendar(calendar);

    Notification scoped = subscribe(100, Event::TYPE_GEOFENCE_EXIT, {"push"});
    scoped.calendarId = 5;
    store_->putNotification(scoped);
    auto manager = makeManager();

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_GEOFENCE_EXIT, kNow), nullptr), 1);

    clock_->setCurrentTime(kNow + 120000);
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_GEOFENCE_EXIT, kNow + 120000), nullptr), 0);
}

TEST_F(NotificationManagerTest, BlockedAndDisabledUsersAreSkipped) {
    addUser(2);
    addUser(3, true);
    subscribe(100, Event::TYPE_DEVICE_OVERSPEED, {"push"}, 1);
    store_->addPermission({ObjectType::User, 2, ObjectType::Notification, 100});
    store_->addPermission({ObjectType::User, 3, ObjectType::Notification, 100});

    domain::NotificationConfig config;
    config.blockedUsers = {1};
    auto manager = makeManager(config);

    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_DEVICE_OVERSPEED), nullptr), 1);
    ASSERT_EQ(push_->deliveries.size(), 1u);
    EXPECT_EQ(push_->deliveries[0].userId, 2);
}

TEST_F(NotificationManagerTest, AlwaysSubscriptionReachesDeviceViewers) {
    Notification always;
    always.id = 200;
    always.type = Event::TYPE_IGNITION_OFF;
    always.always = true;
    always.notificators = {"push"};
    store_->putNotification(always);
    store_->addPermission({ObjectType::User, 1, ObjectType::Notification, 200});

    auto manager = makeManager();
    EXPECT_EQ(manager->updateEvent(event(Event::TYPE_IGNITION_OFF), nullptr), 1);
}

TEST_F(NotificationManagerTest, PipelineDeliversEventsFromWorkingHandlers) {
    subscribe(100, Event::TYPE_IGNITION_ON, {"push"});
    auto manager = std::shared_ptr<domain::NotificationManager>(makeManager());
    domain::PositionPipeline pipeline(store_, manager);

    auto broken = std::make_shared<ScriptedHandler>(Event::TYPE_GEOFENCE_ENTER, true);
    auto ignition = std::make_shared<ScriptedHandler>(Event::TYPE_IGNITION_ON);
    pipeline.addHandler(broken);
    pipeline.addHandler(ignition);

    Position position;
    position.id = 1;
    position.deviceId = kDeviceId;
    position.fixTime = kNow;

    auto events = pipeline.process(position);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, Event::TYPE_IGNITION_ON);
    EXPECT_EQ(broken->calls, 1);
    EXPECT_EQ(ignition->calls, 1);

    EXPECT_EQ(store_->events().size(), 1u);
    ASSERT_EQ(push_->deliveries.size(), 1u);
    EXPECT_EQ(push_->deliveries[0].eventType, Event::TYPE_IGNITION_ON);

    auto last = store_->getLastPosition(kDeviceId);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->id, 1);
}

TEST_F(NotificationManagerTest, PipelineDeliversEveryEventWhenForwarderThrows) {
    subscribe(100, Event::TYPE_IGNITION_ON, {"push"});
    subscribe(101, Event::TYPE_GEOFENCE_ENTER, {"push"});
    forwarder_->throws = true;
    auto manager = std::shared_ptr<domain::NotificationManager>(makeManager());
    domain::PositionPipeline pipeline(store_, manager);
    pipeline.addHandler(std::make_shared<ScriptedHandler>(Event::TYPE_IGNITION_ON));
    pipeline.addHandler(std::make_shared<ScriptedHandler>(Event::TYPE_GEOFENCE_ENTER));

    Position position;
    position.id = 1;
    position.deviceId = kDeviceId;
    position.fixTime = kNow;

    std::vector<Event> events;
    EXPECT_NO_THROW(events = pipeline.process(position));
    EXPECT_EQ(events.size(), 2u);
    EXPECT_EQ(store_->events().size(), 2u);
    EXPECT_EQ(push_->deliveries.size(), 2u);
}

TEST_F(NotificationManagerTest, PipelineKeepsNewestFixAsLatest) {
    domain::PositionPipeline pipeline(store_, nullptr);

    Position newer;
    newer.id = 2;
    newer.deviceId = kDeviceId;
    newer.fixTime = kNow;
    pipeline.process(newer);

    Position older = newer;
    older.id = 1;
    older.fixTime = kNow - 5000;
    pipeline.process(older);

    EXPECT_EQ(store_->getLastPosition(kDeviceId)->id, 2);
}

TEST_F(NotificationManagerTest, PipelinePropagatesDeviceRemoval) {
    domain::PositionPipeline pipeline(store_, nullptr);
    auto first = std::make_shared<ScriptedHandler>(Event::TYPE_IGNITION_ON);
    auto second = std::make_shared<ScriptedHandler>(Event::TYPE_IGNITION_OFF);
    pipeline.addHandler(first);
    pipeline.addHandler(second);

    pipeline.onDeviceRemoved(kDeviceId);
    EXPECT_EQ(first->removed, std::vector<int64_t>{kDeviceId});
    EXPECT_EQ(second->removed, std::vector<int64_t>{kDeviceId});
}
