#include <gtest/gtest.h>
#include "../core/Attributes.hpp"
#include "../core/Geo.hpp"
#include "../core/IClock.hpp"
#include "../core/JsonCodec.hpp"
#include "../core/sim/InMemoryStore.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fleetalert;

TEST(JsonCodecTest, PositionAcceptsIsoOrEpochAndKph) {
    auto position = JsonCodec::jsonToPosition(nlohmann::json::parse(R"({
        "deviceId": 4,
        "fixTime": "2024-03-10T10:00:00Z",
        "latitude": -23.5,
        "longitude": -46.6,
        "speedKph": 100,
        "geofenceIds": [1, 2],
        "attributes": {"odometer": 120500}
    })"));

    EXPECT_EQ(position.deviceId, 4);
    EXPECT_EQ(position.fixTime, *Iso8601::parse("2024-03-10T10:00:00Z"));
    EXPECT_NEAR(position.speed, Geo::knotsFromKph(100.0), 1e-9);
    EXPECT_EQ(position.geofenceIds, (std::vector<int64_t>{1, 2}));
    EXPECT_EQ(position.attributes["odometer"], 120500);

    auto epoch = JsonCodec::jsonToPosition(nlohmann::json::parse(R"({"deviceId": 4, "fixTime": 1700000000000, "speed": 12})"));
    EXPECT_EQ(epoch.fixTime, 1700000000000LL);
    EXPECT_DOUBLE_EQ(epoch.speed, 12.0);
}

TEST(JsonCodecTest, RejectsMalformedRecords) {
    EXPECT_THROW(JsonCodec::jsonToPosition(nlohmann::json::parse(R"({"deviceId": 4, "fixTime": "yesterday"})")),
                 std::invalid_argument);
    EXPECT_THROW(JsonCodec::jsonToPosition(nlohmann::json::parse(R"({"fixTime": 0})")),
                 nlohmann::json::exception);
    EXPECT_THROW(JsonCodec::stringToObjectType("group"), std::invalid_argument);
    EXPECT_THROW(JsonCodec::jsonToCalendar(nlohmann::json::parse(
                     R"({"id": 1, "periods": [{"start": 0, "end": 1, "recurrence": "monthly"}]})")),
                 std::invalid_argument);
}

TEST(JsonCodecTest, NotificatorsAsListOrCsv) {
    auto list = JsonCodec::jsonToNotification(nlohmann::json::parse(
        R"({"id": 1, "type": "alarm", "notificators": ["push", "mail"], "attributes": {"alarms": "sos"}})"));
    EXPECT_EQ(list.notificators, (std::vector<std::string>{"push", "mail"}));
    EXPECT_EQ(list.attributes["alarms"], "sos");

    auto csv = JsonCodec::jsonToNotification(nlohmann::json::parse(
        R"({"id": 2, "type": "alarm", "notificators": "push, sms", "always": true})"));
    EXPECT_EQ(csv.notificators, (std::vector<std::string>{"push", "sms"}));
    EXPECT_TRUE(csv.always);
}

TEST(Iso8601Test, RejectsImpossibleCalendarDays) {
    EXPECT_FALSE(Iso8601::parse("2024-02-31T00:00:00Z").has_value());
    EXPECT_FALSE(Iso8601::parse("2023-02-29").has_value());
    EXPECT_FALSE(Iso8601::parse("2024-04-31").has_value());
    EXPECT_FALSE(Iso8601::parse("1900-02-29").has_value());

    EXPECT_TRUE(Iso8601::parse("2024-02-29T12:00:00Z").has_value());
    EXPECT_TRUE(Iso8601::parse("2000-02-29").has_value());
    EXPECT_EQ(*Iso8601::parse("2024-01-31T00:00:00Z") + 86400000LL, *Iso8601::parse("2024-02-01T00:00:00Z"));
}

TEST(AttributesTest, BooleanTextIgnoresCaseAndNonAscii) {
    nlohmann::json attributes = {
        {"upper", "TRUE"},
        {"mixed", "False"},
        {"accented", "tr\xC3\xBC\xC3\xA9"},
        {"number", 1}
    };
    EXPECT_TRUE(Attributes::getBoolean(attributes, "upper"));
    EXPECT_FALSE(Attributes::getBoolean(attributes, "mixed", true));
    EXPECT_FALSE(Attributes::getBoolean(attributes, "accented"));
    EXPECT_TRUE(Attributes::getBoolean(attributes, "accented", true));
    EXPECT_TRUE(Attributes::getBoolean(attributes, "number"));
}

TEST(CalendarTest, RecurringPeriods) {
    int64_t start = *Iso8601::parse("2024-03-04T08:00:00Z");
    int64_t end = *Iso8601::parse("2024-03-04T18:00:00Z");

    Calendar calendar;
    calendar.periods.push_back({start, end, Recurrence::Daily});
    EXPECT_TRUE(calendar.checkMoment(*Iso8601::parse("2024-03-06T12:00:00Z")));
    EXPECT_FALSE(calendar.checkMoment(*Iso8601::parse("2024-03-06T19:00:00Z")));
    EXPECT_FALSE(calendar.checkMoment(*Iso8601::parse("2024-03-01T12:00:00Z")));

    Calendar weekly;
    weekly.periods.push_back({start, end, Recurrence::Weekly});
    EXPECT_TRUE(weekly.checkMoment(*Iso8601::parse("2024-03-11T09:00:00Z")));
    EXPECT_FALSE(weekly.checkMoment(*Iso8601::parse("2024-03-12T09:00:00Z")));

    Calendar once;
    once.periods.push_back({start, end, Recurrence::None});
    EXPECT_TRUE(once.checkMoment(start));
    EXPECT_FALSE(once.checkMoment(end));
}

TEST(InMemoryStoreTest, LoadsFixture) {
    sim::InMemoryStore store;
    store.loadFixture(nlohmann::json::parse(R"({
        "users": [{"id": 1, "name": "Ana", "attributes": {"timezone": "UTC"}}],
        "devices": [{"id": 10, "name": "Truck", "attributes": {"speedLimit": 45}}],
        "geofences": [{"id": 3, "name": "Depot"}],
        "notifications": [{"id": 100, "type": "deviceOverspeed", "notificators": "push"}],
        "permissions": [
            {"owner": "user", "ownerId": 1, "property": "device", "propertyId": 10},
            {"owner": "user", "ownerId": 1, "property": "notification", "propertyId": 100},
            {"owner": "device", "ownerId": 10, "property": "notification", "propertyId": 100}
        ],
        "positions": [
            {"deviceId": 10, "fixTime": "2024-03-10T10:05:00Z", "speed": 20},
            {"deviceId": 10, "fixTime": "2024-03-10T10:00:00Z", "speed": 10}
        ],
        "server": {"attributes": {"oilChange.intervalKm": 10000}}
    })"));

    EXPECT_EQ(store.getUser(1)->name, "Ana");
    EXPECT_EQ(store.getGeofence(3)->name, "Depot");
    EXPECT_EQ(store.getDeviceNotifications(10).size(), 1u);
    EXPECT_EQ(store.getNotificationUsers(100, 10).size(), 1u);
    EXPECT_EQ(*store.lookupDeviceAttribute(10, "speedLimit"), 45.0);
    EXPECT_EQ(*store.lookupDeviceAttribute(10, "oilChange.intervalKm"), 10000.0);
    EXPECT_FALSE(store.lookupDeviceAttribute(10, "tireRotation.intervalKm").has_value());

    auto positions = store.getPositions(10, 0, *Iso8601::parse("2024-03-11T00:00:00Z"));
    ASSERT_EQ(positions.size(), 2u);
    EXPECT_LT(positions[0].fixTime, positions[1].fixTime);
    EXPECT_NE(positions[0].id, positions[1].id);
}

TEST(InMemoryStoreTest, FailingWritesThrowStorageException) {
    sim::InMemoryStore store;
    User user;
    user.id = 1;
    store.addUser(user);
    store.setFailWrites(true);

    Event event;
    event.type = Event::TYPE_ALARM;
    EXPECT_THROW(store.addEvent(event), ports::StorageException);
    EXPECT_THROW(store.updateUserAttributes(user), ports::StorageException);

    store.setFailWrites(false);
    User stranger;
    stranger.id = 2;
    EXPECT_THROW(store.updateUserAttributes(stranger), ports::StorageException);
}
