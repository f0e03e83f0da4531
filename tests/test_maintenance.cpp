#include <gtest/gtest.h>
#include "../core/IClock.hpp"
#include "../core/domain/MaintenanceConfig.hpp"
#include "../core/domain/OilChangeEvaluator.hpp"
#include "../core/domain/TireRotationEvaluator.hpp"
#include "../core/sim/InMemoryStore.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace fleetalert;

namespace {

constexpr int64_t kDeviceId = 3;
constexpr int64_t kHourMillis = 60LL * 60 * 1000;

int64_t at(const std::string& iso) {
    return Iso8601::parse(iso).value();
}

} // namespace

class OilChangeTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<sim::InMemoryStore>();
        evaluator_ = std::make_unique<domain::OilChangeEvaluator>(store_, true);
    }

    void configure(nlohmann::json oil) {
        Device device;
        device.id = kDeviceId;
        device.name = "Van";
        device.attributes["maintenance"]["oil"] = std::move(oil);
        store_->addDevice(device);
    }

    Position position(int64_t fixTime, std::optional<double> odometerKm) {
        Position p;
        p.id = ++nextId_;
        p.deviceId = kDeviceId;
        p.fixTime = fixTime;
        if (odometerKm) {
            p.attributes["odometer"] = *odometerKm * 1000.0;
        }
        return p;
    }

    /// Records `previous` as the latest fix, then evaluates `current`
    std::vector<Event> step(const Position& previous, const Position& current) {
        store_->updatePosition(previous);
        std::vector<Event> events;
        evaluator_->onPosition(current, [&](Event event) { events.push_back(std::move(event)); });
        return events;
    }

    std::shared_ptr<sim::InMemoryStore> store_;
    std::unique_ptr<domain::OilChangeEvaluator> evaluator_;
    int64_t nextId_ = 0;
};

TEST_F(OilChangeTest, OdometerCrossingDueRaisesDueWithKmReason) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000}});
    int64_t t = at("2024-03-10T12:00:00Z");

    auto events = step(position(t, 10999.0), position(t + 60000, 11001.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, Event::TYPE_OIL_CHANGE_DUE);
    EXPECT_EQ(events[0].attributes["oilReason"].get<std::string>(), "km");
    EXPECT_EQ(events[0].attributes["oilDueKm"].get<int64_t>(), 11000);
    EXPECT_EQ(events[0].attributes["oilCurrentKm"].get<int64_t>(), 11001);
    EXPECT_EQ(events[0].attributes["oilKmRemaining"].get<int64_t>(), -1);
    EXPECT_EQ(events[0].attributes["maintenanceName"].get<std::string>(), "Oil change");
}

TEST_F(OilChangeTest, ApproachingDueRaisesSoon) {
    configure({{"lastServiceOdometer", "1000"}, {"intervalKm", "10000"}});
    int64_t t = at("2024-03-10T12:00:00Z");

    auto events = step(position(t, 10940.0), position(t + 60000, 10960.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, Event::TYPE_OIL_CHANGE_SOON);
    EXPECT_EQ(events[0].attributes["oilKmRemaining"].get<int64_t>(), 40);
}

TEST_F(OilChangeTest, StayingPastThresholdRaisesNothing) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000}});
    int64_t t = at("2024-03-10T12:00:00Z");

    EXPECT_TRUE(step(position(t, 11005.0), position(t + 60000, 11010.0)).empty());
    EXPECT_TRUE(step(position(t, 10000.0), position(t + 60000, 10100.0)).empty());
}

TEST_F(OilChangeTest, CalendarCrossingRaisesDueWithDateReason) {
    configure({{"lastServiceDate", "2024-01-15T00:00:00Z"}, {"intervalMonths", 6}});
    int64_t due = at("2024-07-15T00:00:00Z");

    auto events = step(position(due - kHourMillis, std::nullopt), position(due + kHourMillis, std::nullopt));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, Event::TYPE_OIL_CHANGE_DUE);
    EXPECT_EQ(events[0].attributes["oilReason"].get<std::string>(), "date");
    EXPECT_EQ(events[0].attributes["oilDueDate"].get<std::string>(), Iso8601::format(due));
    EXPECT_EQ(events[0].attributes["oilDaysRemaining"].get<int64_t>(), 0);
}

TEST_F(OilChangeTest, BothThresholdsInOneStepReportBothReasons) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000},
               {"lastServiceDate", "2024-01-15T00:00:00Z"}, {"intervalMonths", 6}});
    int64_t due = at("2024-07-15T00:00:00Z");

    auto events = step(position(due - kHourMillis, 10990.0), position(due + kHourMillis, 11010.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].attributes["oilReason"].get<std::string>(), "km,date");
}

TEST_F(OilChangeTest, SameCycleFiresAtMostOncePerDay) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000}});
    int64_t t = at("2024-03-10T08:00:00Z");

    EXPECT_EQ(step(position(t, 10999.0), position(t + 60000, 11001.0)).size(), 1u);
    // Odometer jitter re-crosses the threshold later the same day
    EXPECT_TRUE(step(position(t + 2 * kHourMillis, 10998.0), position(t + 3 * kHourMillis, 11002.0)).empty());
    // Next day the reminder may fire again
    int64_t nextDay = t + 24 * kHourMillis;
    EXPECT_EQ(step(position(nextDay, 10999.0), position(nextDay + 60000, 11003.0)).size(), 1u);
}

TEST_F(OilChangeTest, NewServiceRecordStartsNewCycle) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000}});
    int64_t t = at("2024-03-10T08:00:00Z");
    EXPECT_EQ(step(position(t, 10999.0), position(t + 60000, 11001.0)).size(), 1u);

    configure({{"lastServiceOdometer", 11001}, {"intervalKm", 10000}});
    EXPECT_EQ(step(position(t + kHourMillis, 20999.0), position(t + 2 * kHourMillis, 21002.0)).size(), 1u);
}

TEST_F(OilChangeTest, DisabledConfigurationShortCircuits) {
    configure({{"enabled", false}, {"lastServiceOdometer", 1000}, {"intervalKm", 10000},
               {"lastServiceDate", "2024-01-15T00:00:00Z"}, {"intervalMonths", 6}});
    int64_t due = at("2024-07-15T00:00:00Z");

    EXPECT_TRUE(step(position(due - kHourMillis, 10999.0), position(due + kHourMillis, 11001.0)).empty());
}

TEST_F(OilChangeTest, MalformedValuesDisableOnlyTheirCheck) {
    configure({{"lastServiceOdometer", "not a number"}, {"intervalKm", 10000},
               {"lastServiceDate", "2024-01-15T00:00:00Z"}, {"intervalMonths", 6}});
    int64_t due = at("2024-07-15T00:00:00Z");

    auto events = step(position(due - kHourMillis, 10999.0), position(due + kHourMillis, 11001.0));
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].attributes["oilReason"].get<std::string>(), "date");
    EXPECT_FALSE(events[0].attributes.contains("oilDueKm"));
}

TEST_F(OilChangeTest, NoPreviousFixRaisesNothing) {
    configure({{"lastServiceOdometer", 1000}, {"intervalKm", 10000}});
    std::vector<Event> events;
    evaluator_->onPosition(position(at("2024-03-10T08:00:00Z"), 11001.0),
                           [&](Event event) { events.push_back(std::move(event)); });
    EXPECT_TRUE(events.empty());
}

TEST(OilChangeCurrentKmTest, TakesHighestOfAllSources) {
    domain::OilChangeConfig config;
    config.odometerCurrentKm = 5000;
    config.baselineDistanceKm = 100;
    config.baselineOdometerKm = 5200;

    Position p;
    p.attributes["totalDistance"] = 150000.0;   // 150 km traveled
    EXPECT_EQ(domain::OilChangeEvaluator::resolveCurrentKm(config, p), 5250);

    Position empty;
    EXPECT_EQ(domain::OilChangeEvaluator::resolveCurrentKm(config, empty), 5000);

    domain::OilChangeConfig odometerOnly;
    odometerOnly.odometerCurrentKm = 5000;
    Position reported;
    reported.attributes["odometer"] = 9000000.0;
    reported.attributes["totalDistance"] = 150000.0;
    EXPECT_EQ(domain::OilChangeEvaluator::resolveCurrentKm(odometerOnly, reported), 9000);
}

class TireRotationTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<sim::InMemoryStore>();
        evaluator_ = std::make_unique<domain::TireRotationEvaluator>(store_);

        Device device;
        device.id = kDeviceId;
        device.attributes["maintenance"]["tireRotation"] = {{"lastRotationOdometerKm", 20000}};
        store_->addDevice(device);
    }

    std::vector<Event> evaluate(double odometerKm) {
        Position p;
        p.deviceId = kDeviceId;
        p.fixTime = 1700000000000LL;
        p.attributes["odometer"] = odometerKm * 1000.0;
        std::vector<Event> events;
        evaluator_->onPosition(p, [&](Event event) { events.push_back(std::move(event)); });
        return events;
    }

    std::shared_ptr<sim::InMemoryStore> store_;
    std::unique_ptr<domain::TireRotationEvaluator> evaluator_;
};

TEST_F(TireRotationTest, BandsFollowReminderBuffer) {
    domain::TireRotationConfig config;
    config.lastRotationOdometerKm = 20000;

    EXPECT_EQ(domain::TireRotationEvaluator::computeSchedule(config, 26000).status, domain::TireStatus::Ok);
    EXPECT_EQ(domain::TireRotationEvaluator::computeSchedule(config, 27000).status, domain::TireStatus::Ok);
    EXPECT_EQ(domain::TireRotationEvaluator::computeSchedule(config, 27001).status, domain::TireStatus::DueSoon);
    EXPECT_EQ(domain::TireRotationEvaluator::computeSchedule(config, 27999).status, domain::TireStatus::DueSoon);
    EXPECT_EQ(domain::TireRotationEvaluator::computeSchedule(config, 28000).status, domain::TireStatus::Overdue);

    auto schedule = domain::TireRotationEvaluator::computeSchedule(config, 27500);
    EXPECT_EQ(schedule.nextDueOdometerKm, 28000);
    EXPECT_EQ(schedule.kmRemaining, 500);
}

TEST_F(TireRotationTest, OnlyBandChangesRaiseEvents) {
    EXPECT_TRUE(evaluate(26000).empty());

    auto soon = evaluate(27200);
    ASSERT_EQ(soon.size(), 1u);
    EXPECT_EQ(soon[0].type, Event::TYPE_TIRE_ROTATION_SOON);
    EXPECT_EQ(soon[0].attributes["tireStatus"].get<std::string>(), "DUE_SOON");
    EXPECT_EQ(soon[0].attributes["tireKmRemaining"].get<int64_t>(), 800);
    EXPECT_EQ(soon[0].attributes["tireIntervalKm"].get<int64_t>(), 8000);
    EXPECT_EQ(soon[0].attributes["tireReminderKm"].get<int64_t>(), 1000);

    EXPECT_TRUE(evaluate(27300).empty());

    auto due = evaluate(28100);
    ASSERT_EQ(due.size(), 1u);
    EXPECT_EQ(due[0].type, Event::TYPE_TIRE_ROTATION_DUE);
    EXPECT_EQ(due[0].attributes["tireNextKm"].get<int64_t>(), 28000);
    EXPECT_EQ(due[0].attributes["tireStatus"].get<std::string>(), "OVERDUE");
}

TEST_F(TireRotationTest, SamePositionTwiceFiresOnce) {
    EXPECT_EQ(evaluate(27500).size(), 1u);
    EXPECT_TRUE(evaluate(27500).empty());
}

TEST_F(TireRotationTest, ReturnToOkIsSilentAndResetsBand) {
    EXPECT_EQ(evaluate(27500).size(), 1u);

    // Rotation recorded: back to OK without an event
    Device device = *store_->getDevice(kDeviceId);
    device.attributes["maintenance"]["tireRotation"]["lastRotationOdometerKm"] = 27500;
    store_->addDevice(device);
    EXPECT_TRUE(evaluate(27600).empty());

    EXPECT_EQ(evaluate(34600).size(), 1u);
}

TEST_F(TireRotationTest, DeviceRemovalForgetsBand) {
    EXPECT_EQ(evaluate(27500).size(), 1u);
    evaluator_->onDeviceRemoved(kDeviceId);
    EXPECT_EQ(evaluate(27500).size(), 1u);
}

TEST_F(TireRotationTest, MissingBaselineDisablesCheck) {
    Device device;
    device.id = kDeviceId;
    device.attributes["maintenance"]["tireRotation"] = {{"intervalKm", 5000}};
    store_->addDevice(device);
    EXPECT_TRUE(evaluate(50000).empty());
}
