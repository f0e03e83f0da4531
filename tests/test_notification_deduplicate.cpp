#include <gtest/gtest.h>
#include "../core/domain/NotificationDeduplicateTask.hpp"
#include "../core/sim/InMemoryStore.hpp"
#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace fleetalert;

namespace {

/// Rejects link removal for selected users
class PartiallyFailingStore : public sim::InMemoryStore {
public:
    std::set<int64_t> failingUsers;

    void removePermission(const Permission& permission) override {
        if (permission.ownerType == ObjectType::User && failingUsers.count(permission.ownerId) > 0) {
            throw ports::StorageException("removePermission rejected");
        }
        sim::InMemoryStore::removePermission(permission);
    }
};

} // namespace

class NotificationDeduplicateTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<PartiallyFailingStore>();
        for (int64_t userId : {1, 2, 3}) {
            User user;
            user.id = userId;
            store_->addUser(user);
        }
    }

    Notification overspeed(int64_t id, const std::string& description, bool always,
                           std::vector<int64_t> devices, int64_t userId = 1) {
        Notification notification;
        notification.id = id;
        notification.type = Event::TYPE_DEVICE_OVERSPEED;
        notification.description = description;
        notification.always = always;
        notification.notificators = {"push"};
        store_->putNotification(notification);
        store_->addPermission({ObjectType::User, userId, ObjectType::Notification, id});
        for (int64_t deviceId : devices) {
            store_->addPermission({ObjectType::Device, deviceId, ObjectType::Notification, id});
        }
        return notification;
    }

    bool linked(int64_t userId, int64_t notificationId) {
        auto links = store_->getPermissions(ObjectType::User, ObjectType::Notification);
        Permission wanted{ObjectType::User, userId, ObjectType::Notification, notificationId};
        return std::find(links.begin(), links.end(), wanted) != links.end();
    }

    int run() {
        domain::NotificationDeduplicateTask task(store_, store_);
        return task.run();
    }

    std::shared_ptr<PartiallyFailingStore> store_;
};

TEST_F(NotificationDeduplicateTest, CustomizedSupersetRemovesDefault) {
    overspeed(1, "", false, {10});
    overspeed(2, "Highway speeding", false, {10, 11});

    EXPECT_EQ(run(), 1);
    EXPECT_FALSE(linked(1, 1));
    EXPECT_TRUE(linked(1, 2));

    // Device links stay in place
    EXPECT_EQ(store_->getPermissions(ObjectType::Device, ObjectType::Notification).size(), 3u);
    EXPECT_GT(store_->invalidationCount(), 0u);
}

TEST_F(NotificationDeduplicateTest, DescriptionEqualToTypeIsDefault) {
    overspeed(1, Event::TYPE_DEVICE_OVERSPEED, false, {10});
    overspeed(2, "Custom", false, {10});

    EXPECT_EQ(run(), 1);
    EXPECT_FALSE(linked(1, 1));
}

TEST_F(NotificationDeduplicateTest, PartialCoverageKeepsDefault) {
    overspeed(1, "", false, {10, 12});
    overspeed(2, "Custom", false, {10, 11});

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(linked(1, 1));
}

TEST_F(NotificationDeduplicateTest, AlwaysCustomizedCoversEverything) {
    overspeed(1, "", false, {10, 12});
    overspeed(2, "", true, {});
    overspeed(3, "Everything", true, {});

    EXPECT_EQ(run(), 2);
    EXPECT_FALSE(linked(1, 1));
    EXPECT_FALSE(linked(1, 2));
    EXPECT_TRUE(linked(1, 3));
}

TEST_F(NotificationDeduplicateTest, AlwaysDefaultNeedsAlwaysReplacement) {
    overspeed(1, "", true, {});
    overspeed(2, "Custom", false, {10});

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(linked(1, 1));
}

TEST_F(NotificationDeduplicateTest, DefaultsOnlyAreLeftAlone) {
    overspeed(1, "", false, {10});
    overspeed(2, "", false, {10});

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(linked(1, 1));
    EXPECT_TRUE(linked(1, 2));
}

TEST_F(NotificationDeduplicateTest, UsersAreEvaluatedSeparately) {
    overspeed(1, "", false, {10});
    overspeed(2, "Custom", false, {10}, 2);
    store_->addPermission({ObjectType::User, 2, ObjectType::Notification, 1});

    EXPECT_EQ(run(), 1);
    EXPECT_TRUE(linked(1, 1));
    EXPECT_FALSE(linked(2, 1));
}

TEST_F(NotificationDeduplicateTest, OtherTypesAreIgnored) {
    Notification geofence;
    geofence.id = 5;
    geofence.type = Event::TYPE_GEOFENCE_ENTER;
    store_->putNotification(geofence);
    store_->addPermission({ObjectType::User, 1, ObjectType::Notification, 5});
    overspeed(2, "Custom", true, {});

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(linked(1, 5));
}

TEST_F(NotificationDeduplicateTest, StorageFailureStopsQuietly) {
    overspeed(1, "", false, {10});
    overspeed(2, "Custom", true, {});
    store_->setFailWrites(true);

    EXPECT_EQ(run(), 0);
    EXPECT_TRUE(linked(1, 1));
}

TEST_F(NotificationDeduplicateTest, FailingUserDoesNotStopSweep) {
    overspeed(1, "", false, {10}, 1);
    overspeed(2, "Custom", true, {}, 1);
    overspeed(3, "", false, {10}, 2);
    overspeed(4, "Custom", true, {}, 2);
    overspeed(5, "", false, {10}, 3);
    overspeed(6, "Custom", true, {}, 3);
    store_->failingUsers = {2};

    EXPECT_EQ(run(), 2);
    EXPECT_FALSE(linked(1, 1));
    EXPECT_TRUE(linked(2, 3));
    EXPECT_FALSE(linked(3, 5));
}

TEST(NotificationDeduplicateRuleTest, CanReplace) {
    Notification original;
    original.id = 1;
    Notification narrow;
    narrow.id = 2;
    Notification always;
    always.id = 3;
    always.always = true;

    std::map<int64_t, std::set<int64_t>> devices = {{1, {10, 11}}, {2, {10}}};
    EXPECT_FALSE(domain::NotificationDeduplicateTask::canReplace(original, {narrow}, devices));
    EXPECT_TRUE(domain::NotificationDeduplicateTask::canReplace(original, {narrow, always}, devices));

    // A default without devices is covered by any customized subscription
    Notification unlinked;
    unlinked.id = 4;
    EXPECT_TRUE(domain::NotificationDeduplicateTask::canReplace(unlinked, {narrow}, devices));
}
