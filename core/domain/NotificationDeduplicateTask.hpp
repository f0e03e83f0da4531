#pragma once

#include "../Model.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/IObjectStore.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace fleetalert::domain {

/**
 * @brief Removes redundant default overspeed subscriptions
 *
 * For each user holding several overspeed subscriptions, a default one (its
 * description is empty or equals its type) is unlinked when a customized one
 * covers it: the customized one is "always", or its device set contains every
 * device of the default one. An "always" default is only covered by an
 * "always" customized subscription. Customized subscriptions and a user's only
 * subscription are never touched.
 *
 * @note Must not run concurrently with itself
 */
class NotificationDeduplicateTask {
public:
    NotificationDeduplicateTask(std::shared_ptr<ports::IObjectStore> store,
                                std::shared_ptr<ports::ICacheManager> cacheManager);

    /// @return Number of links removed
    int run();

    static bool canReplace(const Notification& original,
                           const std::vector<Notification>& preferred,
                           const std::map<int64_t, std::set<int64_t>>& notificationDevices);

private:
    std::shared_ptr<ports::IObjectStore> store_;
    std::shared_ptr<ports::ICacheManager> cacheManager_;
};

} // namespace fleetalert::domain
