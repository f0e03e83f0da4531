#pragma once

#include "../Model.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/IObjectStore.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace fleetalert::domain {

/**
 * @brief Creates the starter subscription kit for a new user
 *
 * One "always" subscription per default type, described by its own type name
 * so the deduplication job can tell it apart from user-edited ones.
 */
class DefaultNotifications {
public:
    DefaultNotifications(std::shared_ptr<ports::IObjectStore> store,
                         std::shared_ptr<ports::ICacheManager> cacheManager,
                         std::vector<std::string> channels);

    static const std::vector<std::string>& defaultTypes();

    /**
     * @brief Adds the missing default subscriptions for a user
     * @return Number of subscriptions created
     * @throws ports::StorageException
     */
    int provision(int64_t userId);

private:
    std::shared_ptr<ports::IObjectStore> store_;
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::vector<std::string> channels_;
};

} // namespace fleetalert::domain
