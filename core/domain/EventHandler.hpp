#pragma once

#include "../Model.hpp"
#include "../ports/ICacheManager.hpp"
#include <cstdint>
#include <functional>

namespace fleetalert::domain {

/**
 * @brief Rule evaluator run for every incoming position
 *
 * Implementations never mutate the position and never throw; configuration
 * problems yield no event and are logged.
 */
class EventHandler {
public:
    using Callback = std::function<void(Event)>;

    virtual ~EventHandler() = default;

    virtual void onPosition(const Position& position, const Callback& callback) = 0;

    /// Drops any per-device state held for a deleted device
    virtual void onDeviceRemoved(int64_t deviceId) { (void)deviceId; }

protected:
    /// False when a newer fix than `position` has already been processed
    static bool isLatest(ports::ICacheManager& cacheManager, const Position& position) {
        auto last = cacheManager.getLastPosition(position.deviceId);
        return !last || position.fixTime >= last->fixTime;
    }
};

} // namespace fleetalert::domain
