#pragma once

#include "../IClock.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace fleetalert::sim {

/// Manually driven clock; time only moves when told to
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(int64_t startEpochMillis = 0);
    ~SimulatedClock() override = default;

    std::chrono::system_clock::time_point now() const override;
    int64_t epochMillis() const override;
    std::string iso8601() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(int64_t epochMillis);

    /// Accepts anything Iso8601::parse accepts; throws std::invalid_argument otherwise
    void setCurrentTime(const std::string& iso8601);

private:
    std::atomic<int64_t> epochMillis_;
};

} // namespace fleetalert::sim
