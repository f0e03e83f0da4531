#include "SimulatedClock.hpp"
#include <stdexcept>

namespace fleetalert::sim {

SimulatedClock::SimulatedClock(int64_t startEpochMillis)
    : epochMillis_(startEpochMillis) {
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(epochMillis_.load())));
}

int64_t SimulatedClock::epochMillis() const {
    return epochMillis_.load();
}

std::string SimulatedClock::iso8601() const {
    return Iso8601::format(epochMillis_.load());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    epochMillis_ += duration.count();
}

void SimulatedClock::setCurrentTime(int64_t epochMillis) {
    epochMillis_ = epochMillis;
}

void SimulatedClock::setCurrentTime(const std::string& iso8601) {
    auto parsed = Iso8601::parse(iso8601);
    if (!parsed) {
        throw std::invalid_argument("Invalid ISO-8601 time: " + iso8601);
    }
    epochMillis_ = *parsed;
}

} // namespace fleetalert::sim
