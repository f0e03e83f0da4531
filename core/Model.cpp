#include "Model.hpp"
#include <sstream>
#include <utility>

namespace fleetalert {

namespace {

constexpr int64_t kDayMillis = 24LL * 60 * 60 * 1000;
constexpr int64_t kWeekMillis = 7 * kDayMillis;

std::string trimmed(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

Event::Event(std::string eventType, const Position& position)
    : type(std::move(eventType)),
      deviceId(position.deviceId),
      positionId(position.id),
      eventTime(position.fixTime) {
}

bool Notification::hasDefaultDescription() const {
    std::string value = trimmed(description);
    return value.empty() || value == type;
}

bool Calendar::checkMoment(int64_t epochMillis) const {
    for (const auto& period : periods) {
        if (epochMillis < period.start || period.end <= period.start) {
            continue;
        }
        int64_t length = period.end - period.start;
        switch (period.recurrence) {
            case Recurrence::None:
                if (epochMillis < period.end) {
                    return true;
                }
                break;
            case Recurrence::Daily:
                if ((epochMillis - period.start) % kDayMillis < length) {
                    return true;
                }
                break;
            case Recurrence::Weekly:
                if ((epochMillis - period.start) % kWeekMillis < length) {
                    return true;
                }
                break;
        }
    }
    return false;
}

std::string objectTypeToString(ObjectType type) {
    switch (type) {
        case ObjectType::User: return "user";
        case ObjectType::Device: return "device";
        case ObjectType::Notification: return "notification";
        case ObjectType::Geofence: return "geofence";
        case ObjectType::Calendar: return "calendar";
        default: return "unknown";
    }
}

std::vector<std::string> splitCsv(const std::string& value) {
    std::vector<std::string> result;
    std::istringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        part = trimmed(part);
        if (!part.empty()) {
            result.push_back(part);
        }
    }
    return result;
}

std::string joinCsv(const std::vector<std::string>& values) {
    std::string result;
    for (const auto& value : values) {
        if (!result.empty()) {
            result += ',';
        }
        result += value;
    }
    return result;
}

} // namespace fleetalert
