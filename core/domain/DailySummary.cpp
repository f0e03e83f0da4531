#include "DailySummary.hpp"
#include "../Geo.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>

namespace fleetalert::domain {

namespace {

double finiteSpeed(const Position& position) {
    return std::isfinite(position.speed) ? position.speed : 0.0;
}

bool isMoving(const Position& position) {
    return finiteSpeed(position) > DailySummary::stopSpeedKnots();
}

int64_t deltaSeconds(const Position& previous, const Position& current) {
    return (current.fixTime - previous.fixTime) / 1000;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

int UserSummary::maxSpeedKph() const {
    int result = 0;
    for (const auto& device : devices) {
        result = std::max(result, device.maxSpeedKph);
    }
    return result;
}

int UserSummary::geofenceTotal() const {
    int result = 0;
    for (const auto& device : devices) {
        result += device.geofenceTotal();
    }
    return result;
}

double DailySummary::stopSpeedKnots() {
    return Geo::knotsFromKph(1.0);
}

double DailySummary::routeDistanceMeters(const std::vector<Position>& positions) {
    double meters = 0.0;
    for (size_t i = 1; i < positions.size(); ++i) {
        const auto& previous = positions[i - 1];
        const auto& current = positions[i];
        if (current.fixTime <= previous.fixTime || !isMoving(previous)) {
            continue;
        }
        meters += Geo::distanceMeters(previous.latitude, previous.longitude,
                                      current.latitude, current.longitude);
    }
    return meters;
}

int64_t DailySummary::movingTimeSeconds(const std::vector<Position>& positions) {
    int64_t millis = 0;
    for (size_t i = 1; i < positions.size(); ++i) {
        const auto& previous = positions[i - 1];
        const auto& current = positions[i];
        if (current.fixTime <= previous.fixTime || !isMoving(previous)) {
            continue;
        }
        millis += current.fixTime - previous.fixTime;
    }
    return static_cast<int64_t>(std::llround(millis / 1000.0));
}

int DailySummary::countLongStops(const std::vector<Position>& positions) {
    if (positions.size() < 2) {
        return 0;
    }
    int64_t stoppedSeconds = 0;
    int longStops = 0;
    for (size_t i = 1; i < positions.size(); ++i) {
        int64_t delta = deltaSeconds(positions[i - 1], positions[i]);
        if (delta <= 0) {
            continue;
        }
        if (isMoving(positions[i - 1])) {
            if (stoppedSeconds >= LONG_STOP_MIN_SECONDS) {
                ++longStops;
            }
            stoppedSeconds = 0;
        } else {
            stoppedSeconds += delta;
        }
    }
    if (stoppedSeconds >= LONG_STOP_MIN_SECONDS) {
        ++longStops;
    }
    return longStops;
}

int DailySummary::maxSpeedKph(const std::vector<Position>& positions) {
    int result = 0;
    for (const auto& position : positions) {
        if (!std::isfinite(position.speed)) {
            continue;
        }
        int kph = static_cast<int>(std::lround(Geo::kphFromKnots(position.speed)));
        result = std::max(result, kph);
    }
    return result;
}

std::string DailySummary::formatMotion(int64_t motionSeconds) {
    if (motionSeconds <= 0) {
        return "0m";
    }
    int64_t minutes = std::max<int64_t>(1, std::llround(motionSeconds / 60.0));
    int64_t hours = minutes / 60;
    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lldh%02lld",
                      static_cast<long long>(hours), static_cast<long long>(minutes % 60));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lldm", static_cast<long long>(minutes));
    }
    return buffer;
}

std::string DailySummary::formatDistance(double distanceKm) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", distanceKm);
    std::string result = buffer;
    std::replace(result.begin(), result.end(), '.', ',');
    return result;
}

int DailySummary::averageSpeedKph(double distanceKm, int64_t motionSeconds) {
    if (!(distanceKm > 0.0) || motionSeconds <= 0) {
        return 0;
    }
    double hours = motionSeconds / 3600.0;
    double speed = distanceKm / hours;
    if (!std::isfinite(speed)) {
        return 0;
    }
    return static_cast<int>(std::lround(speed));
}

std::optional<double> DailySummary::distanceDeltaPercent(double currentKm, double previousKm) {
    if (!(previousKm > 0.0)) {
        return std::nullopt;
    }
    return (currentKm - previousKm) / previousKm * 100.0;
}

std::string DailySummary::limitName(const std::string& value, size_t limit) {
    if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
        return "Vehicle";
    }
    if (value.size() <= limit) {
        return value;
    }
    size_t keep = limit > 3 ? limit - 3 : std::max<size_t>(limit, 1);
    // Never cut a UTF-8 sequence in half.
    while (keep > 0 && (static_cast<unsigned char>(value[keep]) & 0xC0) == 0x80) {
        --keep;
    }
    return limit > 3 ? value.substr(0, keep) + "..." : value.substr(0, keep);
}

void DailySummary::sortDevices(std::vector<DeviceSummary>& devices) {
    std::sort(devices.begin(), devices.end(), [](const DeviceSummary& a, const DeviceSummary& b) {
        if (a.distanceKm != b.distanceKm) {
            return a.distanceKm > b.distanceKm;
        }
        if (a.motionSeconds != b.motionSeconds) {
            return a.motionSeconds > b.motionSeconds;
        }
        return lowercase(a.name) < lowercase(b.name);
    });
}

bool DailySummary::hasMovement(const UserSummary& summary) {
    return summary.totalDistanceKm >= MIN_DISTANCE_KM || summary.totalMotionSeconds >= MIN_MOVEMENT_SECONDS;
}

std::string DailySummary::buildBody(const UserSummary& summary) {
    std::vector<std::string> parts;
    parts.push_back("\U0001F6E3\U0000FE0F " + formatDistance(summary.totalDistanceKm) + " km");
    parts.push_back("\u23F1\U0000FE0F " + formatMotion(summary.totalMotionSeconds));
    parts.push_back("\U0001F4CD " + std::to_string(summary.geofenceTotal()));
    parts.push_back("\U0001F3CE\U0000FE0F "
                    + std::to_string(averageSpeedKph(summary.totalDistanceKm, summary.totalMotionSeconds)) + " km/h");
    parts.push_back("\U0001F680 " + std::to_string(summary.maxSpeedKph()) + " km/h");

    auto delta = distanceDeltaPercent(summary.totalDistanceKm, summary.totalPreviousDistanceKm);
    if (delta) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%s%.0f", *delta > 0 ? "+" : "", *delta);
        parts.push_back(std::string("\U0001F4CA ") + buffer + "% km");
    }
    parts.push_back("\U0001F6D1 " + std::to_string(summary.totalLongStops));

    std::string body;
    for (const auto& part : parts) {
        if (!body.empty()) {
            body += SEPARATOR;
        }
        body += part;
    }
    return body;
}

std::optional<ports::NotificationMessage> DailySummary::buildMessage(const UserSummary& summary,
                                                                     const LocalDate& reportDate) {
    if (summary.devices.empty()) {
        return std::nullopt;
    }

    ports::NotificationMessage message;
    message.body = buildBody(summary);
    message.priority = true;

    std::string reportPath = "/reports/daily?date=" + reportDate.toString();
    if (summary.devices.size() == 1) {
        const auto& only = summary.devices.front();
        message.subject = std::string(TITLE) + SEPARATOR + limitName(only.name, VEHICLE_NAME_LIMIT);
        reportPath += "&deviceId=" + std::to_string(only.deviceId);
    } else {
        message.subject = TITLE;
        reportPath += "&deviceId=" + std::to_string(summary.devices[0].deviceId);
        reportPath += "&deviceId=" + std::to_string(summary.devices[1].deviceId);
    }

    message.data["reportPath"] = reportPath;
    message.data["summaryType"] = SUMMARY_TYPE;
    return message;
}

} // namespace fleetalert::domain
