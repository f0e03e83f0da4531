#pragma once

#include "../Model.hpp"
#include "../TimeZone.hpp"
#include "../ports/INotificator.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert::domain {

struct DeviceSummary {
    int64_t deviceId = 0;
    std::string name;
    double distanceKm = 0.0;
    int64_t motionSeconds = 0;
    int geofenceEnterCount = 0;
    int geofenceExitCount = 0;
    int maxSpeedKph = 0;

    int geofenceTotal() const { return geofenceEnterCount + geofenceExitCount; }
};

struct UserSummary {
    std::vector<DeviceSummary> devices;     ///< Ordered by DailySummary::sortDevices
    double totalDistanceKm = 0.0;
    int64_t totalMotionSeconds = 0;
    double totalPreviousDistanceKm = 0.0;
    int totalLongStops = 0;

    int maxSpeedKph() const;
    int geofenceTotal() const;
};

/**
 * @brief Movement aggregation and message rendering for the daily summary
 *
 * A segment between two consecutive fixes counts as moving when the earlier
 * fix reports more than 1 km/h. Only moving segments add route distance and
 * moving time; stopped runs feed the long stop counter.
 */
class DailySummary {
public:
    static constexpr int64_t LONG_STOP_MIN_SECONDS = 15 * 60;
    static constexpr int64_t MIN_MOVEMENT_SECONDS = 10 * 60;
    static constexpr double MIN_DISTANCE_KM = 1.0;
    static constexpr size_t VEHICLE_NAME_LIMIT = 24;
    static constexpr const char* SUMMARY_TYPE = "DAILY_SUMMARY_PUSH";
    static constexpr const char* TITLE = "Yesterday's summary";
    static constexpr const char* SEPARATOR = " \u2022 ";

    static double stopSpeedKnots();

    static double routeDistanceMeters(const std::vector<Position>& positions);
    static int64_t movingTimeSeconds(const std::vector<Position>& positions);

    /// Every contiguous stopped run of at least 15 minutes, a trailing one included
    static int countLongStops(const std::vector<Position>& positions);

    static int maxSpeedKph(const std::vector<Position>& positions);

    /// "Nm" below one hour (rounded, at least 1m for any motion), "HhMM" above
    static std::string formatMotion(int64_t motionSeconds);

    /// One decimal with a comma separator, e.g. "12,5"
    static std::string formatDistance(double distanceKm);

    static int averageSpeedKph(double distanceKm, int64_t motionSeconds);

    /// std::nullopt when there is no previous-day distance to compare with
    static std::optional<double> distanceDeltaPercent(double currentKm, double previousKm);

    static std::string limitName(const std::string& value, size_t limit);

    /// Distance desc, then moving time desc, then name case-insensitive
    static void sortDevices(std::vector<DeviceSummary>& devices);

    static bool hasMovement(const UserSummary& summary);

    static std::string buildBody(const UserSummary& summary);

    /// std::nullopt for a summary without devices
    static std::optional<ports::NotificationMessage> buildMessage(const UserSummary& summary,
                                                                  const LocalDate& reportDate);
};

} // namespace fleetalert::domain
