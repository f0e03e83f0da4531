#include "Geo.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace fleetalert {

double Geo::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double a = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1-a));
    return EARTH_RADIUS_METERS * c;
}

double Geo::latitudeDelta(double meters) {
    return toDegrees(meters / EARTH_RADIUS_METERS);
}

double Geo::longitudeDelta(double meters, double latitude) {
    // Near the poles a degree of longitude collapses; clamp so the delta stays finite.
    double cosine = std::max(std::cos(toRadians(latitude)), 0.01);
    return toDegrees(meters / (EARTH_RADIUS_METERS * cosine));
}

double Geo::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double Geo::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace fleetalert
