#pragma once

namespace fleetalert {

class Geo {
public:
    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);

    /// Degrees of latitude spanned by a north-south distance
    static double latitudeDelta(double meters);

    /// Degrees of longitude spanned by an east-west distance at the given latitude
    static double longitudeDelta(double meters, double latitude);

    static double knotsFromKph(double kph) { return kph * KNOTS_PER_KPH; }
    static double kphFromKnots(double knots) { return knots / KNOTS_PER_KPH; }

    static constexpr double KNOTS_PER_KPH = 0.539957;

private:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace fleetalert
