#include "geodesy.h"
#include <cmath>

static inline double toRadians(double degrees) {
    return degrees * (M_PI / 180.0);
}

double geoDistanceKm(const GeoPoint& a, const GeoPoint& b) {
    double dLat = toRadians(b.latitude - a.latitude);
    double dLon = toRadians(b.longitude - a.longitude);

    double sinHalfLat = sin(dLat / 2.0);
    double sinHalfLon = sin(dLon / 2.0);

    double h = sinHalfLat * sinHalfLat +
               cos(toRadians(a.latitude)) * cos(toRadians(b.latitude)) *
               sinHalfLon * sinHalfLon;

    // Rounding can push h a hair past 1 for antipodal points
    if (h > 1.0) {
        h = 1.0;
    }

    double c = 2.0 * atan2(sqrt(h), sqrt(1.0 - h));
    return EARTH_RADIUS_KM * c;
}

bool geoWithinRadius(const GeoPoint& point, const GeoPoint& center, double radiusKm) {
    return geoDistanceKm(point, center) <= radiusKm;
}
