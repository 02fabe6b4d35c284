#ifndef WALKAWARE_GEODESY_H
#define WALKAWARE_GEODESY_H

#include "walk_types.h"

/**
 * @file geodesy.h
 * @brief Great-circle distance helpers
 *
 * Haversine distance on a spherical Earth (radius EARTH_RADIUS_KM).
 * Pure functions: total for any finite input, commutative, and exactly
 * zero for identical points.
 */

/**
 * @brief Great-circle distance between two coordinates
 *
 * @param a First coordinate
 * @param b Second coordinate
 * @return double Distance in kilometers
 */
double geoDistanceKm(const GeoPoint& a, const GeoPoint& b);

/**
 * @brief Check whether a point lies inside (or on) a circle
 *
 * @param point Point to test
 * @param center Circle center
 * @param radiusKm Circle radius in kilometers
 * @return true if geoDistanceKm(point, center) <= radiusKm
 */
bool geoWithinRadius(const GeoPoint& point, const GeoPoint& center, double radiusKm);

#endif // WALKAWARE_GEODESY_H
