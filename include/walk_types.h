#ifndef WALKAWARE_WALK_TYPES_H
#define WALKAWARE_WALK_TYPES_H

#include <stdint.h>
#include <string>
#include <vector>
#include "config.h"

/**
 * @file walk_types.h
 * @brief Common walk-tracking type definitions and structures
 *
 * Defines the geographic and record types shared by the detection engine,
 * the persistent store, and the GPS HAL.
 */

/**
 * @brief Geographic coordinate (WGS84 degrees)
 */
struct GeoPoint {
    double latitude;    ///< Degrees, -90..90
    double longitude;   ///< Degrees, -180..180
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
    return a.latitude == b.latitude && a.longitude == b.longitude;
}

inline bool operator!=(const GeoPoint& a, const GeoPoint& b) {
    return !(a == b);
}

/**
 * @brief Circular geofence
 *
 * Used both for the reserved home zone and for user-defined named zones.
 */
struct Zone {
    char id[ZONE_ID_MAX_LEN];          ///< "home" or "zone_<epoch ms>"
    char name[ZONE_NAME_MAX_LEN];      ///< Display name, recorded in zonesVisited
    GeoPoint center;                   ///< Zone center
    float radiusKm;                    ///< Radius in km (> 0)
    char color[ZONE_COLOR_MAX_LEN];    ///< "#RRGGBB"
};

/**
 * @brief Walk record
 *
 * Owned by WalkDetector while in progress, by WalkStore once completed.
 */
struct Walk {
    char id[WALK_ID_MAX_LEN];              ///< "walk_<startTime>"
    uint64_t startTime;                    ///< Epoch ms
    uint64_t endTime;                      ///< Epoch ms, 0 while in progress
    uint32_t durationSeconds;              ///< Set on completion
    double distanceKm;                     ///< Sum of path segment lengths
    std::vector<GeoPoint> path;            ///< Chronological, append-only
    std::vector<std::string> zonesVisited; ///< Set semantics (no duplicates)

    Walk() : startTime(0), endTime(0), durationSeconds(0), distanceKm(0.0) {
        id[0] = '\0';
    }

    bool isComplete() const { return endTime != 0; }

    bool hasVisited(const char* zoneName) const {
        for (size_t i = 0; i < zonesVisited.size(); i++) {
            if (zonesVisited[i] == zoneName) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Walk reminder settings
 */
struct NotificationSettings {
    bool enabled;     ///< Reminder enabled
    uint8_t hours;    ///< Hours since last walk before reminding (1-12)
};

/**
 * @brief GPS accuracy profile requested from the receiver
 */
enum AccuracyMode {
    ACCURACY_LOW_POWER = 0,    ///< Periodic poll, receiver power-gated
    ACCURACY_HIGH = 1          ///< Continuous tracking, receiver always on
};

/**
 * @brief Timestamped position delivered by the sensing collaborator
 */
struct PositionSample {
    GeoPoint position;         ///< Reported position
    uint64_t timestampMs;      ///< Epoch ms of the fix
    AccuracyMode accuracyMode; ///< Profile the fix was taken under
};

#endif // WALKAWARE_WALK_TYPES_H
