#ifndef WALKAWARE_UTC_TIME_H
#define WALKAWARE_UTC_TIME_H

#include <stdint.h>

/**
 * @file utc_time.h
 * @brief UTC calendar <-> epoch millisecond conversion
 *
 * The tag has no RTC. Wall-clock time comes from the GPS receiver's
 * RMC/ZDA date and time fields, which are broken-down UTC; walks are
 * stamped in epoch milliseconds.
 */

/**
 * @brief Broken-down UTC date and time
 */
struct UtcDateTime {
    uint16_t year;        ///< e.g. 2026
    uint8_t month;        ///< 1-12
    uint8_t day;          ///< 1-31
    uint8_t hour;         ///< 0-23
    uint8_t minute;       ///< 0-59
    uint8_t second;       ///< 0-59
    uint16_t millisecond; ///< 0-999
};

/**
 * @brief Convert UTC calendar time to epoch milliseconds
 *
 * @param utc Broken-down time (year >= 1970)
 * @return uint64_t Milliseconds since 1970-01-01T00:00:00Z, 0 if out of range
 */
uint64_t utcToEpochMs(const UtcDateTime& utc);

/**
 * @brief Convert epoch milliseconds to UTC calendar time
 */
void epochMsToUtc(uint64_t epochMs, UtcDateTime& out);

/**
 * @brief Check a broken-down time for calendar validity
 */
bool utcIsValid(const UtcDateTime& utc);

#endif // WALKAWARE_UTC_TIME_H
