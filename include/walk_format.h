#ifndef WALKAWARE_WALK_FORMAT_H
#define WALKAWARE_WALK_FORMAT_H

#include <stdint.h>
#include <stddef.h>

/**
 * @file walk_format.h
 * @brief Human-readable formatting of walk durations, distances and times
 *
 * All functions write into a caller-supplied buffer and always
 * NUL-terminate it (truncating if needed).
 */

/**
 * @brief Duration rendering style
 */
enum DurationStyle {
    DURATION_SHORT,    ///< "1h 5m", "12m", "42s"
    DURATION_LONG      ///< "1 hr 5 min", "12 min", "42 sec"
};

/**
 * @brief Elapsed time reduced to its largest whole unit
 */
struct TimeSince {
    uint32_t value;      ///< Count of unit
    const char* unit;    ///< "seconds", "minute(s)", "hour(s)", "day(s)"
};

/**
 * @brief Format a duration
 *
 * Hours and minutes are shown when non-zero; seconds only when both are
 * zero.
 *
 * @param seconds Duration in seconds
 * @param style Short or long units
 * @param buffer Output buffer
 * @param size Buffer size
 */
void formatDuration(uint32_t seconds, DurationStyle style, char* buffer, size_t size);

/**
 * @brief Reduce an elapsed time to seconds, minutes, hours or days
 *
 * Below a minute the unit is always "seconds". Larger units are singular
 * for a value of 1.
 *
 * @param elapsedSeconds Elapsed time
 * @return TimeSince Value and unit
 */
TimeSince timeSince(uint32_t elapsedSeconds);

/**
 * @brief Format time since an event as "<value> <unit>"
 *
 * @param nowMs Current epoch ms
 * @param thenMs Event epoch ms (0 = never, empty string)
 */
void formatTimeSince(uint64_t nowMs, uint64_t thenMs, char* buffer, size_t size);

/**
 * @brief Format a distance as "<km, 2 decimals> km"
 */
void formatDistance(double km, char* buffer, size_t size);

/**
 * @brief Format an epoch timestamp as "YYYY-MM-DD HH:MM" (UTC)
 */
void formatTimestamp(uint64_t epochMs, char* buffer, size_t size);

#endif // WALKAWARE_WALK_FORMAT_H
