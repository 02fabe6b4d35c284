#include "walk_format.h"
#include "utc_time.h"
#include <stdio.h>

void formatDuration(uint32_t seconds, DurationStyle style, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return;
    }

    uint32_t h = seconds / 3600;
    uint32_t m = (seconds % 3600) / 60;
    uint32_t s = seconds % 60;

    const char* hourUnit = (style == DURATION_LONG) ? " hr" : "h";
    const char* minuteUnit = (style == DURATION_LONG) ? " min" : "m";
    const char* secondUnit = (style == DURATION_LONG) ? " sec" : "s";

    if (h > 0 && m > 0) {
        snprintf(buffer, size, "%lu%s %lu%s",
                 (unsigned long)h, hourUnit, (unsigned long)m, minuteUnit);
    } else if (h > 0) {
        snprintf(buffer, size, "%lu%s", (unsigned long)h, hourUnit);
    } else if (m > 0) {
        snprintf(buffer, size, "%lu%s", (unsigned long)m, minuteUnit);
    } else {
        snprintf(buffer, size, "%lu%s", (unsigned long)s, secondUnit);
    }
}

TimeSince timeSince(uint32_t elapsedSeconds) {
    TimeSince result;

    if (elapsedSeconds < 60) {
        result.value = elapsedSeconds;
        result.unit = "seconds";
        return result;
    }

    uint32_t minutes = elapsedSeconds / 60;
    if (minutes < 60) {
        result.value = minutes;
        result.unit = minutes == 1 ? "minute" : "minutes";
        return result;
    }

    uint32_t hours = minutes / 60;
    if (hours < 24) {
        result.value = hours;
        result.unit = hours == 1 ? "hour" : "hours";
        return result;
    }

    uint32_t days = hours / 24;
    result.value = days;
    result.unit = days == 1 ? "day" : "days";
    return result;
}

void formatTimeSince(uint64_t nowMs, uint64_t thenMs, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return;
    }

    if (thenMs == 0) {
        buffer[0] = '\0';
        return;
    }

    // Clock set backwards since the event: treat as just now
    uint64_t elapsedMs = nowMs > thenMs ? nowMs - thenMs : 0;
    TimeSince since = timeSince((uint32_t)(elapsedMs / 1000));
    snprintf(buffer, size, "%lu %s", (unsigned long)since.value, since.unit);
}

void formatDistance(double km, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return;
    }
    snprintf(buffer, size, "%.2f km", km);
}

void formatTimestamp(uint64_t epochMs, char* buffer, size_t size) {
    if (!buffer || size == 0) {
        return;
    }

    UtcDateTime utc;
    epochMsToUtc(epochMs, utc);
    snprintf(buffer, size, "%04u-%02u-%02u %02u:%02u",
             (unsigned)utc.year, (unsigned)utc.month, (unsigned)utc.day,
             (unsigned)utc.hour, (unsigned)utc.minute);
}
