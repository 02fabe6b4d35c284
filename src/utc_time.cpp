#include "utc_time.h"

static bool isLeapYear(uint32_t year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

static uint8_t daysInMonth(uint32_t year, uint8_t month) {
    static const uint8_t DAYS[12] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return DAYS[month - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date (era-based, no loops)
static int64_t daysFromCivil(int64_t y, uint32_t m, uint32_t d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const uint32_t yoe = (uint32_t)(y - era * 400);
    const uint32_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const uint32_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (int64_t)doe - 719468;
}

bool utcIsValid(const UtcDateTime& utc) {
    if (utc.year < 1970 || utc.month < 1 || utc.month > 12) {
        return false;
    }
    if (utc.day < 1 || utc.day > daysInMonth(utc.year, utc.month)) {
        return false;
    }
    return utc.hour < 24 && utc.minute < 60 && utc.second < 60 && utc.millisecond < 1000;
}

uint64_t utcToEpochMs(const UtcDateTime& utc) {
    if (!utcIsValid(utc)) {
        return 0;
    }

    int64_t days = daysFromCivil(utc.year, utc.month, utc.day);
    uint64_t seconds = (uint64_t)days * 86400ULL
                     + (uint64_t)utc.hour * 3600ULL
                     + (uint64_t)utc.minute * 60ULL
                     + (uint64_t)utc.second;
    return seconds * 1000ULL + utc.millisecond;
}

void epochMsToUtc(uint64_t epochMs, UtcDateTime& out) {
    uint64_t seconds = epochMs / 1000ULL;
    uint32_t secondOfDay = (uint32_t)(seconds % 86400ULL);
    int64_t z = (int64_t)(seconds / 86400ULL) + 719468;

    const int64_t era = z / 146097;
    const uint32_t doe = (uint32_t)(z - era * 146097);
    const uint32_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const uint32_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const uint32_t mp = (5 * doy + 2) / 153;
    const uint32_t d = doy - (153 * mp + 2) / 5 + 1;
    const uint32_t m = mp < 10 ? mp + 3 : mp - 9;
    int64_t y = (int64_t)yoe + era * 400 + (m <= 2 ? 1 : 0);

    out.year = (uint16_t)y;
    out.month = (uint8_t)m;
    out.day = (uint8_t)d;
    out.hour = (uint8_t)(secondOfDay / 3600);
    out.minute = (uint8_t)((secondOfDay % 3600) / 60);
    out.second = (uint8_t)(secondOfDay % 60);
    out.millisecond = (uint16_t)(epochMs % 1000ULL);
}
