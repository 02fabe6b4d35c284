/**
 * @file test_walk_format.cpp
 * @brief Unit tests for walk display formatting and UTC conversion
 */

#include <unity.h>
#include <string.h>
#include "walk_format.h"
#include "utc_time.h"

#include "../../src/utc_time.cpp"
#include "../../src/walk_format.cpp"

static char buf[48];

static UtcDateTime makeUtc(uint16_t year, uint8_t month, uint8_t day,
                           uint8_t hour, uint8_t minute, uint8_t second) {
    UtcDateTime utc;
    utc.year = year;
    utc.month = month;
    utc.day = day;
    utc.hour = hour;
    utc.minute = minute;
    utc.second = second;
    utc.millisecond = 0;
    return utc;
}

void setUp(void) {
    memset(buf, 0, sizeof(buf));
}

void tearDown(void) {
}

// ============================================================================
// Durations
// ============================================================================

void test_duration_short_style(void) {
    formatDuration(3900, DURATION_SHORT, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h 5m", buf);

    formatDuration(7200, DURATION_SHORT, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2h", buf);

    formatDuration(720, DURATION_SHORT, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("12m", buf);

    formatDuration(42, DURATION_SHORT, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("42s", buf);
}

void test_duration_long_style(void) {
    formatDuration(3900, DURATION_LONG, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1 hr 5 min", buf);

    formatDuration(125, DURATION_LONG, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2 min", buf);

    formatDuration(0, DURATION_LONG, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0 sec", buf);
}

void test_duration_seconds_hidden_when_minutes_present(void) {
    formatDuration(3659, DURATION_SHORT, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1h", buf);
}

void test_duration_truncates_to_buffer(void) {
    char small[4];
    formatDuration(3900, DURATION_LONG, small, sizeof(small));
    TEST_ASSERT_EQUAL_STRING("1 h", small);
}

// ============================================================================
// Time since
// ============================================================================

void test_time_since_units(void) {
    TimeSince t = timeSince(45);
    TEST_ASSERT_EQUAL_UINT32(45, t.value);
    TEST_ASSERT_EQUAL_STRING("seconds", t.unit);

    t = timeSince(1);
    TEST_ASSERT_EQUAL_STRING("seconds", t.unit);

    t = timeSince(60);
    TEST_ASSERT_EQUAL_UINT32(1, t.value);
    TEST_ASSERT_EQUAL_STRING("minute", t.unit);

    t = timeSince(3599);
    TEST_ASSERT_EQUAL_UINT32(59, t.value);
    TEST_ASSERT_EQUAL_STRING("minutes", t.unit);

    t = timeSince(3600);
    TEST_ASSERT_EQUAL_UINT32(1, t.value);
    TEST_ASSERT_EQUAL_STRING("hour", t.unit);

    t = timeSince(5 * 3600 + 1800);
    TEST_ASSERT_EQUAL_UINT32(5, t.value);
    TEST_ASSERT_EQUAL_STRING("hours", t.unit);

    t = timeSince(86400);
    TEST_ASSERT_EQUAL_UINT32(1, t.value);
    TEST_ASSERT_EQUAL_STRING("day", t.unit);

    t = timeSince(3 * 86400 + 100);
    TEST_ASSERT_EQUAL_UINT32(3, t.value);
    TEST_ASSERT_EQUAL_STRING("days", t.unit);
}

void test_format_time_since(void) {
    const uint64_t then = 1700000000000ULL;

    formatTimeSince(then + 2 * 3600000ULL, then, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2 hours", buf);

    formatTimeSince(then + 30000ULL, then, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("30 seconds", buf);
}

void test_format_time_since_never_is_empty(void) {
    strcpy(buf, "stale");
    formatTimeSince(1700000000000ULL, 0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("", buf);
}

void test_format_time_since_clock_behind(void) {
    formatTimeSince(1000, 5000, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0 seconds", buf);
}

// ============================================================================
// Distance / timestamp
// ============================================================================

void test_format_distance(void) {
    formatDistance(1.234, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1.23 km", buf);

    formatDistance(0.0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("0.00 km", buf);

    formatDistance(12.5, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("12.50 km", buf);
}

void test_format_timestamp(void) {
    formatTimestamp(1700000000000ULL, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("2023-11-14 22:13", buf);

    formatTimestamp(0, buf, sizeof(buf));
    TEST_ASSERT_EQUAL_STRING("1970-01-01 00:00", buf);
}

// ============================================================================
// UTC conversion
// ============================================================================

void test_utc_to_epoch_known_dates(void) {
    TEST_ASSERT_EQUAL_UINT64(0ULL, utcToEpochMs(makeUtc(1970, 1, 1, 0, 0, 0)));
    TEST_ASSERT_EQUAL_UINT64(1735689600000ULL, utcToEpochMs(makeUtc(2025, 1, 1, 0, 0, 0)));
    TEST_ASSERT_EQUAL_UINT64(1709208000000ULL, utcToEpochMs(makeUtc(2024, 2, 29, 12, 0, 0)));

    UtcDateTime withMs = makeUtc(2023, 11, 14, 22, 13, 20);
    withMs.millisecond = 250;
    TEST_ASSERT_EQUAL_UINT64(1700000000250ULL, utcToEpochMs(withMs));
}

void test_epoch_to_utc(void) {
    UtcDateTime utc;
    epochMsToUtc(1709208000123ULL, utc);
    TEST_ASSERT_EQUAL_UINT16(2024, utc.year);
    TEST_ASSERT_EQUAL_UINT8(2, utc.month);
    TEST_ASSERT_EQUAL_UINT8(29, utc.day);
    TEST_ASSERT_EQUAL_UINT8(12, utc.hour);
    TEST_ASSERT_EQUAL_UINT8(0, utc.minute);
    TEST_ASSERT_EQUAL_UINT8(0, utc.second);
    TEST_ASSERT_EQUAL_UINT16(123, utc.millisecond);
}

void test_utc_validity(void) {
    TEST_ASSERT_TRUE(utcIsValid(makeUtc(2024, 2, 29, 23, 59, 59)));
    TEST_ASSERT_FALSE(utcIsValid(makeUtc(2023, 2, 29, 0, 0, 0)));
    TEST_ASSERT_FALSE(utcIsValid(makeUtc(1900, 2, 28, 0, 0, 0)));
    TEST_ASSERT_FALSE(utcIsValid(makeUtc(2024, 13, 1, 0, 0, 0)));
    TEST_ASSERT_FALSE(utcIsValid(makeUtc(2024, 4, 31, 0, 0, 0)));
    TEST_ASSERT_FALSE(utcIsValid(makeUtc(2024, 1, 1, 24, 0, 0)));

    // Invalid input converts to 0 rather than a wrong epoch
    TEST_ASSERT_EQUAL_UINT64(0ULL, utcToEpochMs(makeUtc(2023, 2, 30, 0, 0, 0)));
}

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    UNITY_BEGIN();

    RUN_TEST(test_duration_short_style);
    RUN_TEST(test_duration_long_style);
    RUN_TEST(test_duration_seconds_hidden_when_minutes_present);
    RUN_TEST(test_duration_truncates_to_buffer);

    RUN_TEST(test_time_since_units);
    RUN_TEST(test_format_time_since);
    RUN_TEST(test_format_time_since_never_is_empty);
    RUN_TEST(test_format_time_since_clock_behind);

    RUN_TEST(test_format_distance);
    RUN_TEST(test_format_timestamp);

    RUN_TEST(test_utc_to_epoch_known_dates);
    RUN_TEST(test_epoch_to_utc);
    RUN_TEST(test_utc_validity);

    return UNITY_END();
}
