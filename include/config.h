#ifndef WALKAWARE_CONFIG_H
#define WALKAWARE_CONFIG_H

// ============================================================================
// WalkAware Configuration File
// ============================================================================
// This file contains all system-wide configuration constants, pin definitions,
// and compile-time settings for the WalkAware walk detection tag.
//
// Project: WalkAware - ESP32-C3 GPS Dog-Walk Tracker
// Board: Olimex ESP32-C3-DevKit-Lipo
// GPS: any NMEA receiver on UART1 (tested with u-blox NEO-6M / Quectel L76K)
// ============================================================================

// ============================================================================
// Hardware Pin Assignments (ESP32-C3)
// ============================================================================

// GPS receiver (UART1)
#define PIN_GPS_RX          20   // ESP32 RX <- GPS TX
#define PIN_GPS_TX          21   // ESP32 TX -> GPS RX
#define PIN_GPS_ENABLE      3    // Receiver power/enable (HIGH = powered)
#define PIN_GPS_ENABLE_NONE 0xFF // No enable pin wired (receiver always on)

// Output Pins
#define PIN_STATUS_LED      2    // Built-in status LED (GPIO2)

// ============================================================================
// System Constants
// ============================================================================

// Version Information
#define FIRMWARE_VERSION    "0.3.0"
#define FIRMWARE_NAME       "WalkAware"
#define BUILD_DATE          __DATE__
#define BUILD_TIME          __TIME__

// Serial Communication
#define SERIAL_BAUD_RATE    115200
#define GPS_BAUD_RATE       9600

// ============================================================================
// Geofence / Walk Detection
// ============================================================================

#define HOME_ZONE_ID                  "home"
#define HOME_ZONE_NAME                "Home"
#define HOME_ZONE_COLOR               "#A8A5A3"
#define HOME_RADIUS_KM                0.05    // 50 meters

// Consecutive qualifying samples required before committing a transition
#ifndef WALK_START_CONFIRMATION_COUNT
#define WALK_START_CONFIRMATION_COUNT 3
#endif
#ifndef WALK_END_CONFIRMATION_COUNT
#define WALK_END_CONFIRMATION_COUNT   2
#endif

#define EARTH_RADIUS_KM               6371.0

// ============================================================================
// Zones
// ============================================================================

#define MAX_CUSTOM_ZONES              16      // Named zones kept in the store
#define ZONE_ID_MAX_LEN               24      // "zone_" + epoch ms + NUL
#define ZONE_NAME_MAX_LEN             32
#define ZONE_COLOR_MAX_LEN            8       // "#RRGGBB" + NUL
#define ZONE_DEFAULT_RADIUS_M         100
#define ZONE_PALETTE_SIZE             6
#define ZONE_PALETTE                  { "#F87171", "#60A5FA", "#34D399", "#FBBF24", "#A78BFA", "#F472B6" }

#define WALK_ID_MAX_LEN               24      // "walk_" + epoch ms + NUL
#define WALK_HISTORY_MAX              30      // Oldest walk dropped beyond this
#define WALK_PATH_MAX_POINTS          40      // Stored path is thinned to this many points

// ============================================================================
// Sampling Cadence (milliseconds)
// ============================================================================

#define LOW_POWER_INTERVAL_MS         120000  // 2 minutes between polls at home

#define GPS_DETECT_TIMEOUT_MS         5000    // Silence after power-on before warning

// High accuracy profile (walking)
#define GPS_HIGH_ACCURACY_TIMEOUT_MS  10000   // 10s to obtain a fix
#define GPS_HIGH_ACCURACY_MAX_AGE_MS  0       // Fresh fix only

// Low power profile (at home)
#define GPS_LOW_POWER_TIMEOUT_MS      20000   // 20s to obtain a fix
#define GPS_LOW_POWER_MAX_AGE_MS      60000   // Accept a fix up to 1 minute old

// ============================================================================
// Walk Reminder
// ============================================================================

#define REMINDER_DEFAULT_HOURS        8
#define REMINDER_MIN_HOURS            1
#define REMINDER_MAX_HOURS            12
#define REMINDER_CHECK_INTERVAL_MS    300000  // Check every 5 minutes

// ============================================================================
// Persistent Storage
// ============================================================================

#define STORE_FILE_PATH               "/walkaware.json"
#define STORE_MAX_FILE_SIZE           65536   // 64KB, parsed in one heap block at boot
#define STORE_POINT_JSON_BYTES        48      // Worst case for one {"lat":..,"lng":..} entry
#define STORE_FORMAT_VERSION          1

// ============================================================================
// Status LED Patterns
// ============================================================================

#define LED_BLINK_WALKING_MS          250     // Fast blink while walking
#define LED_BLINK_IDLE_MS             2000    // Slow heartbeat at home

// ============================================================================
// Logging Configuration
// ============================================================================

// Log Levels (must match DebugLogger::LogLevel enum)
#define LOG_LEVEL_VERBOSE  0
#define LOG_LEVEL_DEBUG    1
#define LOG_LEVEL_INFO     2
#define LOG_LEVEL_WARN     3
#define LOG_LEVEL_ERROR    4
#define LOG_LEVEL_NONE     5

// Default Log Level
// Override in build flags with -D LOG_LEVEL=LOG_LEVEL_DEBUG if needed
#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

// Circular Buffer Size (number of log entries)
#define LOG_BUFFER_SIZE    128

// Log File Configuration
#define LOG_FILE_PATH       "/logs.txt"
#define LOG_FLUSH_INTERVAL  60000      // Flush to flash every 60 seconds

// ============================================================================
// Feature Flags
// ============================================================================

// Mock Hardware (set to 1 for development without a GPS receiver)
#ifndef MOCK_HARDWARE
#define MOCK_HARDWARE                0    // 0 = real hardware, 1 = mock
#endif

// Wall clock used by mock builds until `mock time` sets one (2025-01-01 UTC)
#define MOCK_EPOCH_START_MS          1735689600000ULL

// ============================================================================
// Debug Helpers
// ============================================================================

#if LOG_LEVEL <= LOG_LEVEL_DEBUG
    #define DEBUG_PRINT(x)      Serial.print(x)
    #define DEBUG_PRINTLN(x)    Serial.println(x)
    #define DEBUG_PRINTF(...)   Serial.printf(__VA_ARGS__)
#else
    #define DEBUG_PRINT(x)
    #define DEBUG_PRINTLN(x)
    #define DEBUG_PRINTF(...)
#endif

// ============================================================================
// Compile-Time Checks
// ============================================================================

#if WALK_START_CONFIRMATION_COUNT < 1
    #error "WALK_START_CONFIRMATION_COUNT must be at least 1"
#endif

#if WALK_END_CONFIRMATION_COUNT < 1
    #error "WALK_END_CONFIRMATION_COUNT must be at least 1"
#endif

#if LOW_POWER_INTERVAL_MS < 10000
    #error "LOW_POWER_INTERVAL_MS must be at least 10000ms (10 seconds)"
#endif

#if WALK_HISTORY_MAX < 1
    #error "WALK_HISTORY_MAX must be at least 1"
#endif

#if WALK_PATH_MAX_POINTS < 2
    #error "WALK_PATH_MAX_POINTS must keep at least the first and last point"
#endif

#if WALK_HISTORY_MAX * WALK_PATH_MAX_POINTS * STORE_POINT_JSON_BYTES > STORE_MAX_FILE_SIZE
    #error "Full walk history would not fit in STORE_MAX_FILE_SIZE"
#endif

#if LOG_BUFFER_SIZE < 32
    #error "LOG_BUFFER_SIZE must be at least 32 entries"
#endif

// ============================================================================
// End of Configuration
// ============================================================================

#endif // WALKAWARE_CONFIG_H
