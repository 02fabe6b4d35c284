/**
 * @file main.cpp
 * @brief WalkAware - ESP32-C3 GPS Dog-Walk Tracker
 *
 * Main application entry point. Mounts storage, brings up the GPS receiver
 * and the walk tracker, and runs the sampling loop.
 *
 * Project: WalkAware
 * Board: Olimex ESP32-C3-DevKit-Lipo
 * GPS: NMEA receiver on UART1
 */

#include <Arduino.h>
#include "config.h"
#include "logger.h"
#include "debug_logger.h"
#include "hal_gps.h"
#include "hal_littlefs_storage.h"
#include "walk_detector.h"
#include "walk_store.h"
#include "location_sampler.h"
#include "walk_tracker.h"
#include "walk_reminder.h"
#include "serial_console.h"

// ============================================================================
// Global Objects
// ============================================================================

HAL_GPS gps(&Serial1, PIN_GPS_RX, PIN_GPS_TX, MOCK_HARDWARE);

HAL_LittleFSStorage blobStorage;
WalkStore walkStore(&blobStorage);

WalkDetector walkDetector;
LocationSampler locationSampler;
WalkTracker walkTracker(&walkDetector, &walkStore, &locationSampler);
WalkReminder walkReminder(&walkStore, &walkDetector);

SerialConsole serialConsole(walkTracker, walkReminder, gps);

// ============================================================================
// Helpers
// ============================================================================

/**
 * @brief Wall clock for log timestamps (0 until the GPS reports UTC)
 */
static uint64_t gpsClock() {
    return gps.getEpochMs();
}

void printBanner() {
    Serial.println("\n\n");
    Serial.println("========================================");
    Serial.println("          W A L K A W A R E");
    Serial.println("       GPS Dog-Walk Tracker");
    Serial.println("========================================");
    Serial.printf("Version: %s\n", FIRMWARE_VERSION);
    Serial.printf("Build: %s %s\n", BUILD_DATE, BUILD_TIME);
    Serial.printf("Board: ESP32-C3-DevKit-Lipo\n");
    Serial.printf("Confirmations: start %u, end %u\n",
                  walkDetector.getStartConfirmationCount(),
                  walkDetector.getEndConfirmationCount());
    Serial.println();

#if MOCK_HARDWARE
    Serial.println("MOCK HARDWARE MODE ENABLED");
    Serial.println("   Use 'mock <lat> <lon>' to inject fixes");
    Serial.println();
#endif

    Serial.println("Type 'help' for commands");
    Serial.println("========================================\n");
}

/**
 * @brief Take a sample if the sampler wants one and feed the tracker
 */
static void pollLocation(uint32_t now) {
    if (!locationSampler.isDue(now, gps.getFixAgeMs(), gps.isFixUpdated())) {
        return;
    }

    PositionSample sample;
    GpsStatus status = gps.readSample(sample, locationSampler.getMaxAgeMs());

    // A fix without UTC cannot be placed on the walk timeline
    if (status != GPS_OK || sample.timestampMs == 0) {
        locationSampler.recordFailure(now);
        return;
    }

    locationSampler.recordSample(now);
    g_debugLogger.logFixIfChanged(sample.position, gps.getSatellites(), gps.getHdop());

    uint32_t evictedBefore = walkStore.getWalksEvicted();
    WalkDetector::WalkEvent event = walkTracker.processSample(sample, now);
    if (event == WalkDetector::EVENT_WALK_STARTED) {
        Serial.println("[Main] Walk started");
    } else if (event == WalkDetector::EVENT_WALK_COMPLETED) {
        Serial.println("[Main] Walk completed");
        if (walkStore.getWalksEvicted() != evictedBefore) {
            Serial.printf("[Main] History full: dropped walk %s\n", walkStore.getLastEvictedWalkId());
        }
    }
}

// ============================================================================
// Arduino Setup
// ============================================================================

void setup() {
    Serial.begin(SERIAL_BAUD_RATE);
    delay(1000);  // Allow serial to stabilize

    Serial.println("[Setup] Initializing WalkAware...");

    // Walk store and debug logs both live on LittleFS
    if (!blobStorage.begin()) {
        Serial.println("[Setup] WARNING: LittleFS unavailable - walks will not persist!");
    }

    g_logger.begin(static_cast<Logger::LogLevel>(LOG_LEVEL), true, false);
    g_logger.setClockSource(gpsClock);

    if (!g_debugLogger.begin(DebugLogger::LEVEL_INFO, DebugLogger::CAT_ALL)) {
        Serial.println("[Setup] WARNING: Debug logger initialization failed");
    }
    DEBUG_LOG_BOOT("%s v%s starting", FIRMWARE_NAME, FIRMWARE_VERSION);

    pinMode(PIN_STATUS_LED, OUTPUT);
    digitalWrite(PIN_STATUS_LED, LOW);

    // Walk store (home, zones, history, reminder settings)
    if (!walkStore.begin()) {
        LOG_ERROR("Setup: Walk store unavailable: %s", walkStore.getLastError());
        DEBUG_LOG_BOOT("Walk store initialization FAILED");
    } else {
        DEBUG_LOG_BOOT("Walk store: %u walks, %u zones, home %s",
                       (unsigned)walkStore.getWalkCount(), walkStore.getZoneCount(),
                       walkStore.hasHome() ? "set" : "not set");
    }

    // GPS receiver
    gps.setEnablePin(PIN_GPS_ENABLE);
    if (!gps.begin()) {
        LOG_ERROR("Setup: GPS initialization failed");
        DEBUG_LOG_BOOT("GPS initialization FAILED");
    }
#if MOCK_HARDWARE
    gps.mockSetEpochMs(MOCK_EPOCH_START_MS);
#endif

    // Tracker wires the detector to the store and the sampler
    if (!walkTracker.begin(millis())) {
        LOG_ERROR("Setup: Walk tracker failed: %s", walkTracker.getLastError());
    }

    serialConsole.begin();

    printBanner();
    serialConsole.printStatus();

    DEBUG_LOG_BOOT("Setup complete");
    Serial.println("[Main] Entering main loop...\n");
}

// ============================================================================
// Arduino Loop
// ============================================================================

void loop() {
    uint32_t now = millis();

    // Feed NMEA bytes to the parser
    gps.update();

    pollLocation(now);

    // Receiver profile follows the sampler (HIGH while walking, gated at home)
    gps.setAccuracyMode(locationSampler.getAccuracyMode());
    gps.setPowered(locationSampler.wantsReceiverPower());

    if (walkReminder.update(now, gps.getEpochMs())) {
        char message[64];
        walkReminder.formatMessage(message, sizeof(message));
        Serial.printf("[Reminder] %s\n", message);
    }

    // Process serial commands
    serialConsole.update();

    // Status LED: fast blink while walking, slow heartbeat at home
    static uint32_t lastStatusBlink = 0;
    static bool statusLedState = false;
    uint32_t blinkInterval = walkTracker.isWalking() ? LED_BLINK_WALKING_MS : LED_BLINK_IDLE_MS;

    if (now - lastStatusBlink >= blinkInterval) {
        lastStatusBlink = now;
        statusLedState = !statusLedState;
        digitalWrite(PIN_STATUS_LED, statusLedState ? HIGH : LOW);
    }

    g_logger.flush();

    // Small delay for stability (non-blocking)
    delay(1);
}
