#include "serial_console.h"
#include "walk_format.h"
#include "logger.h"
#include "debug_logger.h"
#include <cstring>
#include <cstdlib>

SerialConsole::SerialConsole(WalkTracker& tracker, WalkReminder& reminder, HAL_GPS& gps)
    : m_tracker(tracker)
    , m_reminder(reminder)
    , m_gps(gps)
    , m_initialized(false)
    , m_inputPos(0)
    , m_argCount(0)
{
    memset(m_inputBuffer, 0, sizeof(m_inputBuffer));
    memset(m_args, 0, sizeof(m_args));
}

bool SerialConsole::begin() {
    if (m_initialized) {
        return true;
    }

    m_initialized = true;
    DEBUG_LOG_CONSOLE("SerialConsole: Initialized");
    return true;
}

void SerialConsole::update() {
    if (!m_initialized) {
        return;
    }

    while (Serial.available()) {
        char c = Serial.read();

        // Handle backspace
        if (c == '\b' || c == 127) {
            if (m_inputPos > 0) {
                m_inputPos--;
            }
            continue;
        }

        if (c == '\n' || c == '\r') {
            if (m_inputPos > 0) {
                m_inputBuffer[m_inputPos] = '\0';
                processLine(m_inputBuffer);
                m_inputPos = 0;
                memset(m_inputBuffer, 0, sizeof(m_inputBuffer));
            }
            continue;
        }

        if (m_inputPos < BUFFER_SIZE - 1) {
            m_inputBuffer[m_inputPos++] = c;
        }
    }
}

void SerialConsole::processLine(const char* line) {
    if (!line || line[0] == '\0') {
        return;
    }

    // strtok needs a writable copy
    char workBuffer[BUFFER_SIZE];
    snprintf(workBuffer, sizeof(workBuffer), "%s", line);

    m_argCount = parseArgs(workBuffer);
    if (m_argCount == 0) {
        return;
    }

    DEBUG_LOG_CONSOLE("SerialConsole: > %s", line);
    executeCommand(m_args[0], m_argCount - 1, &m_args[1]);
}

size_t SerialConsole::parseArgs(char* line) {
    size_t count = 0;
    char* token = strtok(line, " \t");

    while (token != nullptr && count < MAX_ARGS) {
        m_args[count++] = token;
        token = strtok(nullptr, " \t");
    }

    return count;
}

void SerialConsole::executeCommand(const char* cmd, size_t argc, char** argv) {
    char cmdLower[16];
    size_t len = strlen(cmd);
    if (len >= sizeof(cmdLower)) len = sizeof(cmdLower) - 1;
    for (size_t i = 0; i < len; i++) {
        cmdLower[i] = tolower(cmd[i]);
    }
    cmdLower[len] = '\0';

    if (strcmp(cmdLower, "help") == 0 || strcmp(cmdLower, "?") == 0) {
        printHelp();
    }
    else if (strcmp(cmdLower, "status") == 0) {
        printStatus();
    }
    else if (strcmp(cmdLower, "home") == 0) {
        cmdHome(argc, argv);
    }
    else if (strcmp(cmdLower, "zones") == 0) {
        cmdZones();
    }
    else if (strcmp(cmdLower, "zone") == 0) {
        cmdZone(argc, argv);
    }
    else if (strcmp(cmdLower, "walk") == 0) {
        cmdWalk(argc, argv);
    }
    else if (strcmp(cmdLower, "history") == 0) {
        cmdHistory();
    }
    else if (strcmp(cmdLower, "notify") == 0) {
        cmdNotify(argc, argv);
    }
    else if (strcmp(cmdLower, "save") == 0) {
        cmdSave();
    }
    else if (strcmp(cmdLower, "load") == 0) {
        cmdLoad();
    }
    else if (strcmp(cmdLower, "reset") == 0) {
        cmdReset();
    }
    else if (strcmp(cmdLower, "logs") == 0) {
        g_logger.printAll();
    }
#if MOCK_HARDWARE
    else if (strcmp(cmdLower, "mock") == 0) {
        cmdMock(argc, argv);
    }
#endif
    else {
        Serial.printf("Unknown command: %s\n", cmd);
        Serial.println("Type 'help' for available commands");
    }
}

// ============================================================================
// Command Handlers
// ============================================================================

void SerialConsole::printHelp() {
    Serial.println("\n========================================");
    Serial.println("Available Commands");
    Serial.println("========================================");
    Serial.println();
    Serial.println("General:");
    Serial.println("  help                      Show this help");
    Serial.println("  status                    Show tracker status");
    Serial.println("  logs                      Show recent log entries");
    Serial.println();
    Serial.println("Zones:");
    Serial.println("  home [lat lon]            Set home (current fix if no position)");
    Serial.println("  zones                     List home and named zones");
    Serial.println("  zone add <name> <radius_m> [color]");
    Serial.println("                            Add a zone at the current fix");
    Serial.println("  zone del <id>             Delete a named zone");
    Serial.println();
    Serial.println("Walks:");
    Serial.println("  walk start                Start a walk at the current fix");
    Serial.println("  walk stop                 Stop the walk in progress");
    Serial.println("  walk del <id>             Delete a walk from history");
    Serial.println("  history                   List recorded walks");
    Serial.println();
    Serial.println("Reminder:");
    Serial.println("  notify on|off             Enable/disable the walk reminder");
    Serial.println("  notify <hours>            Remind after 1-12 hours without a walk");
    Serial.println();
    Serial.println("Storage:");
    Serial.println("  save                      Write the store to flash");
    Serial.println("  load                      Reload the store from flash");
    Serial.println("  reset                     Erase home, zones, walks and settings");
#if MOCK_HARDWARE
    Serial.println();
    Serial.println("Mock GPS:");
    Serial.println("  mock <lat> <lon>          Inject a fix");
    Serial.println("  mock nofix                Drop the fix");
    Serial.println("  mock time <epoch_ms>      Set the UTC clock");
#endif
    Serial.println();
    Serial.print("Zone colors:");
    for (uint8_t i = 0; i < ZONE_PALETTE_SIZE; i++) {
        Serial.printf(" %s", WalkStore::getPaletteColor(i));
    }
    Serial.println("\n");
}

void SerialConsole::printStatus() {
    WalkDetector* detector = m_tracker.getDetector();
    WalkStore* store = m_tracker.getStore();
    LocationSampler* sampler = m_tracker.getSampler();
    uint32_t now = millis();
    uint64_t epochMs = m_gps.getEpochMs();
    char buf[48];

    Serial.println("\n========================================");
    Serial.println("WalkAware Status");
    Serial.println("========================================");
    Serial.printf("Firmware: %s v%s\n", FIRMWARE_NAME, FIRMWARE_VERSION);
    formatDuration(now / 1000, DURATION_SHORT, buf, sizeof(buf));
    Serial.printf("Uptime: %s\n", buf);
    Serial.printf("Free Heap: %lu bytes\n", (unsigned long)ESP.getFreeHeap());

    Serial.println("\nGPS:");
    Serial.printf("  Receiver: %s, %s\n",
                  m_gps.isDetected() ? "detected" : "NOT DETECTED",
                  m_gps.isPowered() ? "powered" : "power-gated");
    if (m_gps.hasFix()) {
        Serial.printf("  Fix: age %lu ms, %lu sats, hdop %.1f\n",
                      (unsigned long)m_gps.getFixAgeMs(),
                      (unsigned long)m_gps.getSatellites(),
                      m_gps.getHdop());
    } else {
        Serial.println("  Fix: none");
    }
    if (epochMs != 0) {
        formatTimestamp(epochMs, buf, sizeof(buf));
        Serial.printf("  UTC: %s\n", buf);
    } else {
        Serial.println("  UTC: unknown");
    }

    Serial.println("\nSampling:");
    Serial.printf("  Mode: %s%s\n", LocationSampler::getModeName(sampler->getMode()),
                  sampler->isPaused() ? " (paused)" : "");
    if (sampler->getMode() == LocationSampler::SAMPLE_MODE_LOW_POWER) {
        Serial.printf("  Next poll: %lu s%s\n",
                      (unsigned long)(sampler->getTimeUntilNextPollMs(now) / 1000),
                      sampler->isPolling() ? " (polling now)" : "");
    }
    Serial.printf("  Samples: %lu taken, %lu failed polls, %lu fix timeouts\n",
                  (unsigned long)sampler->getSamplesTaken(),
                  (unsigned long)sampler->getFailedPolls(),
                  (unsigned long)sampler->getFixTimeouts());

    Serial.println("\nDetection:");
    Serial.printf("  State: %s (pending %u)\n", detector->getStateName(),
                  detector->getPendingConfirmations());
    if (store->hasHome()) {
        const Zone& home = store->getHomeZone();
        Serial.printf("  Home: %.6f, %.6f (%.0f m)\n",
                      home.center.latitude, home.center.longitude, home.radiusKm * 1000.0);
    } else {
        Serial.println("  Home: NOT SET");
    }
    Serial.printf("  Zones: %u\n", store->getZoneCount());
    Serial.printf("  False starts: %lu, interrupted returns: %lu\n",
                  (unsigned long)detector->getFalseStarts(),
                  (unsigned long)detector->getInterruptedReturns());

    const Walk* current = detector->getCurrentWalk();
    if (current) {
        Serial.println("\nCurrent Walk:");
        printWalk(*current, epochMs);
    }

    Serial.println("\nHistory:");
    Serial.printf("  Walks: %u\n", (unsigned)store->getWalkCount());
    const Walk* last = store->getLastWalk();
    if (last) {
        formatTimeSince(epochMs, last->endTime, buf, sizeof(buf));
        Serial.printf("  Last walk: %s ago\n", buf[0] ? buf : "?");
    }

    const NotificationSettings& settings = store->getNotificationSettings();
    Serial.printf("  Reminder: %s, %u hours (%lu sent)\n",
                  settings.enabled ? "on" : "off", settings.hours,
                  (unsigned long)m_reminder.getReminderCount());
    Serial.printf("  Store: %lu saves, %lu failures\n",
                  (unsigned long)store->getSaveCount(),
                  (unsigned long)store->getSaveFailures());
    if (store->isLoadFailed()) {
        Serial.println("  Store file unreadable: saving disabled ('load' to retry, 'reset' to erase)");
    }
    if (store->getWalksEvicted() > 0) {
        Serial.printf("  History full: %lu walks dropped (last %s)\n",
                      (unsigned long)store->getWalksEvicted(), store->getLastEvictedWalkId());
    }
    Serial.println("========================================\n");
}

void SerialConsole::cmdHome(size_t argc, char** argv) {
    if (m_tracker.isWalking()) {
        Serial.println("Cannot move home during a walk");
        return;
    }

    GeoPoint position;

    if (argc >= 2) {
        if (!parseCoordinate(argv[0], -90.0, 90.0, position.latitude) ||
            !parseCoordinate(argv[1], -180.0, 180.0, position.longitude)) {
            Serial.println("Usage: home [lat lon]");
            return;
        }
    } else {
        PositionSample sample;
        if (!takeFix(sample)) {
            return;
        }
        position = sample.position;
    }

    if (m_tracker.setHome(position)) {
        Serial.printf("Home set to %.6f, %.6f\n", position.latitude, position.longitude);
    } else {
        Serial.printf("Home set but not saved: %s\n", m_tracker.getLastError());
    }
}

void SerialConsole::cmdZones() {
    WalkStore* store = m_tracker.getStore();

    if (store->hasHome()) {
        const Zone& home = store->getHomeZone();
        Serial.printf("  %-20s %-12s %.6f, %.6f  %4.0f m  %s\n",
                      home.id, home.name, home.center.latitude, home.center.longitude,
                      home.radiusKm * 1000.0, home.color);
    } else {
        Serial.println("  (home not set)");
    }

    for (uint8_t i = 0; i < store->getZoneCount(); i++) {
        const Zone* zone = store->getZone(i);
        Serial.printf("  %-20s %-12s %.6f, %.6f  %4.0f m  %s\n",
                      zone->id, zone->name, zone->center.latitude, zone->center.longitude,
                      zone->radiusKm * 1000.0, zone->color);
    }
}

void SerialConsole::cmdZone(size_t argc, char** argv) {
    if (argc >= 3 && strcmp(argv[0], "add") == 0) {
        char* end = nullptr;
        double radiusM = strtod(argv[2], &end);
        if (end == argv[2] || *end != '\0' || radiusM <= 0.0) {
            Serial.println("Radius must be a positive number of meters");
            return;
        }

        const char* color = argc >= 4 ? argv[3] : nullptr;

        PositionSample sample;
        if (!takeFix(sample)) {
            return;
        }

        const Zone* zone = m_tracker.addZone(argv[1], sample.position,
                                             (float)(radiusM / 1000.0), color,
                                             m_gps.getEpochMs());
        if (zone) {
            Serial.printf("Zone %s (%s) added\n", zone->id, zone->name);
        } else {
            Serial.printf("Zone not added: %s\n", m_tracker.getLastError());
        }
        return;
    }

    if (argc >= 2 && strcmp(argv[0], "del") == 0) {
        if (m_tracker.deleteZone(argv[1])) {
            Serial.printf("Zone %s deleted\n", argv[1]);
        } else {
            Serial.printf("Zone not deleted: %s\n", m_tracker.getLastError());
        }
        return;
    }

    Serial.println("Usage: zone add <name> <radius_m> [color] | zone del <id>");
}

void SerialConsole::cmdWalk(size_t argc, char** argv) {
    if (argc >= 1 && strcmp(argv[0], "start") == 0) {
        if (m_tracker.isWalking()) {
            Serial.println("Walk already in progress");
            return;
        }

        PositionSample sample;
        if (!takeFix(sample)) {
            return;
        }

        if (m_tracker.startWalk(sample, millis())) {
            Serial.printf("Walk %s started\n", m_tracker.getDetector()->getCurrentWalk()->id);
        } else {
            Serial.printf("Walk not started: %s\n", m_tracker.getLastError());
        }
        return;
    }

    if (argc >= 1 && strcmp(argv[0], "stop") == 0) {
        if (!m_tracker.isWalking()) {
            Serial.println("No walk in progress");
            return;
        }

        uint64_t epochMs = m_gps.getEpochMs();
        if (epochMs == 0) {
            Serial.println("No UTC time from GPS yet");
            return;
        }

        uint32_t evictedBefore = m_tracker.getStore()->getWalksEvicted();
        bool saved = m_tracker.stopWalk(epochMs, millis());
        if (m_tracker.getStore()->getWalksEvicted() != evictedBefore) {
            Serial.printf("History full: dropped walk %s\n",
                          m_tracker.getStore()->getLastEvictedWalkId());
        }

        if (saved) {
            const Walk* last = m_tracker.getStore()->getLastWalk();
            if (last) {
                printWalk(*last, epochMs);
            }
        } else {
            Serial.printf("Walk stop: %s\n", m_tracker.getLastError());
        }
        return;
    }

    if (argc >= 2 && strcmp(argv[0], "del") == 0) {
        WalkStore* store = m_tracker.getStore();
        if (store->deleteWalk(argv[1])) {
            Serial.printf("Walk %s deleted\n", argv[1]);
        } else {
            Serial.printf("Walk not deleted: %s\n", store->getLastError());
        }
        return;
    }

    Serial.println("Usage: walk start | walk stop | walk del <id>");
}

void SerialConsole::cmdHistory() {
    const std::vector<Walk>& walks = m_tracker.getStore()->getWalks();

    if (walks.empty()) {
        Serial.println("No walks recorded");
        return;
    }

    uint64_t epochMs = m_gps.getEpochMs();

    // Newest first
    for (size_t i = walks.size(); i > 0; i--) {
        printWalk(walks[i - 1], epochMs);
    }
    Serial.printf("%u walk(s)\n", (unsigned)walks.size());
}

void SerialConsole::cmdNotify(size_t argc, char** argv) {
    WalkStore* store = m_tracker.getStore();
    NotificationSettings settings = store->getNotificationSettings();

    if (argc < 1) {
        Serial.printf("Reminder: %s, %u hours\n", settings.enabled ? "on" : "off", settings.hours);
        Serial.println("Usage: notify on|off|<hours>");
        return;
    }

    if (strcmp(argv[0], "on") == 0) {
        settings.enabled = true;
    } else if (strcmp(argv[0], "off") == 0) {
        settings.enabled = false;
    } else {
        char* end = nullptr;
        long hours = strtol(argv[0], &end, 10);
        if (end == argv[0] || *end != '\0' || hours < REMINDER_MIN_HOURS || hours > REMINDER_MAX_HOURS) {
            Serial.printf("Hours must be %d-%d\n", REMINDER_MIN_HOURS, REMINDER_MAX_HOURS);
            return;
        }
        settings.hours = (uint8_t)hours;
    }

    if (store->setNotificationSettings(settings)) {
        Serial.printf("Reminder: %s, %u hours\n", settings.enabled ? "on" : "off", settings.hours);
    } else {
        Serial.printf("Reminder not saved: %s\n", store->getLastError());
    }
}

void SerialConsole::cmdSave() {
    WalkStore* store = m_tracker.getStore();
    if (store->save()) {
        Serial.println("Store saved");
    } else {
        Serial.printf("Failed to save: %s\n", store->getLastError());
    }
}

void SerialConsole::cmdLoad() {
    if (m_tracker.reload()) {
        Serial.println("Store loaded");
    } else {
        Serial.printf("Failed to load: %s\n", m_tracker.getLastError());
    }
}

void SerialConsole::cmdReset() {
    Serial.println("Erasing home, zones, walks and settings...");
    if (m_tracker.factoryReset(millis())) {
        Serial.println("Store reset to defaults");
    } else {
        Serial.printf("Failed to reset: %s\n", m_tracker.getLastError());
    }
}

#if MOCK_HARDWARE
void SerialConsole::cmdMock(size_t argc, char** argv) {
    if (argc >= 1 && strcmp(argv[0], "nofix") == 0) {
        m_gps.mockClearFix();
        Serial.println("Mock fix cleared");
        return;
    }

    if (argc >= 2 && strcmp(argv[0], "time") == 0) {
        char* end = nullptr;
        unsigned long long epochMs = strtoull(argv[1], &end, 10);
        if (end == argv[1] || *end != '\0' || epochMs == 0) {
            Serial.println("Usage: mock time <epoch_ms>");
            return;
        }
        m_gps.mockSetEpochMs((uint64_t)epochMs);
        Serial.printf("Mock clock set to %llu\n", epochMs);
        return;
    }

    GeoPoint position;
    if (argc < 2 ||
        !parseCoordinate(argv[0], -90.0, 90.0, position.latitude) ||
        !parseCoordinate(argv[1], -180.0, 180.0, position.longitude)) {
        Serial.println("Usage: mock <lat> <lon> | mock nofix | mock time <epoch_ms>");
        return;
    }

    m_gps.mockSetPosition(position.latitude, position.longitude);
    Serial.printf("Mock fix %.6f, %.6f\n", position.latitude, position.longitude);
}
#endif

// ============================================================================
// Helpers
// ============================================================================

bool SerialConsole::takeFix(PositionSample& out) {
    Serial.println("Waiting for GPS fix...");

    GpsStatus status = m_gps.requestCurrentPosition(out, GPS_HIGH_ACCURACY_TIMEOUT_MS,
                                                    GPS_LOW_POWER_MAX_AGE_MS);
    if (status != GPS_OK) {
        Serial.printf("No fix: %s\n", HAL_GPS::getStatusName(status));
        return false;
    }

    if (out.timestampMs == 0) {
        Serial.println("No UTC time from GPS yet");
        return false;
    }

    return true;
}

bool SerialConsole::parseCoordinate(const char* text, double min, double max, double& out) {
    char* end = nullptr;
    double value = strtod(text, &end);
    if (end == text || *end != '\0' || value < min || value > max) {
        return false;
    }
    out = value;
    return true;
}

void SerialConsole::printWalk(const Walk& walk, uint64_t nowMs) {
    char when[24];
    char duration[24];
    char distance[16];

    formatTimestamp(walk.startTime, when, sizeof(when));
    formatDistance(walk.distanceKm, distance, sizeof(distance));

    if (walk.isComplete()) {
        formatDuration(walk.durationSeconds, DURATION_LONG, duration, sizeof(duration));
    } else {
        uint32_t elapsed = (nowMs > walk.startTime) ? (uint32_t)((nowMs - walk.startTime) / 1000) : 0;
        formatDuration(elapsed, DURATION_LONG, duration, sizeof(duration));
    }

    Serial.printf("  %s  %s  %s  %s  %u pts%s\n",
                  walk.id, when, duration, distance, (unsigned)walk.path.size(),
                  walk.isComplete() ? "" : "  (in progress)");

    if (!walk.zonesVisited.empty()) {
        Serial.print("    zones:");
        for (size_t i = 0; i < walk.zonesVisited.size(); i++) {
            Serial.printf(" %s", walk.zonesVisited[i].c_str());
        }
        Serial.println();
    }
}
