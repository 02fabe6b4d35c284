#include "debug_logger.h"
#include "geodesy.h"
#include <stdarg.h>

// Global debug logger instance
DebugLogger g_debugLogger;

DebugLogger::DebugLogger()
    : m_level(LEVEL_DEBUG)
    , m_categoryMask(CAT_ALL)
    , m_initialized(false)
    , m_bootCycle(0)
    , m_lastFlushTime(0)
    , m_writesSinceFlush(0)
{
    m_fixState.unchangedCount = 0;
    m_fixState.lastLogTime = 0;
    m_fixState.initialized = false;
}

DebugLogger::~DebugLogger() {
    flush();
#if !MOCK_HARDWARE
    if (m_currentFile) {
        m_currentFile.close();
    }
#endif
}

bool DebugLogger::begin(LogLevel level, uint8_t categoryMask) {
    if (m_initialized) {
        return true;
    }

    m_level = level;
    m_categoryMask = categoryMask;

#if !MOCK_HARDWARE
    // LittleFS should already be mounted by main.cpp
    if (!LittleFS.begin()) {
        Serial.println("[DebugLogger] ERROR: LittleFS not mounted!");
        return false;
    }

    if (!LittleFS.exists(LOG_DIR)) {
        LittleFS.mkdir(LOG_DIR);
    }

    loadBootInfo();
    rotateLogs();

    m_bootCycle++;
    saveBootInfo();

    m_currentFile = LittleFS.open(CURRENT_LOG, "w");
    if (!m_currentFile) {
        Serial.println("[DebugLogger] ERROR: Failed to open log file!");
        return false;
    }

    m_initialized = true;

    char header[256];
    snprintf(header, sizeof(header),
             "=== BOOT CYCLE #%lu ===\n"
             "Firmware: %s v%s\n"
             "Log Level: %s\n"
             "Categories: 0x%02X\n"
             "Free Heap: %lu bytes\n"
             "Filesystem: %u%% used\n"
             "==============================\n",
             (unsigned long)m_bootCycle,
             FIRMWARE_NAME, FIRMWARE_VERSION,
             getLevelName(m_level),
             m_categoryMask,
             (unsigned long)ESP.getFreeHeap(),
             getFilesystemUsage());
    m_currentFile.print(header);
    m_currentFile.flush();

    Serial.printf("[DebugLogger] Boot cycle: #%lu\n", (unsigned long)m_bootCycle);
    Serial.printf("[DebugLogger] Log file: %s\n", CURRENT_LOG);
#else
    m_initialized = true;
    Serial.println("[DebugLogger] Initialized (MOCK MODE - no file logging)");
#endif

    return true;
}

void DebugLogger::log(LogLevel level, LogCategory category, const char* format, ...) {
    if (level < m_level) return;
    if (!(m_categoryMask & category)) return;

    va_list args;
    va_start(args, format);
    char message[256];
    vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    char logLine[320];
    snprintf(logLine, sizeof(logLine), "[%010lu] [%s] [%s] %s\n",
             (unsigned long)millis(),
             getLevelName(level),
             getCategoryName(category),
             message);

    Serial.print(logLine);

#if !MOCK_HARDWARE
    if (m_initialized && m_currentFile) {
        writeToFile(logLine);
    }
#endif
}

// Category-specific logging helpers
void DebugLogger::logBoot(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_INFO, CAT_BOOT, "%s", buffer);
}

void DebugLogger::logStore(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_DEBUG, CAT_STORE, "%s", buffer);
}

void DebugLogger::logGPS(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_DEBUG, CAT_GPS, "%s", buffer);
}

void DebugLogger::logState(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_DEBUG, CAT_STATE, "%s", buffer);
}

void DebugLogger::logConsole(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_DEBUG, CAT_CONSOLE, "%s", buffer);
}

void DebugLogger::logSystem(const char* format, ...) {
    va_list args;
    va_start(args, format);
    char buffer[256];
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    log(LEVEL_INFO, CAT_SYSTEM, "%s", buffer);
}

void DebugLogger::logFixIfChanged(const GeoPoint& position, uint32_t satellites, double hdop) {
    if (m_level > LEVEL_VERBOSE || !(m_categoryMask & CAT_GPS)) {
        return;
    }

    uint32_t now = millis();

    if (!m_fixState.initialized) {
        m_fixState.lastPosition = position;
        m_fixState.unchangedCount = 0;
        m_fixState.lastLogTime = now;
        m_fixState.initialized = true;

        log(LEVEL_VERBOSE, CAT_GPS, "Fix %.6f,%.6f sats=%lu hdop=%.1f [INITIAL]",
            position.latitude, position.longitude, (unsigned long)satellites, hdop);
        return;
    }

    double movedKm = geoDistanceKm(m_fixState.lastPosition, position);

    if (movedKm > FIX_CHANGE_THRESHOLD_KM) {
        log(LEVEL_VERBOSE, CAT_GPS, "Fix %.6f,%.6f sats=%lu hdop=%.1f [MOVED %.0f m]",
            position.latitude, position.longitude, (unsigned long)satellites, hdop,
            movedKm * 1000.0);

        m_fixState.lastPosition = position;
        m_fixState.unchangedCount = 0;
        m_fixState.lastLogTime = now;
        return;
    }

    m_fixState.unchangedCount++;

    if (now - m_fixState.lastLogTime >= UNCHANGED_TIME_SUMMARY_MS) {
        log(LEVEL_VERBOSE, CAT_GPS, "Fix unchanged (%lu fixes over %lu ms) sats=%lu hdop=%.1f",
            (unsigned long)m_fixState.unchangedCount,
            (unsigned long)(now - m_fixState.lastLogTime),
            (unsigned long)satellites, hdop);

        m_fixState.unchangedCount = 0;
        m_fixState.lastLogTime = now;
    }
}

void DebugLogger::flush() {
#if !MOCK_HARDWARE
    if (m_currentFile) {
        m_currentFile.flush();
        m_writesSinceFlush = 0;
        m_lastFlushTime = millis();
    }
#endif
}

size_t DebugLogger::getLogSize() {
#if !MOCK_HARDWARE
    if (LittleFS.exists(CURRENT_LOG)) {
        File f = LittleFS.open(CURRENT_LOG, "r");
        if (f) {
            size_t size = f.size();
            f.close();
            return size;
        }
    }
#endif
    return 0;
}

uint8_t DebugLogger::getFilesystemUsage() {
#if !MOCK_HARDWARE
    size_t total = LittleFS.totalBytes();
    size_t used = LittleFS.usedBytes();
    if (total == 0) return 0;
    return (uint8_t)((used * 100) / total);
#else
    return 0;
#endif
}

void DebugLogger::rotateLogs() {
#if !MOCK_HARDWARE
    if (m_currentFile) {
        m_currentFile.close();
    }

    if (LittleFS.exists(PREV_LOG) && !LittleFS.remove(PREV_LOG)) {
        Serial.println("[DebugLogger] WARNING: Failed to delete boot_prev.log");
    }

    if (LittleFS.exists(CURRENT_LOG)) {
        bool ok = LittleFS.rename(CURRENT_LOG, PREV_LOG);
        Serial.printf("[DebugLogger] Rotate current -> prev: %s\n", ok ? "OK" : "FAILED");
    }
#endif
}

void DebugLogger::clearAllLogs() {
#if !MOCK_HARDWARE
    if (m_currentFile) {
        m_currentFile.close();
    }

    LittleFS.remove(CURRENT_LOG);
    LittleFS.remove(PREV_LOG);
    LittleFS.remove(BOOT_INFO);

    m_bootCycle = 0;
    saveBootInfo();

    m_currentFile = LittleFS.open(CURRENT_LOG, "w");
    Serial.println("[DebugLogger] All logs cleared");
#endif
}

const char* DebugLogger::getCategoryName(LogCategory cat) {
    switch (cat) {
        case CAT_BOOT:    return "BOOT   ";
        case CAT_STORE:   return "STORE  ";
        case CAT_GPS:     return "GPS    ";
        case CAT_STATE:   return "STATE  ";
        case CAT_CONSOLE: return "CONSOLE";
        case CAT_SYSTEM:  return "SYSTEM ";
        default:          return "UNKNWN ";
    }
}

const char* DebugLogger::getLevelName(LogLevel level) {
    switch (level) {
        case LEVEL_VERBOSE: return "VERBOSE";
        case LEVEL_DEBUG:   return "DEBUG  ";
        case LEVEL_INFO:    return "INFO   ";
        case LEVEL_WARN:    return "WARN   ";
        case LEVEL_ERROR:   return "ERROR  ";
        case LEVEL_NONE:    return "NONE   ";
        default:            return "UNKNOWN";
    }
}

// ============================================================================
// Private
// ============================================================================

void DebugLogger::writeToFile(const char* message) {
#if !MOCK_HARDWARE
    if (!m_currentFile) return;

    m_currentFile.print(message);
    m_writesSinceFlush++;

    uint32_t now = millis();
    if (m_writesSinceFlush >= WRITES_PER_FLUSH ||
        (now - m_lastFlushTime) >= FLUSH_INTERVAL_MS) {
        flush();
        if (getFilesystemUsage() >= MAX_FILESYSTEM_PERCENT) {
            reclaimSpace();
        }
    }
#endif
}

void DebugLogger::loadBootInfo() {
#if !MOCK_HARDWARE
    m_bootCycle = 0;
    if (LittleFS.exists(BOOT_INFO)) {
        File f = LittleFS.open(BOOT_INFO, "r");
        if (f) {
            String line = f.readStringUntil('\n');
            m_bootCycle = (uint32_t)line.toInt();
            f.close();
        }
    }
#endif
}

void DebugLogger::saveBootInfo() {
#if !MOCK_HARDWARE
    File f = LittleFS.open(BOOT_INFO, "w");
    if (f) {
        f.println(m_bootCycle);
        f.close();
    }
#endif
}

void DebugLogger::reclaimSpace() {
#if !MOCK_HARDWARE
    if (LittleFS.exists(PREV_LOG)) {
        LittleFS.remove(PREV_LOG);
        Serial.println("[DebugLogger] Space reclaim: deleted boot_prev.log");
        return;
    }

    if (m_currentFile) {
        m_currentFile.close();
        m_currentFile = LittleFS.open(CURRENT_LOG, "w");
        if (m_currentFile) {
            m_currentFile.println("[LOG TRUNCATED - space reclaim]");
        }
    }
#endif
}
