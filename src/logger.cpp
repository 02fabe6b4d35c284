#include "logger.h"
#include <LittleFS.h>
#include <stdarg.h>

// Global logger instance
Logger g_logger;

Logger::Logger()
    : m_level(LEVEL_INFO)
    , m_serialEnabled(true)
    , m_fileEnabled(false)
    , m_initialized(false)
    , m_clock(nullptr)
    , m_bufferHead(0)
    , m_bufferTail(0)
    , m_totalEntries(0)
    , m_sequenceCounter(0)
    , m_lastFlushTime(0)
    , m_pendingWrites(0)
{
    memset(m_buffer, 0, sizeof(m_buffer));
}

Logger::~Logger() {
    if (m_fileEnabled && m_pendingWrites > 0) {
        flush();
    }
}

bool Logger::begin(LogLevel level, bool serialEnabled, bool fileEnabled) {
    if (m_initialized) {
        return true;
    }

    m_level = level;
    m_serialEnabled = serialEnabled;
    m_fileEnabled = fileEnabled;

    if (m_fileEnabled && !LittleFS.begin(true)) {
        m_fileEnabled = false;
        if (m_serialEnabled) {
            Serial.println("[Logger] WARNING: Failed to mount LittleFS, file logging disabled");
        }
    }

    m_initialized = true;
    m_lastFlushTime = millis();

    if (m_serialEnabled) {
        Serial.printf("[Logger] Level: %s, Serial: %s, File: %s\n",
                      getLevelName(m_level),
                      m_serialEnabled ? "ON" : "OFF",
                      m_fileEnabled ? "ON" : "OFF");
    }

    return true;
}

void Logger::setLevel(LogLevel level) {
    m_level = level;
}

Logger::LogLevel Logger::getLevel() const {
    return m_level;
}

void Logger::setSerialEnabled(bool enabled) {
    m_serialEnabled = enabled;
}

void Logger::setFileEnabled(bool enabled) {
    if (enabled && !LittleFS.begin(true)) {
        return;  // Can't enable file logging without LittleFS
    }
    m_fileEnabled = enabled;
}

void Logger::setClockSource(ClockSource source) {
    m_clock = source;
}

void Logger::verbose(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LEVEL_VERBOSE, format, args);
    va_end(args);
}

void Logger::debug(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LEVEL_DEBUG, format, args);
    va_end(args);
}

void Logger::info(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LEVEL_INFO, format, args);
    va_end(args);
}

void Logger::warn(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LEVEL_WARN, format, args);
    va_end(args);
}

void Logger::error(const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(LEVEL_ERROR, format, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* format, ...) {
    va_list args;
    va_start(args, format);
    vlog(level, format, args);
    va_end(args);
}

uint32_t Logger::getEntryCount() const {
    if (m_totalEntries < LOG_BUFFER_SIZE) {
        return m_totalEntries;
    }
    return LOG_BUFFER_SIZE;
}

bool Logger::getEntry(uint32_t index, LogEntry& entry) const {
    uint32_t count = getEntryCount();
    if (index >= count) {
        return false;
    }

    uint32_t bufferIndex = (m_bufferTail + index) % LOG_BUFFER_SIZE;
    entry = m_buffer[bufferIndex];
    return true;
}

void Logger::clear() {
    m_bufferHead = 0;
    m_bufferTail = 0;
    m_totalEntries = 0;
    m_pendingWrites = 0;
    memset(m_buffer, 0, sizeof(m_buffer));
}

bool Logger::flush() {
    if (!m_fileEnabled || m_pendingWrites == 0) {
        return true;
    }

    File file = LittleFS.open(LOG_FILE_PATH, "a");
    if (!file) {
        return false;
    }

    // Entries older than the buffer were overwritten before reaching flash
    uint32_t count = getEntryCount();
    for (uint32_t i = count > m_pendingWrites ? count - m_pendingWrites : 0; i < count; i++) {
        LogEntry entry;
        if (getEntry(i, entry)) {
            writeEntry(file, entry);
        }
    }

    file.close();
    m_pendingWrites = 0;
    m_lastFlushTime = millis();

    return true;
}

void Logger::printAll() {
    Serial.println("\n========================================");
    Serial.println("Log Buffer");
    Serial.println("========================================");

    uint32_t count = getEntryCount();
    if (count == 0) {
        Serial.println("(empty)");
    } else {
        for (uint32_t i = 0; i < count; i++) {
            LogEntry entry;
            if (getEntry(i, entry)) {
                writeEntry(Serial, entry);
            }
        }
    }

    Serial.println("========================================\n");
}

const char* Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LEVEL_VERBOSE: return "VERB ";
        case LEVEL_DEBUG:   return "DEBUG";
        case LEVEL_INFO:    return "INFO ";
        case LEVEL_WARN:    return "WARN ";
        case LEVEL_ERROR:   return "ERROR";
        case LEVEL_NONE:    return "NONE ";
        default:            return "?????";
    }
}

// ============================================================================
// Private
// ============================================================================

void Logger::vlog(LogLevel level, const char* format, va_list args) {
    if (m_level > level) return;

    char buffer[128];
    vsnprintf(buffer, sizeof(buffer), format, args);
    addEntry(level, buffer);
}

void Logger::addEntry(LogLevel level, const char* message) {
    LogEntry entry;
    entry.sequenceNumber = m_sequenceCounter++;
    entry.timestamp = millis();
    entry.epochMs = m_clock ? m_clock() : 0;
    entry.level = level;
    snprintf(entry.message, sizeof(entry.message), "%s", message);

    // Add to circular buffer
    m_buffer[m_bufferHead] = entry;
    m_bufferHead = (m_bufferHead + 1) % LOG_BUFFER_SIZE;

    // If buffer is full, advance tail
    if (m_totalEntries >= LOG_BUFFER_SIZE) {
        m_bufferTail = (m_bufferTail + 1) % LOG_BUFFER_SIZE;
    }

    m_totalEntries++;
    m_pendingWrites++;

    if (m_serialEnabled) {
        writeEntry(Serial, entry);
    }

    // Flush on backlog or age, and always on errors
    if (m_fileEnabled &&
        (m_pendingWrites >= 10 ||
         level >= LEVEL_ERROR ||
         millis() - m_lastFlushTime >= LOG_FLUSH_INTERVAL)) {
        flush();
    }
}

void Logger::writeEntry(Print& out, const LogEntry& entry) {
    char timestamp[20];
    formatTimestamp(entry, timestamp, sizeof(timestamp));

    out.printf("[%s] [%s] %s\n",
               timestamp,
               getLevelName((LogLevel)entry.level),
               entry.message);
}

void Logger::formatTimestamp(const LogEntry& entry, char* buffer, size_t bufferSize) {
    if (entry.epochMs != 0) {
        uint32_t msOfDay = (uint32_t)(entry.epochMs % 86400000ULL);
        snprintf(buffer, bufferSize, "%02uZ%02u:%02u.%03u",
                 (unsigned)(msOfDay / 3600000),
                 (unsigned)((msOfDay / 60000) % 60),
                 (unsigned)((msOfDay / 1000) % 60),
                 (unsigned)(msOfDay % 1000));
        return;
    }

    uint32_t timestamp = entry.timestamp;
    uint32_t seconds = timestamp / 1000;
    uint32_t minutes = seconds / 60;
    uint32_t hours = minutes / 60;

    seconds %= 60;
    minutes %= 60;
    hours %= 24;

    snprintf(buffer, bufferSize, "%02u:%02u:%02u.%03u",
             (unsigned)hours, (unsigned)minutes, (unsigned)seconds, (unsigned)(timestamp % 1000));
}
