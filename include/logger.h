#ifndef WALKAWARE_LOGGER_H
#define WALKAWARE_LOGGER_H

#include <Arduino.h>
#include "config.h"

/**
 * @brief Logger for WalkAware
 *
 * Leveled printf-style logging with a circular buffer of recent entries,
 * serial output and optional persistence to LittleFS.
 *
 * Features:
 * - Multiple log levels (VERBOSE, DEBUG, INFO, WARN, ERROR)
 * - Circular buffer for recent logs (`logs` console command)
 * - Uptime timestamps, switched to GPS UTC once a clock source reports time
 * - Serial output
 * - Optional file logging to LittleFS (LOG_FILE_PATH)
 */
class Logger {
public:
    /**
     * @brief Log entry structure
     */
    struct LogEntry {
        uint32_t sequenceNumber;   // Monotonic entry number
        uint32_t timestamp;        // millis() when logged
        uint64_t epochMs;          // Wall-clock time, 0 if unknown
        uint8_t level;             // Log level
        char message[128];         // Log message
    };

    /**
     * @brief Log levels
     */
    enum LogLevel {
        LEVEL_VERBOSE = LOG_LEVEL_VERBOSE,
        LEVEL_DEBUG   = LOG_LEVEL_DEBUG,
        LEVEL_INFO    = LOG_LEVEL_INFO,
        LEVEL_WARN    = LOG_LEVEL_WARN,
        LEVEL_ERROR   = LOG_LEVEL_ERROR,
        LEVEL_NONE    = LOG_LEVEL_NONE
    };

    /**
     * @brief Wall-clock source, returns epoch ms or 0 if unknown
     */
    typedef uint64_t (*ClockSource)();

    Logger();
    ~Logger();

    /**
     * @brief Initialize the logger
     *
     * @param level Minimum log level to record
     * @param serialEnabled Enable serial output
     * @param fileEnabled Enable file logging (LittleFS must mount)
     * @return true if initialization successful
     */
    bool begin(LogLevel level = LEVEL_INFO, bool serialEnabled = true, bool fileEnabled = false);

    void setLevel(LogLevel level);
    LogLevel getLevel() const;

    void setSerialEnabled(bool enabled);
    void setFileEnabled(bool enabled);

    /**
     * @brief Set the wall-clock source used for timestamps
     *
     * @param source Function returning epoch ms (0 while unknown), or nullptr
     */
    void setClockSource(ClockSource source);

    void verbose(const char* format, ...);
    void debug(const char* format, ...);
    void info(const char* format, ...);
    void warn(const char* format, ...);
    void error(const char* format, ...);

    /**
     * @brief Log a message at specified level
     *
     * @param level Log level
     * @param format Printf-style format string
     * @param ... Format arguments
     */
    void log(LogLevel level, const char* format, ...);

    /**
     * @brief Get number of log entries in buffer
     */
    uint32_t getEntryCount() const;

    /**
     * @brief Get log entry by index
     *
     * @param index Index (0 = oldest, count-1 = newest)
     * @param entry Output entry
     * @return true if entry exists
     */
    bool getEntry(uint32_t index, LogEntry& entry) const;

    void clear();

    /**
     * @brief Append pending entries to LOG_FILE_PATH
     *
     * @return true if flush successful (or nothing to do)
     */
    bool flush();

    /**
     * @brief Print all buffered entries to Serial
     */
    void printAll();

    static const char* getLevelName(LogLevel level);

private:
    LogLevel m_level;                       ///< Current log level
    bool m_serialEnabled;                   ///< Serial output enabled
    bool m_fileEnabled;                     ///< File logging enabled
    bool m_initialized;                     ///< Initialization complete
    ClockSource m_clock;                    ///< Wall-clock source (may be null)

    // Circular buffer
    LogEntry m_buffer[LOG_BUFFER_SIZE];     ///< Log entry buffer
    uint32_t m_bufferHead;                  ///< Write index
    uint32_t m_bufferTail;                  ///< Read index (oldest)
    uint32_t m_totalEntries;                ///< Total entries ever logged
    uint32_t m_sequenceCounter;             ///< Next sequence number

    // File logging
    uint32_t m_lastFlushTime;               ///< Last flush time (millis)
    uint32_t m_pendingWrites;               ///< Entries pending flush

    void vlog(LogLevel level, const char* format, va_list args);
    void addEntry(LogLevel level, const char* message);
    void writeEntry(Print& out, const LogEntry& entry);

    /**
     * @brief Format "HH:MM:SS.mmm", UTC when known, else uptime
     */
    void formatTimestamp(const LogEntry& entry, char* buffer, size_t bufferSize);
};

// Global logger instance
extern Logger g_logger;

// Convenience macros
#define LOG_VERBOSE(...) g_logger.verbose(__VA_ARGS__)
#define LOG_DEBUG(...)   g_logger.debug(__VA_ARGS__)
#define LOG_INFO(...)    g_logger.info(__VA_ARGS__)
#define LOG_WARN(...)    g_logger.warn(__VA_ARGS__)
#define LOG_ERROR(...)   g_logger.error(__VA_ARGS__)

#endif // WALKAWARE_LOGGER_H
