#ifndef WALKAWARE_DEBUG_LOGGER_H
#define WALKAWARE_DEBUG_LOGGER_H

#include <Arduino.h>
#include "config.h"
#include "walk_types.h"

#if !MOCK_HARDWARE
#include <LittleFS.h>
#endif

/**
 * @brief Persistent Debug Logger for WalkAware
 *
 * Features:
 * - Persistent storage to LittleFS (survives reboots)
 * - Keeps the previous boot's log next to the current one
 * - Automatic space management (truncates when the filesystem fills)
 * - Category filtering (boot, store, GPS, walk state, console, system)
 * - Change-only logging of GPS fixes
 * - Boot cycle tracking
 *
 * Log Structure:
 * - /logs/boot_current.log - Current session
 * - /logs/boot_prev.log - Previous session
 * - /logs/boot_info.txt - Boot cycle counter
 */
class DebugLogger {
public:
    /**
     * @brief Log levels
     */
    enum LogLevel {
        LEVEL_VERBOSE = 0,  // Every fix
        LEVEL_DEBUG   = 1,  // State transitions, store writes, sampler cadence
        LEVEL_INFO    = 2,  // Boot and system events
        LEVEL_WARN    = 3,  // Warnings
        LEVEL_ERROR   = 4,  // Errors only
        LEVEL_NONE    = 5   // Disabled
    };

    /**
     * @brief Log categories for filtering
     */
    enum LogCategory {
        CAT_BOOT       = 0x01,  // Boot/initialization
        CAT_STORE      = 0x02,  // Persistent walk store
        CAT_GPS        = 0x04,  // Receiver, fixes, sampling cadence
        CAT_STATE      = 0x08,  // Walk detector transitions
        CAT_CONSOLE    = 0x10,  // Serial console commands
        CAT_SYSTEM     = 0x80,  // System events
        CAT_ALL        = 0xFF   // All categories
    };

    DebugLogger();
    ~DebugLogger();

    /**
     * @brief Initialize debug logger
     *
     * LittleFS must already be mounted.
     *
     * @param level Minimum log level
     * @param categoryMask Enabled categories (bitmask)
     * @return true if successful
     */
    bool begin(LogLevel level = LEVEL_DEBUG, uint8_t categoryMask = CAT_ALL);

    void setLevel(LogLevel level) { m_level = level; }
    LogLevel getLevel() const { return m_level; }

    void setCategoryMask(uint8_t mask) { m_categoryMask = mask; }
    uint8_t getCategoryMask() const { return m_categoryMask; }

    /**
     * @brief Log message
     *
     * @param level Log level
     * @param category Category
     * @param format Printf-style format
     * @param ... Arguments
     */
    void log(LogLevel level, LogCategory category, const char* format, ...);

    void logBoot(const char* format, ...);
    void logStore(const char* format, ...);
    void logGPS(const char* format, ...);
    void logState(const char* format, ...);
    void logConsole(const char* format, ...);
    void logSystem(const char* format, ...);

    /**
     * @brief Log a fix at VERBOSE only when it moved or on a periodic summary
     *
     * @param position Fix position
     * @param satellites Satellites in use
     * @param hdop Horizontal dilution of precision
     */
    void logFixIfChanged(const GeoPoint& position, uint32_t satellites, double hdop);

    void flush();

    const char* getCurrentLogPath() const { return CURRENT_LOG; }
    const char* getPreviousLogPath() const { return PREV_LOG; }

    size_t getLogSize();
    uint8_t getFilesystemUsage();

    /**
     * @brief Move the current log to the previous slot (call at boot)
     */
    void rotateLogs();

    uint32_t getBootCycle() const { return m_bootCycle; }

    void clearAllLogs();

    static const char* getCategoryName(LogCategory cat);
    static const char* getLevelName(LogLevel level);

private:
    // Last logged fix for change detection
    struct FixState {
        GeoPoint lastPosition;
        uint32_t unchangedCount;
        uint32_t lastLogTime;
        bool initialized;
    };

    LogLevel m_level;
    uint8_t m_categoryMask;
    bool m_initialized;
    uint32_t m_bootCycle;
#if !MOCK_HARDWARE
    File m_currentFile;
#endif
    uint32_t m_lastFlushTime;
    size_t m_writesSinceFlush;
    FixState m_fixState;

    // Constants
    static constexpr const char* LOG_DIR = "/logs";
    static constexpr const char* CURRENT_LOG = "/logs/boot_current.log";
    static constexpr const char* PREV_LOG = "/logs/boot_prev.log";
    static constexpr const char* BOOT_INFO = "/logs/boot_info.txt";
    static constexpr uint32_t FLUSH_INTERVAL_MS = 5000;    // Flush every 5 seconds
    static constexpr size_t WRITES_PER_FLUSH = 20;         // Or every 20 writes
    static constexpr uint8_t MAX_FILESYSTEM_PERCENT = 70;  // Store blob needs the rest

    // Fix logging thresholds for change detection
    static constexpr double FIX_CHANGE_THRESHOLD_KM = 0.01;        // 10 m
    static constexpr uint32_t UNCHANGED_TIME_SUMMARY_MS = 60000;   // Summary every minute

    void writeToFile(const char* message);
    void loadBootInfo();
    void saveBootInfo();

    /**
     * @brief Reclaim space: drop the previous log, then truncate the current one
     */
    void reclaimSpace();
};

// Global debug logger instance
extern DebugLogger g_debugLogger;

// Convenience macros
#define DEBUG_LOG_BOOT(...)    g_debugLogger.logBoot(__VA_ARGS__)
#define DEBUG_LOG_STORE(...)   g_debugLogger.logStore(__VA_ARGS__)
#define DEBUG_LOG_GPS(...)     g_debugLogger.logGPS(__VA_ARGS__)
#define DEBUG_LOG_STATE(...)   g_debugLogger.logState(__VA_ARGS__)
#define DEBUG_LOG_CONSOLE(...) g_debugLogger.logConsole(__VA_ARGS__)
#define DEBUG_LOG_SYSTEM(...)  g_debugLogger.logSystem(__VA_ARGS__)

#endif // WALKAWARE_DEBUG_LOGGER_H
