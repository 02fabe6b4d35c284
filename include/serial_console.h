#ifndef WALKAWARE_SERIAL_CONSOLE_H
#define WALKAWARE_SERIAL_CONSOLE_H

#include <Arduino.h>
#include "config.h"
#include "walk_tracker.h"
#include "walk_reminder.h"
#include "hal_gps.h"

/**
 * @file serial_console.h
 * @brief Serial command console
 *
 * Line-based command interface over USB serial for setting home, managing
 * zones, controlling walks and browsing history.
 *
 * Command format: <command> [subcommand] [args...]
 *
 * Examples:
 *   help                    - Show available commands
 *   home                    - Set home from the current fix
 *   zone add Park 150       - Add a 150 m zone at the current fix
 *   walk start              - Start a walk manually
 *   history                 - List recorded walks
 *   notify 6                - Remind after 6 hours without a walk
 */
class SerialConsole {
public:
    /**
     * @param tracker Walk tracker (engine, store and sampler)
     * @param reminder Walk reminder (status display)
     * @param gps GPS receiver, used to take fixes for home/zone/walk commands
     */
    SerialConsole(WalkTracker& tracker, WalkReminder& reminder, HAL_GPS& gps);

    bool begin();

    /**
     * @brief Process incoming serial data
     *
     * Call this in the main loop. Accumulates characters until newline,
     * then runs the command.
     */
    void update();

    /**
     * @brief Run one command line (also used by tests and scripts)
     */
    void processLine(const char* line);

    void printHelp();
    void printStatus();

private:
    WalkTracker& m_tracker;
    WalkReminder& m_reminder;
    HAL_GPS& m_gps;
    bool m_initialized;

    // Input buffer
    static const size_t BUFFER_SIZE = 128;
    char m_inputBuffer[BUFFER_SIZE];
    size_t m_inputPos;

    // Command parsing
    static const size_t MAX_ARGS = 6;
    char* m_args[MAX_ARGS];
    size_t m_argCount;

    size_t parseArgs(char* line);
    void executeCommand(const char* cmd, size_t argc, char** argv);

    // Command handlers
    void cmdHome(size_t argc, char** argv);
    void cmdZones();
    void cmdZone(size_t argc, char** argv);
    void cmdWalk(size_t argc, char** argv);
    void cmdHistory();
    void cmdNotify(size_t argc, char** argv);
    void cmdSave();
    void cmdLoad();
    void cmdReset();
#if MOCK_HARDWARE
    void cmdMock(size_t argc, char** argv);
#endif

    /**
     * @brief Take a fix for a command, printing the failure if there is none
     *
     * @return true if `out` holds a usable fix
     */
    bool takeFix(PositionSample& out);

    /**
     * @brief Parse a coordinate argument in degrees
     */
    static bool parseCoordinate(const char* text, double min, double max, double& out);

    void printWalk(const Walk& walk, uint64_t nowMs);
};

#endif // WALKAWARE_SERIAL_CONSOLE_H
