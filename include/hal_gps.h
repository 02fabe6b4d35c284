#ifndef WALKAWARE_HAL_GPS_H
#define WALKAWARE_HAL_GPS_H

#include <Arduino.h>
#include <TinyGPSPlus.h>
#include "config.h"
#include "walk_types.h"

/**
 * @brief GPS receiver sampling status
 */
enum GpsStatus {
    GPS_OK,              ///< Sample delivered
    GPS_NO_FIX,          ///< Receiver talking but no fix (or fix too old)
    GPS_TIMEOUT,         ///< No acceptable fix within the profile timeout
    GPS_NOT_DETECTED     ///< No NMEA data from the receiver at all
};

/**
 * @brief Hardware Abstraction Layer for an NMEA GPS receiver
 *
 * Feeds the UART byte stream into TinyGPSPlus and turns its fixes into
 * timestamped PositionSamples. Wall-clock time is taken from the receiver's
 * UTC date/time and carried forward with millis() between fixes.
 *
 * Supports an optional enable pin that power-gates the receiver between
 * low-power polls, and a mock mode for bench testing without a receiver.
 *
 * Technical Notes:
 * - Any NMEA-0183 receiver at GPS_BAUD_RATE (NEO-6M, L76K, ATGM336H)
 * - Cold start fix: ~30s, warm start: ~1-5s
 * - Fix age and "updated" flags come from TinyGPSPlus location
 */
class HAL_GPS {
public:
    /**
     * @brief Construct a new HAL_GPS object
     *
     * @param serial UART connected to the receiver
     * @param rxPin ESP32 RX pin (receiver TX)
     * @param txPin ESP32 TX pin (receiver RX)
     * @param mock_mode True to enable mock/simulation mode for testing
     */
    HAL_GPS(HardwareSerial* serial, uint8_t rxPin, uint8_t txPin, bool mock_mode = false);

    ~HAL_GPS();

    /**
     * @brief Assign the GPIO pin that powers the receiver
     *
     * Must be called before begin().
     *
     * @param pin GPIO number, or PIN_GPS_ENABLE_NONE (0xFF) if always on
     */
    void setEnablePin(uint8_t pin);

    /**
     * @brief Initialize UART and power the receiver
     *
     * @return true if initialization successful
     */
    bool begin();

    /**
     * @brief Feed pending NMEA bytes to the parser (call every loop)
     */
    void update();

    /**
     * @brief Power the receiver on or off
     *
     * No-op without an enable pin. A receiver that was off needs a few
     * seconds for a hot fix.
     */
    void setPowered(bool on);

    bool isPowered() const { return m_powered; }

    /**
     * @brief Select the accuracy profile
     *
     * HIGH keeps the receiver powered. LOW_POWER leaves power control to
     * the caller (setPowered()) so it can be gated between polls.
     */
    void setAccuracyMode(AccuracyMode mode);

    AccuracyMode getAccuracyMode() const { return m_accuracyMode; }

    // =========================================================================
    // Fix Status
    // =========================================================================

    /**
     * @brief Check whether the receiver has produced any NMEA data
     */
    bool isDetected() const;

    /**
     * @brief Check for a valid location fix
     */
    bool hasFix() const;

    /**
     * @brief Get age of the last location fix
     *
     * @return Milliseconds since the fix, UINT32_MAX if none
     */
    uint32_t getFixAgeMs() const;

    /**
     * @brief Check whether a new fix arrived since the last sample
     */
    bool isFixUpdated();

    uint32_t getSatellites();
    double getHdop();

    /**
     * @brief Current wall-clock time
     *
     * @return Epoch ms derived from GPS UTC, or 0 if never received
     */
    uint64_t getEpochMs() const;

    bool hasTime() const { return m_timeAnchored; }

    // =========================================================================
    // Sampling
    // =========================================================================

    /**
     * @brief Read the current fix as a sample
     *
     * @param out Receives position, timestamp and accuracy mode
     * @param maxAgeMs Oldest acceptable fix (0 = fresh fix only)
     * @return GpsStatus GPS_OK, GPS_NO_FIX or GPS_NOT_DETECTED
     */
    GpsStatus readSample(PositionSample& out, uint32_t maxAgeMs);

    /**
     * @brief One-shot blocking position request
     *
     * Powers the receiver and pumps the parser until an acceptable fix
     * arrives or the timeout elapses. Restores the previous power state.
     *
     * @param out Receives the sample
     * @param timeoutMs Maximum wait
     * @param maxAgeMs Oldest acceptable fix
     * @return GpsStatus GPS_OK, GPS_TIMEOUT or GPS_NOT_DETECTED
     */
    GpsStatus requestCurrentPosition(PositionSample& out, uint32_t timeoutMs, uint32_t maxAgeMs);

    static const char* getStatusName(GpsStatus status);

    // =========================================================================
    // Mock Interface
    // =========================================================================

    bool isMockMode() const { return m_mockMode; }

    /**
     * @brief Inject a fresh mock fix (mock mode only)
     */
    void mockSetPosition(double latitude, double longitude);

    /**
     * @brief Drop the mock fix (mock mode only)
     */
    void mockClearFix();

    /**
     * @brief Set mock wall-clock time (mock mode only)
     */
    void mockSetEpochMs(uint64_t epochMs);

    // Statistics
    uint32_t getCharsProcessed() const;
    uint32_t getSamplesRead() const { return m_samplesRead; }
    uint32_t getReadFailures() const { return m_readFailures; }

private:
    HardwareSerial* m_serial;
    TinyGPSPlus m_gps;
    uint8_t m_rxPin;
    uint8_t m_txPin;
    uint8_t m_enablePin;
    bool m_mockMode;
    bool m_initialized;
    bool m_powered;
    AccuracyMode m_accuracyMode;
    uint32_t m_powerOnTime;         ///< millis() when power was last applied
    bool m_warnedSilent;            ///< "no data" warning already logged

    // UTC anchor: epoch ms observed at millis() m_anchorMillis
    bool m_timeAnchored;
    uint64_t m_anchorEpochMs;
    uint32_t m_anchorMillis;

    // Mock fix
    bool m_mockFixValid;
    bool m_mockFixUpdated;
    GeoPoint m_mockPosition;
    uint32_t m_mockFixTime;

    uint32_t m_samplesRead;
    uint32_t m_readFailures;

    /**
     * @brief Refresh the UTC anchor from TinyGPSPlus date/time
     */
    void updateTimeAnchor();
};

#endif // WALKAWARE_HAL_GPS_H
