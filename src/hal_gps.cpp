#include "hal_gps.h"
#include "utc_time.h"
#include "logger.h"
#include "debug_logger.h"

HAL_GPS::HAL_GPS(HardwareSerial* serial, uint8_t rxPin, uint8_t txPin, bool mock_mode)
    : m_serial(serial)
    , m_rxPin(rxPin)
    , m_txPin(txPin)
    , m_enablePin(PIN_GPS_ENABLE_NONE)
    , m_mockMode(mock_mode)
    , m_initialized(false)
    , m_powered(false)
    , m_accuracyMode(ACCURACY_LOW_POWER)
    , m_powerOnTime(0)
    , m_warnedSilent(false)
    , m_timeAnchored(false)
    , m_anchorEpochMs(0)
    , m_anchorMillis(0)
    , m_mockFixValid(false)
    , m_mockFixUpdated(false)
    , m_mockFixTime(0)
    , m_samplesRead(0)
    , m_readFailures(0)
{
    m_mockPosition.latitude = 0.0;
    m_mockPosition.longitude = 0.0;
}

HAL_GPS::~HAL_GPS() {
    setPowered(false);
}

void HAL_GPS::setEnablePin(uint8_t pin) {
    m_enablePin = pin;
}

bool HAL_GPS::begin() {
    if (m_initialized) {
        return true;
    }

    DEBUG_LOG_GPS("HAL_GPS: Initializing...");

    if (!m_mockMode) {
        if (!m_serial) {
            LOG_ERROR("HAL_GPS: No UART assigned");
            return false;
        }

        if (m_enablePin != PIN_GPS_ENABLE_NONE) {
            pinMode(m_enablePin, OUTPUT);
            DEBUG_LOG_GPS("HAL_GPS: Enable pin GPIO%d configured", m_enablePin);
        }

        m_serial->begin(GPS_BAUD_RATE, SERIAL_8N1, m_rxPin, m_txPin);
        DEBUG_LOG_GPS("HAL_GPS: UART RX=%d TX=%d @ %d baud", m_rxPin, m_txPin, GPS_BAUD_RATE);
    } else {
        DEBUG_LOG_GPS("HAL_GPS: MOCK MODE - Simulating receiver");
    }

    m_initialized = true;
    setPowered(true);

    DEBUG_LOG_GPS("HAL_GPS: Initialization complete");
    return true;
}

void HAL_GPS::update() {
    if (!m_initialized || m_mockMode) {
        return;
    }

    while (m_serial->available() > 0) {
        m_gps.encode(m_serial->read());
    }

    if (m_gps.time.isUpdated() || m_gps.date.isUpdated()) {
        updateTimeAnchor();
    }

    if (m_powered && !m_warnedSilent && m_gps.charsProcessed() == 0 &&
        millis() - m_powerOnTime > GPS_DETECT_TIMEOUT_MS) {
        LOG_WARN("HAL_GPS: No data from receiver after %us - check wiring",
                 (unsigned)(GPS_DETECT_TIMEOUT_MS / 1000));
        m_warnedSilent = true;
    }
}

void HAL_GPS::setPowered(bool on) {
    if (on == m_powered) {
        return;
    }

    m_powered = on;
    if (on) {
        m_powerOnTime = millis();
    }

    if (!m_mockMode && m_enablePin != PIN_GPS_ENABLE_NONE) {
        digitalWrite(m_enablePin, on ? HIGH : LOW);
    }

    DEBUG_LOG_GPS("HAL_GPS: Receiver %s", on ? "powered" : "power-gated");
}

void HAL_GPS::setAccuracyMode(AccuracyMode mode) {
    if (mode == m_accuracyMode) {
        return;
    }

    m_accuracyMode = mode;
    if (mode == ACCURACY_HIGH) {
        setPowered(true);
    }

    LOG_INFO("GPS: %s accuracy", mode == ACCURACY_HIGH ? "High" : "Low-power");
}

// ============================================================================
// Fix Status
// ============================================================================

bool HAL_GPS::isDetected() const {
    if (m_mockMode) {
        return true;
    }
    return m_gps.charsProcessed() > 0;
}

bool HAL_GPS::hasFix() const {
    if (m_mockMode) {
        return m_mockFixValid;
    }
    return m_gps.location.isValid();
}

uint32_t HAL_GPS::getFixAgeMs() const {
    if (m_mockMode) {
        return m_mockFixValid ? millis() - m_mockFixTime : UINT32_MAX;
    }
    return m_gps.location.isValid() ? m_gps.location.age() : UINT32_MAX;
}

bool HAL_GPS::isFixUpdated() {
    if (m_mockMode) {
        return m_mockFixValid && m_mockFixUpdated;
    }
    return m_gps.location.isUpdated();
}

uint32_t HAL_GPS::getSatellites() {
    if (m_mockMode) {
        return m_mockFixValid ? 8 : 0;
    }
    return m_gps.satellites.isValid() ? m_gps.satellites.value() : 0;
}

double HAL_GPS::getHdop() {
    if (m_mockMode) {
        return 1.0;
    }
    return m_gps.hdop.isValid() ? m_gps.hdop.hdop() : 99.9;
}

uint64_t HAL_GPS::getEpochMs() const {
    if (!m_timeAnchored) {
        return 0;
    }
    return m_anchorEpochMs + (uint32_t)(millis() - m_anchorMillis);
}

// ============================================================================
// Sampling
// ============================================================================

GpsStatus HAL_GPS::readSample(PositionSample& out, uint32_t maxAgeMs) {
    if (!isDetected()) {
        m_readFailures++;
        return GPS_NOT_DETECTED;
    }

    if (!hasFix()) {
        m_readFailures++;
        return GPS_NO_FIX;
    }

    // Max age 0 means "fresh fix only"
    bool acceptable = (maxAgeMs == 0) ? isFixUpdated() : (getFixAgeMs() <= maxAgeMs);
    if (!acceptable) {
        m_readFailures++;
        return GPS_NO_FIX;
    }

    if (m_mockMode) {
        out.position = m_mockPosition;
        m_mockFixUpdated = false;
    } else {
        // Reading lat/lng clears the TinyGPSPlus "updated" flag
        out.position.latitude = m_gps.location.lat();
        out.position.longitude = m_gps.location.lng();
    }

    out.timestampMs = getEpochMs();
    out.accuracyMode = m_accuracyMode;
    m_samplesRead++;

    if (out.timestampMs == 0) {
        LOG_WARN("HAL_GPS: Fix without UTC time, sample stamped 0");
    }

    DEBUG_LOG_GPS("HAL_GPS: Sample %.6f, %.6f (sats=%u, hdop=%.1f)",
                  out.position.latitude, out.position.longitude,
                  (unsigned)getSatellites(), getHdop());
    return GPS_OK;
}

GpsStatus HAL_GPS::requestCurrentPosition(PositionSample& out, uint32_t timeoutMs, uint32_t maxAgeMs) {
    bool wasPowered = m_powered;
    setPowered(true);

    uint32_t start = millis();
    GpsStatus status = GPS_TIMEOUT;

    while (millis() - start < timeoutMs) {
        update();
        bool ready = hasFix() && ((maxAgeMs == 0) ? isFixUpdated() : (getFixAgeMs() <= maxAgeMs));
        if (ready && readSample(out, maxAgeMs) == GPS_OK) {
            status = GPS_OK;
            break;
        }
        delay(20);
    }

    if (status != GPS_OK) {
        status = isDetected() ? GPS_TIMEOUT : GPS_NOT_DETECTED;
        LOG_WARN("HAL_GPS: Position request failed: %s", getStatusName(status));
    }

    if (!wasPowered && m_accuracyMode != ACCURACY_HIGH) {
        setPowered(false);
    }

    return status;
}

const char* HAL_GPS::getStatusName(GpsStatus status) {
    switch (status) {
        case GPS_OK:            return "OK";
        case GPS_NO_FIX:        return "NO_FIX";
        case GPS_TIMEOUT:       return "TIMEOUT";
        case GPS_NOT_DETECTED:  return "NOT_DETECTED";
        default:                return "UNKNOWN";
    }
}

// ============================================================================
// Mock Interface
// ============================================================================

void HAL_GPS::mockSetPosition(double latitude, double longitude) {
    if (!m_mockMode) {
        DEBUG_LOG_GPS("HAL_GPS: mockSetPosition() called but mock mode not enabled");
        return;
    }

    m_mockPosition.latitude = latitude;
    m_mockPosition.longitude = longitude;
    m_mockFixValid = true;
    m_mockFixUpdated = true;
    m_mockFixTime = millis();
    DEBUG_LOG_GPS("HAL_GPS: MOCK - Fix set to %.6f, %.6f", latitude, longitude);
}

void HAL_GPS::mockClearFix() {
    if (!m_mockMode) {
        DEBUG_LOG_GPS("HAL_GPS: mockClearFix() called but mock mode not enabled");
        return;
    }

    m_mockFixValid = false;
    m_mockFixUpdated = false;
    DEBUG_LOG_GPS("HAL_GPS: MOCK - Fix cleared");
}

void HAL_GPS::mockSetEpochMs(uint64_t epochMs) {
    if (!m_mockMode) {
        DEBUG_LOG_GPS("HAL_GPS: mockSetEpochMs() called but mock mode not enabled");
        return;
    }

    m_anchorEpochMs = epochMs;
    m_anchorMillis = millis();
    m_timeAnchored = true;
}

uint32_t HAL_GPS::getCharsProcessed() const {
    return m_gps.charsProcessed();
}

// ============================================================================
// Private
// ============================================================================

void HAL_GPS::updateTimeAnchor() {
    if (!m_gps.date.isValid() || !m_gps.time.isValid()) {
        return;
    }

    UtcDateTime utc;
    utc.year = m_gps.date.year();
    utc.month = m_gps.date.month();
    utc.day = m_gps.date.day();
    utc.hour = m_gps.time.hour();
    utc.minute = m_gps.time.minute();
    utc.second = m_gps.time.second();
    utc.millisecond = (uint16_t)m_gps.time.centisecond() * 10;

    // Receivers report 2000-01-00 (or similar) until the almanac is in
    if (utc.year < 2020) {
        return;
    }

    uint64_t epochMs = utcToEpochMs(utc);
    if (epochMs == 0) {
        return;
    }

    bool firstSync = !m_timeAnchored;
    m_anchorEpochMs = epochMs + m_gps.time.age();
    m_anchorMillis = millis();
    m_timeAnchored = true;

    if (firstSync) {
        LOG_INFO("GPS: UTC time acquired %04u-%02u-%02u %02u:%02u:%02u",
                 (unsigned)utc.year, (unsigned)utc.month, (unsigned)utc.day,
                 (unsigned)utc.hour, (unsigned)utc.minute, (unsigned)utc.second);
    }
}
