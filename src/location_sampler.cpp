#include "location_sampler.h"
#include "logger.h"
#include "debug_logger.h"

// millis() wraps every ~49 days; compare through a signed difference
static bool timeReached(uint32_t nowMs, uint32_t targetMs) {
    return (int32_t)(nowMs - targetMs) >= 0;
}

LocationSampler::LocationSampler()
    : m_mode(SAMPLE_MODE_LOW_POWER)
    , m_paused(false)
    , m_polling(false)
    , m_nextPollMs(0)
    , m_pollStartMs(0)
    , m_lastFixMs(0)
    , m_samplesTaken(0)
    , m_failedPolls(0)
    , m_fixTimeouts(0)
{
}

void LocationSampler::begin(uint32_t nowMs) {
    m_mode = SAMPLE_MODE_LOW_POWER;
    m_paused = false;
    armMode(nowMs);

    DEBUG_LOG_GPS("LocationSampler: Initialized (poll every %us, timeout %us, max age %us)",
        (unsigned)(LOW_POWER_INTERVAL_MS / 1000),
        (unsigned)(GPS_LOW_POWER_TIMEOUT_MS / 1000),
        (unsigned)(GPS_LOW_POWER_MAX_AGE_MS / 1000));
}

void LocationSampler::setMode(SampleMode mode, uint32_t nowMs) {
    if (mode == m_mode) {
        return;
    }

    DEBUG_LOG_GPS("LocationSampler: %s -> %s", getModeName(m_mode), getModeName(mode));
    m_mode = mode;
    armMode(nowMs);
}

AccuracyMode LocationSampler::getAccuracyMode() const {
    return m_mode == SAMPLE_MODE_HIGH ? ACCURACY_HIGH : ACCURACY_LOW_POWER;
}

uint32_t LocationSampler::getTimeoutMs() const {
    return m_mode == SAMPLE_MODE_HIGH ? GPS_HIGH_ACCURACY_TIMEOUT_MS : GPS_LOW_POWER_TIMEOUT_MS;
}

uint32_t LocationSampler::getMaxAgeMs() const {
    return m_mode == SAMPLE_MODE_HIGH ? GPS_HIGH_ACCURACY_MAX_AGE_MS : GPS_LOW_POWER_MAX_AGE_MS;
}

bool LocationSampler::isDue(uint32_t nowMs, uint32_t fixAgeMs, bool fixUpdated) {
    if (m_paused) {
        return false;
    }

    if (m_mode == SAMPLE_MODE_HIGH) {
        // Max age 0: only a fix that arrived since the last sample counts
        if (fixUpdated) {
            return true;
        }

        if (nowMs - m_lastFixMs >= GPS_HIGH_ACCURACY_TIMEOUT_MS) {
            m_fixTimeouts++;
            m_lastFixMs = nowMs;
            LOG_WARN("GPS: No fix for %us while walking", (unsigned)(GPS_HIGH_ACCURACY_TIMEOUT_MS / 1000));
        }
        return false;
    }

    if (!m_polling) {
        if (!timeReached(nowMs, m_nextPollMs)) {
            return false;
        }
        m_polling = true;
        m_pollStartMs = nowMs;
        DEBUG_LOG_GPS("LocationSampler: Poll opened");
    }

    if (fixAgeMs <= GPS_LOW_POWER_MAX_AGE_MS) {
        return true;
    }

    if (nowMs - m_pollStartMs >= GPS_LOW_POWER_TIMEOUT_MS) {
        m_failedPolls++;
        LOG_WARN("GPS: Low-power poll timed out after %us", (unsigned)(GPS_LOW_POWER_TIMEOUT_MS / 1000));
        closePoll(nowMs);
    }
    return false;
}

void LocationSampler::recordSample(uint32_t nowMs) {
    m_samplesTaken++;
    m_lastFixMs = nowMs;

    if (m_polling) {
        closePoll(nowMs);
    }
}

void LocationSampler::recordFailure(uint32_t nowMs) {
    if (m_mode == SAMPLE_MODE_HIGH) {
        return;
    }

    m_failedPolls++;
    if (m_polling) {
        closePoll(nowMs);
    }
}

bool LocationSampler::wantsReceiverPower() const {
    if (m_paused) {
        return false;
    }
    return m_mode == SAMPLE_MODE_HIGH || m_polling;
}

uint32_t LocationSampler::getTimeUntilNextPollMs(uint32_t nowMs) const {
    if (m_mode != SAMPLE_MODE_LOW_POWER || m_polling || timeReached(nowMs, m_nextPollMs)) {
        return 0;
    }
    return m_nextPollMs - nowMs;
}

void LocationSampler::pause() {
    if (m_paused) {
        return;
    }

    m_paused = true;
    m_polling = false;
    DEBUG_LOG_GPS("LocationSampler: Paused");
}

void LocationSampler::resume(uint32_t nowMs) {
    if (!m_paused) {
        return;
    }

    m_paused = false;
    armMode(nowMs);
    DEBUG_LOG_GPS("LocationSampler: Resumed in %s", getModeName(m_mode));
}

const char* LocationSampler::getModeName(SampleMode mode) {
    switch (mode) {
        case SAMPLE_MODE_LOW_POWER:  return "LOW_POWER";
        case SAMPLE_MODE_HIGH:       return "HIGH";
        default:                     return "UNKNOWN";
    }
}

void LocationSampler::armMode(uint32_t nowMs) {
    m_polling = false;
    m_lastFixMs = nowMs;
    m_nextPollMs = nowMs;  // LOW_POWER polls once immediately
}

void LocationSampler::closePoll(uint32_t nowMs) {
    m_polling = false;
    m_nextPollMs += LOW_POWER_INTERVAL_MS;
    if (timeReached(nowMs, m_nextPollMs)) {
        m_nextPollMs = nowMs + LOW_POWER_INTERVAL_MS;
    }
}
