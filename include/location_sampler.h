#ifndef WALKAWARE_LOCATION_SAMPLER_H
#define WALKAWARE_LOCATION_SAMPLER_H

#include <stdint.h>
#include "config.h"
#include "walk_types.h"

/**
 * @brief Sampling cadence scheduler for the GPS receiver.
 *
 * Decides when a position fix should be handed to the walk detector. Two
 * mutually exclusive modes:
 *
 *   LOW_POWER  At home. One poll immediately, then one every
 *              LOW_POWER_INTERVAL_MS. A poll accepts any fix up to
 *              GPS_LOW_POWER_MAX_AGE_MS old and gives up after
 *              GPS_LOW_POWER_TIMEOUT_MS. The receiver only needs power
 *              while a poll is open.
 *
 *   HIGH       Walking. Every fresh fix is a sample. Going
 *              GPS_HIGH_ACCURACY_TIMEOUT_MS without one is counted as a
 *              fix timeout and sampling continues.
 *
 * Pure timing logic: time is passed in as millis() values, so the
 * scheduler runs unchanged in native unit tests. Pausing stops sampling
 * only; the detector's in-progress walk is never touched.
 */
class LocationSampler {
public:
    enum SampleMode {
        SAMPLE_MODE_LOW_POWER,
        SAMPLE_MODE_HIGH
    };

    LocationSampler();

    /**
     * @brief Start in LOW_POWER mode with a poll due immediately.
     *
     * @param nowMs Current millis()
     */
    void begin(uint32_t nowMs);

    /**
     * @brief Switch cadence. Switching to the current mode is a no-op.
     *
     * Entering LOW_POWER arms an immediate poll.
     */
    void setMode(SampleMode mode, uint32_t nowMs);

    SampleMode getMode() const { return m_mode; }

    /** Accuracy profile matching the current mode. */
    AccuracyMode getAccuracyMode() const;

    /** Fix timeout of the current profile in ms. */
    uint32_t getTimeoutMs() const;

    /** Maximum acceptable fix age of the current profile in ms. */
    uint32_t getMaxAgeMs() const;

    /**
     * @brief Check whether the current fix should be sampled now.
     *
     * Advances the poll window: opens a poll when the interval elapses and
     * closes it as failed after the profile timeout. Call every loop
     * iteration, then recordSample() after a due fix was ingested.
     *
     * @param nowMs      Current millis()
     * @param fixAgeMs   Age of the receiver's last fix (UINT32_MAX if none)
     * @param fixUpdated A new fix arrived since the last sample
     * @return true if a sample should be taken now
     */
    bool isDue(uint32_t nowMs, uint32_t fixAgeMs, bool fixUpdated);

    /**
     * @brief Record that a sample was taken. Closes an open poll.
     */
    void recordSample(uint32_t nowMs);

    /**
     * @brief Record that a due fix could not be read. Closes an open poll.
     */
    void recordFailure(uint32_t nowMs);

    /** True while a LOW_POWER poll is waiting for a fix. */
    bool isPolling() const { return m_polling; }

    /** True when the receiver must be powered (HIGH, or a poll is open). */
    bool wantsReceiverPower() const;

    /** Milliseconds until the next LOW_POWER poll opens (0 if open or not LOW_POWER). */
    uint32_t getTimeUntilNextPollMs(uint32_t nowMs) const;

    void pause();
    void resume(uint32_t nowMs);
    bool isPaused() const { return m_paused; }

    static const char* getModeName(SampleMode mode);

    // Statistics
    uint32_t getSamplesTaken() const { return m_samplesTaken; }
    uint32_t getFailedPolls() const { return m_failedPolls; }
    uint32_t getFixTimeouts() const { return m_fixTimeouts; }

private:
    SampleMode m_mode;
    bool m_paused;

    // LOW_POWER poll window
    bool m_polling;              ///< Poll open, waiting for a fix
    uint32_t m_nextPollMs;       ///< millis() the next poll is scheduled for
    uint32_t m_pollStartMs;      ///< millis() the open poll started

    // HIGH fix watchdog
    uint32_t m_lastFixMs;        ///< millis() of the last sample (or mode entry)

    // Statistics
    uint32_t m_samplesTaken;
    uint32_t m_failedPolls;
    uint32_t m_fixTimeouts;

    void armMode(uint32_t nowMs);
    void closePoll(uint32_t nowMs);
};

#endif // WALKAWARE_LOCATION_SAMPLER_H
