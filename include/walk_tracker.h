#ifndef WALKAWARE_WALK_TRACKER_H
#define WALKAWARE_WALK_TRACKER_H

#include <stdint.h>
#include "config.h"
#include "walk_types.h"
#include "walk_detector.h"
#include "walk_store.h"
#include "location_sampler.h"

/**
 * @brief Walk Tracker
 *
 * Application-level coordinator. Feeds position samples to the detector
 * and reacts to the events it returns:
 *
 * - WalkStarted:   sampler switches to HIGH accuracy
 * - WalkCompleted: walk is persisted to the store, sampler returns to LOW_POWER
 *
 * Also routes configuration changes (home, zones, factory reset) to both
 * the store and the detector so the two never disagree.
 *
 * Time is passed in: epoch ms for walk records, millis() for the sampler.
 */
class WalkTracker {
public:
    /**
     * @brief Construct a new Walk Tracker
     *
     * @param detector Detection engine
     * @param store Persistent store
     * @param sampler Sampling cadence scheduler
     */
    WalkTracker(WalkDetector* detector, WalkStore* store, LocationSampler* sampler);

    ~WalkTracker();

    /**
     * @brief Load detector configuration from the store and start sampling
     *
     * @param nowMs Current millis()
     * @return true if initialization successful
     */
    bool begin(uint32_t nowMs);

    /**
     * @brief Hand one sample to the detector and act on the result
     *
     * @param sample Position sample
     * @param nowMs Current millis()
     * @return WalkDetector::WalkEvent Event committed by this sample
     */
    WalkDetector::WalkEvent processSample(const PositionSample& sample, uint32_t nowMs);

    /**
     * @brief Start a walk manually at the given position
     *
     * @return true if a walk was started
     */
    bool startWalk(const PositionSample& at, uint32_t nowMs);

    /**
     * @brief Stop the in-progress walk manually and persist it
     *
     * @param epochMs Current epoch ms
     * @param nowMs Current millis()
     * @return true if a walk was stopped and saved
     */
    bool stopWalk(uint64_t epochMs, uint32_t nowMs);

    /**
     * @brief Set home at a position (store + detector)
     *
     * Refused while a walk is in progress, since home is the end target.
     */
    bool setHome(const GeoPoint& position);

    /**
     * @brief Add a named zone (store + detector)
     *
     * @return const Zone* New zone, or nullptr if rejected
     */
    const Zone* addZone(const char* name, const GeoPoint& center, float radiusKm,
                        const char* color, uint64_t epochMs);

    /**
     * @brief Delete a named zone (store + detector)
     */
    bool deleteZone(const char* id);

    /**
     * @brief Factory reset: drop any walk in progress, wipe the store
     */
    bool factoryReset(uint32_t nowMs);

    /**
     * @brief Re-read the store from flash and apply it to the detector
     *
     * Refused while a walk is in progress.
     */
    bool reload();

    /**
     * @brief Push home and zones from the store into the detector
     */
    void syncConfiguration();

    bool isWalking() const { return m_detector->isWalking(); }

    WalkDetector* getDetector() const { return m_detector; }
    WalkStore* getStore() const { return m_store; }
    LocationSampler* getSampler() const { return m_sampler; }

    // Statistics
    uint32_t getSamplesProcessed() const { return m_samplesProcessed; }
    uint32_t getSamplesIgnored() const { return m_samplesIgnored; }
    uint32_t getWalksSaved() const { return m_walksSaved; }
    uint32_t getWalkSaveFailures() const { return m_walkSaveFailures; }

    /**
     * @brief Get last error message
     */
    const char* getLastError() const { return m_lastError; }

private:
    WalkDetector* m_detector;
    WalkStore* m_store;
    LocationSampler* m_sampler;

    uint32_t m_samplesProcessed;    ///< Samples accepted by the detector
    uint32_t m_samplesIgnored;      ///< Samples dropped (no home set)
    uint32_t m_walksSaved;          ///< Completed walks persisted
    uint32_t m_walkSaveFailures;    ///< Completed walks that failed to persist

    char m_lastError[128];

    /**
     * @brief Act on a detector result
     */
    void handleResult(WalkDetector::IngestResult& result, uint32_t nowMs);

    void setError(const char* error);
};

#endif // WALKAWARE_WALK_TRACKER_H
