#ifndef WALKAWARE_WALK_DETECTOR_H
#define WALKAWARE_WALK_DETECTOR_H

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include <vector>
#include "config.h"
#include "walk_types.h"

/**
 * @brief Walk Detection Engine
 *
 * Consumes a stream of noisy GPS samples and decides, with debounced
 * confidence, when the dog leaves and returns to the home geofence.
 * Between those two moments it owns the in-progress Walk and accumulates
 * path, distance and visited zones into it.
 *
 * ## States
 *
 * - AT_HOME:   inside the home radius, no walk
 * - LEAVING:   outside the home radius, counting start confirmations
 * - WALKING:   walk in progress, every sample is accumulated
 * - RETURNING: walk in progress, inside the home radius, counting end confirmations
 *
 * WALKING/RETURNING always have an in-progress walk; AT_HOME/LEAVING never do.
 *
 * ## Debounce
 *
 * A walk starts only after startConfirmationCount consecutive samples
 * outside the home radius (default 3) and ends only after
 * endConfirmationCount consecutive samples inside it (default 2). A single
 * GPS jump across the fence never starts or ends a walk.
 *
 * The reported start is the first sample of the leaving run. The reported
 * end is the first sample of the returning run, not the sample that
 * confirmed it.
 *
 * ## Usage
 *
 * ```cpp
 * WalkDetector detector;
 * detector.setHomeZone(home);
 * detector.setNamedZones(zones, zoneCount);
 *
 * WalkDetector::IngestResult r = detector.ingest(sample.position, sample.timestampMs);
 * if (r.event == WalkDetector::EVENT_WALK_COMPLETED) {
 *     store.addWalk(r.completedWalk);
 * }
 * ```
 *
 * Not thread-safe. One ingest() must finish before the next begins.
 */
class WalkDetector {
public:
    /**
     * @brief Detection states
     */
    enum DetectionState {
        STATE_AT_HOME,      ///< Inside home radius, no walk
        STATE_LEAVING,      ///< Confirming a departure
        STATE_WALKING,      ///< Walk in progress
        STATE_RETURNING     ///< Confirming an arrival
    };

    /**
     * @brief Events produced by ingest(), startWalk() and stopWalk()
     */
    enum WalkEvent {
        EVENT_NONE,             ///< No transition committed
        EVENT_WALK_STARTED,     ///< Walk confirmed (or manually started)
        EVENT_WALK_COMPLETED    ///< Walk finalized, see IngestResult::completedWalk
    };

    /**
     * @brief Precondition violations (operation is a no-op)
     */
    enum DetectorError {
        DETECTOR_OK,                    ///< No error
        DETECTOR_ERR_NO_HOME,           ///< ingest() without a home zone
        DETECTOR_ERR_WALK_IN_PROGRESS,  ///< startWalk() while a walk is active
        DETECTOR_ERR_NO_WALK            ///< stopWalk() with no active walk
    };

    /**
     * @brief Confirmation accumulator
     *
     * Reset whenever a transition completes or reverts.
     */
    struct Confirmation {
        uint8_t pendingConfirmations;       ///< Consecutive qualifying samples
        uint64_t candidateStartTime;        ///< Timestamp of the first sample in the run
        bool hasCandidatePosition;          ///< Position recorded (leaving runs only)
        GeoPoint candidateStartPosition;    ///< Position of the first leaving sample
    };

    /**
     * @brief Result of a single detector call
     */
    struct IngestResult {
        WalkEvent event;            ///< Committed event, EVENT_NONE if none
        DetectorError error;        ///< DETECTOR_OK unless the call was rejected
        uint64_t startTime;         ///< EVENT_WALK_STARTED: walk start (epoch ms)
        GeoPoint startPosition;     ///< EVENT_WALK_STARTED: first path point
        Walk completedWalk;         ///< EVENT_WALK_COMPLETED: finalized walk (ownership passes to caller)
    };

    /**
     * @brief Construct a new Walk Detector
     *
     * @param startConfirmationCount Consecutive outside samples to confirm a start
     * @param endConfirmationCount Consecutive inside samples to confirm an end
     */
    WalkDetector(uint8_t startConfirmationCount = WALK_START_CONFIRMATION_COUNT,
                 uint8_t endConfirmationCount = WALK_END_CONFIRMATION_COUNT);

    ~WalkDetector();

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @brief Set the home geofence
     *
     * @param home Home zone (copied)
     */
    void setHomeZone(const Zone& home);

    /**
     * @brief Forget the home geofence
     *
     * Further ingest() calls are rejected until a new home is set.
     */
    void clearHomeZone();

    bool hasHomeZone() const { return m_hasHome; }
    const Zone& getHomeZone() const { return m_homeZone; }

    /**
     * @brief Replace the named zones checked while walking
     *
     * @param zones Array of zones (copied)
     * @param count Number of zones
     */
    void setNamedZones(const Zone* zones, size_t count);

    size_t getNamedZoneCount() const { return m_namedZones.size(); }

    /**
     * @brief Change debounce thresholds
     *
     * Takes effect on the next ingest(). Values below 1 are clamped to 1.
     */
    void setConfirmationCounts(uint8_t startCount, uint8_t endCount);

    uint8_t getStartConfirmationCount() const { return m_startConfirmationCount; }
    uint8_t getEndConfirmationCount() const { return m_endConfirmationCount; }

    // =========================================================================
    // Detection
    // =========================================================================

    /**
     * @brief Ingest one position sample
     *
     * Updates state, confirmation accumulator and the in-progress walk.
     * Never throws; coordinates are not validated.
     *
     * @param sample Reported position
     * @param timestampMs Epoch ms of the sample
     * @return IngestResult Committed event, or DETECTOR_ERR_NO_HOME
     */
    IngestResult ingest(const GeoPoint& sample, uint64_t timestampMs);

    /**
     * @brief Start a walk manually, bypassing departure detection
     *
     * Seeds the walk with a single path point and forces WALKING.
     * Any pending departure confirmation is discarded.
     *
     * @param timestampMs Walk start (epoch ms)
     * @param position First path point
     * @return IngestResult EVENT_WALK_STARTED, or DETECTOR_ERR_WALK_IN_PROGRESS
     */
    IngestResult startWalk(uint64_t timestampMs, const GeoPoint& position);

    /**
     * @brief Finish the in-progress walk manually
     *
     * End time is timestampMs, or the first arrival sample if an arrival
     * is already being confirmed.
     *
     * @param timestampMs Time the stop was requested (epoch ms)
     * @return IngestResult EVENT_WALK_COMPLETED, or DETECTOR_ERR_NO_WALK
     */
    IngestResult stopWalk(uint64_t timestampMs);

    /**
     * @brief Drop all detection state and any in-progress walk
     */
    void reset();

    // =========================================================================
    // Status
    // =========================================================================

    DetectionState getState() const { return m_state; }

    /**
     * @brief Get state name as string
     *
     * @param state Detection state
     * @return const char* State name
     */
    static const char* getStateName(DetectionState state);

    const char* getStateName() const { return getStateName(m_state); }

    /**
     * @brief Get error name as string
     */
    static const char* getErrorName(DetectorError error);

    /**
     * @brief Check if a walk is in progress
     *
     * @return true in WALKING or RETURNING
     */
    bool isWalking() const { return m_currentWalk != nullptr; }

    /**
     * @brief Get the in-progress walk
     *
     * @return const Walk* Walk, or nullptr when none is in progress
     */
    const Walk* getCurrentWalk() const { return m_currentWalk.get(); }

    const Confirmation& getConfirmation() const { return m_confirmation; }
    uint8_t getPendingConfirmations() const { return m_confirmation.pendingConfirmations; }

    // Statistics
    uint32_t getSamplesIngested() const { return m_samplesIngested; }
    uint32_t getWalksStarted() const { return m_walksStarted; }
    uint32_t getWalksCompleted() const { return m_walksCompleted; }
    uint32_t getFalseStarts() const { return m_falseStarts; }
    uint32_t getInterruptedReturns() const { return m_interruptedReturns; }

private:
    // Configuration
    Zone m_homeZone;                    ///< Home geofence (valid when m_hasHome)
    bool m_hasHome;                     ///< Home geofence configured
    std::vector<Zone> m_namedZones;     ///< Zones recorded in zonesVisited
    uint8_t m_startConfirmationCount;   ///< Samples to confirm departure
    uint8_t m_endConfirmationCount;     ///< Samples to confirm arrival

    // State
    DetectionState m_state;             ///< Current detection state
    Confirmation m_confirmation;        ///< Pending confirmation run
    std::unique_ptr<Walk> m_currentWalk;///< In-progress walk (WALKING/RETURNING only)

    // Statistics
    uint32_t m_samplesIngested;         ///< Accepted ingest() calls
    uint32_t m_walksStarted;            ///< Walks opened (detected or manual)
    uint32_t m_walksCompleted;          ///< Walks finalized
    uint32_t m_falseStarts;             ///< LEAVING runs that fell back to AT_HOME
    uint32_t m_interruptedReturns;      ///< RETURNING runs that fell back to WALKING

    static IngestResult emptyResult();

    void enterState(DetectionState state, const char* reason);
    void beginConfirmation(uint64_t timestampMs, const GeoPoint* position);
    void resetConfirmation();

    /**
     * @brief Create the in-progress walk seeded with one path point
     */
    void openWalk(uint64_t startTime, const GeoPoint& firstPoint);

    /**
     * @brief Append a sample to the in-progress walk
     *
     * Adds the segment length to distanceKm and records every named zone
     * containing the sample.
     */
    void accumulate(const GeoPoint& sample);

    /**
     * @brief Finalize the in-progress walk and release it
     *
     * @param endTime Walk end (epoch ms)
     * @param out Receives the finalized walk
     */
    void closeWalk(uint64_t endTime, Walk& out);
};

#endif // WALKAWARE_WALK_DETECTOR_H
