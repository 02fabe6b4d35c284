#include "walk_detector.h"
#include "geodesy.h"
#include "logger.h"
#include "debug_logger.h"
#include <stdio.h>
#include <string.h>
#include <utility>

WalkDetector::WalkDetector(uint8_t startConfirmationCount, uint8_t endConfirmationCount)
    : m_hasHome(false)
    , m_startConfirmationCount(startConfirmationCount)
    , m_endConfirmationCount(endConfirmationCount)
    , m_state(STATE_AT_HOME)
    , m_samplesIngested(0)
    , m_walksStarted(0)
    , m_walksCompleted(0)
    , m_falseStarts(0)
    , m_interruptedReturns(0)
{
    memset(&m_homeZone, 0, sizeof(m_homeZone));
    if (m_startConfirmationCount < 1) m_startConfirmationCount = 1;
    if (m_endConfirmationCount < 1) m_endConfirmationCount = 1;
    resetConfirmation();
}

WalkDetector::~WalkDetector() {
    if (m_currentWalk) {
        DEBUG_LOG_STATE("WalkDetector: Discarding in-progress walk %s", m_currentWalk->id);
    }
}

// ============================================================================
// Configuration
// ============================================================================

void WalkDetector::setHomeZone(const Zone& home) {
    m_homeZone = home;
    m_hasHome = true;
    DEBUG_LOG_STATE("WalkDetector: Home set to %.6f, %.6f (r=%.3f km)",
                    home.center.latitude, home.center.longitude, home.radiusKm);
}

void WalkDetector::clearHomeZone() {
    m_hasHome = false;
    DEBUG_LOG_STATE("WalkDetector: Home cleared");
}

void WalkDetector::setNamedZones(const Zone* zones, size_t count) {
    m_namedZones.clear();
    if (zones) {
        m_namedZones.assign(zones, zones + count);
    }
    DEBUG_LOG_STATE("WalkDetector: %u named zones", (unsigned)m_namedZones.size());
}

void WalkDetector::setConfirmationCounts(uint8_t startCount, uint8_t endCount) {
    m_startConfirmationCount = startCount < 1 ? 1 : startCount;
    m_endConfirmationCount = endCount < 1 ? 1 : endCount;
}

// ============================================================================
// Detection
// ============================================================================

WalkDetector::IngestResult WalkDetector::ingest(const GeoPoint& sample, uint64_t timestampMs) {
    IngestResult result = emptyResult();

    if (!m_hasHome) {
        result.error = DETECTOR_ERR_NO_HOME;
        return result;
    }

    m_samplesIngested++;

    bool outsideHome = !geoWithinRadius(sample, m_homeZone.center, m_homeZone.radiusKm);

    switch (m_state) {
        case STATE_AT_HOME:
            if (outsideHome) {
                beginConfirmation(timestampMs, &sample);
                enterState(STATE_LEAVING, "outside home radius");
            }
            break;

        case STATE_LEAVING:
            if (!outsideHome) {
                m_falseStarts++;
                resetConfirmation();
                enterState(STATE_AT_HOME, "back inside before confirmation");
                break;
            }

            m_confirmation.pendingConfirmations++;
            if (m_confirmation.pendingConfirmations >= m_startConfirmationCount) {
                result.event = EVENT_WALK_STARTED;
                result.startTime = m_confirmation.candidateStartTime;
                result.startPosition = m_confirmation.candidateStartPosition;

                openWalk(result.startTime, result.startPosition);
                resetConfirmation();
                enterState(STATE_WALKING, "departure confirmed");
            }
            break;

        case STATE_WALKING:
            accumulate(sample);
            if (!outsideHome) {
                beginConfirmation(timestampMs, nullptr);
                enterState(STATE_RETURNING, "inside home radius");
            }
            break;

        case STATE_RETURNING:
            if (outsideHome) {
                m_interruptedReturns++;
                resetConfirmation();
                enterState(STATE_WALKING, "left home radius before confirmation");
                break;
            }

            m_confirmation.pendingConfirmations++;
            if (m_confirmation.pendingConfirmations >= m_endConfirmationCount) {
                closeWalk(m_confirmation.candidateStartTime, result.completedWalk);
                result.event = EVENT_WALK_COMPLETED;
                resetConfirmation();
                enterState(STATE_AT_HOME, "arrival confirmed");
            }
            break;
    }

    return result;
}

WalkDetector::IngestResult WalkDetector::startWalk(uint64_t timestampMs, const GeoPoint& position) {
    IngestResult result = emptyResult();

    if (m_currentWalk) {
        LOG_WARN("Walk start rejected: walk %s already in progress", m_currentWalk->id);
        result.error = DETECTOR_ERR_WALK_IN_PROGRESS;
        return result;
    }

    openWalk(timestampMs, position);
    resetConfirmation();
    enterState(STATE_WALKING, "manual start");

    result.event = EVENT_WALK_STARTED;
    result.startTime = timestampMs;
    result.startPosition = position;
    return result;
}

WalkDetector::IngestResult WalkDetector::stopWalk(uint64_t timestampMs) {
    IngestResult result = emptyResult();

    if (!m_currentWalk) {
        LOG_WARN("Walk stop rejected: no walk in progress");
        result.error = DETECTOR_ERR_NO_WALK;
        return result;
    }

    // An arrival already being confirmed marks the true end of the walk
    uint64_t endTime = (m_state == STATE_RETURNING)
        ? m_confirmation.candidateStartTime
        : timestampMs;

    closeWalk(endTime, result.completedWalk);
    result.event = EVENT_WALK_COMPLETED;
    resetConfirmation();
    enterState(STATE_AT_HOME, "manual stop");
    return result;
}

void WalkDetector::reset() {
    m_currentWalk.reset();
    resetConfirmation();
    m_state = STATE_AT_HOME;
    DEBUG_LOG_STATE("WalkDetector: Reset");
}

// ============================================================================
// Names
// ============================================================================

const char* WalkDetector::getStateName(DetectionState state) {
    switch (state) {
        case STATE_AT_HOME:    return "AT_HOME";
        case STATE_LEAVING:    return "LEAVING";
        case STATE_WALKING:    return "WALKING";
        case STATE_RETURNING:  return "RETURNING";
        default:               return "UNKNOWN";
    }
}

const char* WalkDetector::getErrorName(DetectorError error) {
    switch (error) {
        case DETECTOR_OK:                    return "OK";
        case DETECTOR_ERR_NO_HOME:           return "NO_HOME";
        case DETECTOR_ERR_WALK_IN_PROGRESS:  return "WALK_IN_PROGRESS";
        case DETECTOR_ERR_NO_WALK:           return "NO_WALK";
        default:                             return "UNKNOWN";
    }
}

// ============================================================================
// Private
// ============================================================================

WalkDetector::IngestResult WalkDetector::emptyResult() {
    IngestResult result;
    result.event = EVENT_NONE;
    result.error = DETECTOR_OK;
    result.startTime = 0;
    result.startPosition.latitude = 0.0;
    result.startPosition.longitude = 0.0;
    return result;
}

void WalkDetector::enterState(DetectionState state, const char* reason) {
    if (state == m_state) {
        return;
    }

    DEBUG_LOG_STATE("WalkDetector: %s -> %s (%s)",
                    getStateName(m_state), getStateName(state), reason);
    m_state = state;
}

void WalkDetector::beginConfirmation(uint64_t timestampMs, const GeoPoint* position) {
    m_confirmation.pendingConfirmations = 1;
    m_confirmation.candidateStartTime = timestampMs;
    if (position) {
        m_confirmation.hasCandidatePosition = true;
        m_confirmation.candidateStartPosition = *position;
    } else {
        m_confirmation.hasCandidatePosition = false;
        m_confirmation.candidateStartPosition.latitude = 0.0;
        m_confirmation.candidateStartPosition.longitude = 0.0;
    }
}

void WalkDetector::resetConfirmation() {
    m_confirmation.pendingConfirmations = 0;
    m_confirmation.candidateStartTime = 0;
    m_confirmation.hasCandidatePosition = false;
    m_confirmation.candidateStartPosition.latitude = 0.0;
    m_confirmation.candidateStartPosition.longitude = 0.0;
}

void WalkDetector::openWalk(uint64_t startTime, const GeoPoint& firstPoint) {
    m_currentWalk.reset(new Walk());
    snprintf(m_currentWalk->id, sizeof(m_currentWalk->id), "walk_%llu",
             (unsigned long long)startTime);
    m_currentWalk->startTime = startTime;
    m_currentWalk->path.push_back(firstPoint);
    m_walksStarted++;

    LOG_INFO("Walk started: %s at %.6f, %.6f", m_currentWalk->id,
             firstPoint.latitude, firstPoint.longitude);
}

void WalkDetector::accumulate(const GeoPoint& sample) {
    Walk& walk = *m_currentWalk;

    // Path is seeded on open, so there is always a previous point
    walk.distanceKm += geoDistanceKm(walk.path.back(), sample);
    walk.path.push_back(sample);

    for (size_t i = 0; i < m_namedZones.size(); i++) {
        const Zone& zone = m_namedZones[i];
        if (geoWithinRadius(sample, zone.center, zone.radiusKm) && !walk.hasVisited(zone.name)) {
            walk.zonesVisited.push_back(zone.name);
            DEBUG_LOG_STATE("WalkDetector: Visited zone '%s'", zone.name);
        }
    }
}

void WalkDetector::closeWalk(uint64_t endTime, Walk& out) {
    Walk& walk = *m_currentWalk;

    walk.endTime = endTime;
    walk.durationSeconds = (endTime > walk.startTime)
        ? (uint32_t)((endTime - walk.startTime) / 1000)
        : 0;

    LOG_INFO("Walk completed: %s, %lu s, %.3f km, %u points, %u zones",
             walk.id, (unsigned long)walk.durationSeconds, walk.distanceKm,
             (unsigned)walk.path.size(), (unsigned)walk.zonesVisited.size());

    out = std::move(walk);
    m_currentWalk.reset();
    m_walksCompleted++;
}
