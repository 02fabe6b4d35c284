#include "walk_tracker.h"
#include "logger.h"
#include "debug_logger.h"
#include <stdio.h>
#include <string.h>
#include <utility>

WalkTracker::WalkTracker(WalkDetector* detector, WalkStore* store, LocationSampler* sampler)
    : m_detector(detector)
    , m_store(store)
    , m_sampler(sampler)
    , m_samplesProcessed(0)
    , m_samplesIgnored(0)
    , m_walksSaved(0)
    , m_walkSaveFailures(0)
{
    memset(m_lastError, 0, sizeof(m_lastError));
}

WalkTracker::~WalkTracker() {
    if (m_detector && m_detector->isWalking()) {
        LOG_WARN("WalkTracker: Destroyed with walk in progress");
    }
}

bool WalkTracker::begin(uint32_t nowMs) {
    if (!m_detector || !m_store || !m_sampler) {
        setError("Tracker components not initialized");
        DEBUG_LOG_STATE("WalkTracker: %s", m_lastError);
        return false;
    }

    syncConfiguration();
    m_sampler->begin(nowMs);

    if (!m_store->hasHome()) {
        LOG_WARN("WalkTracker: No home set - use 'home' to set it from the current fix");
    }

    DEBUG_LOG_STATE("WalkTracker: Initialized (state %s)", m_detector->getStateName());
    return true;
}

WalkDetector::WalkEvent WalkTracker::processSample(const PositionSample& sample, uint32_t nowMs) {
    WalkDetector::IngestResult result = m_detector->ingest(sample.position, sample.timestampMs);

    if (result.error != WalkDetector::DETECTOR_OK) {
        m_samplesIgnored++;
        DEBUG_LOG_STATE("WalkTracker: Sample ignored (%s)",
                        WalkDetector::getErrorName(result.error));
        return WalkDetector::EVENT_NONE;
    }

    m_samplesProcessed++;
    handleResult(result, nowMs);
    return result.event;
}

bool WalkTracker::startWalk(const PositionSample& at, uint32_t nowMs) {
    WalkDetector::IngestResult result = m_detector->startWalk(at.timestampMs, at.position);

    if (result.error != WalkDetector::DETECTOR_OK) {
        setError("Walk already in progress");
        return false;
    }

    handleResult(result, nowMs);
    return true;
}

bool WalkTracker::stopWalk(uint64_t epochMs, uint32_t nowMs) {
    WalkDetector::IngestResult result = m_detector->stopWalk(epochMs);

    if (result.error != WalkDetector::DETECTOR_OK) {
        setError("No walk in progress");
        return false;
    }

    uint32_t failuresBefore = m_walkSaveFailures;
    handleResult(result, nowMs);
    return m_walkSaveFailures == failuresBefore;
}

bool WalkTracker::setHome(const GeoPoint& position) {
    if (m_detector->isWalking()) {
        setError("Cannot move home during a walk");
        return false;
    }

    bool saved = m_store->setHome(position);
    // Home applies immediately even if the blob could not be written
    m_detector->setHomeZone(m_store->getHomeZone());

    if (!saved) {
        setError(m_store->getLastError());
    }
    return saved;
}

const Zone* WalkTracker::addZone(const char* name, const GeoPoint& center, float radiusKm,
                                 const char* color, uint64_t epochMs) {
    const Zone* zone = m_store->addZone(name, center, radiusKm, color, epochMs);
    if (!zone) {
        setError(m_store->getLastError());
        return nullptr;
    }

    m_detector->setNamedZones(m_store->getZones(), m_store->getZoneCount());
    return zone;
}

bool WalkTracker::deleteZone(const char* id) {
    bool existed = m_store->findZone(id) != nullptr;
    bool saved = m_store->deleteZone(id);

    if (existed) {
        m_detector->setNamedZones(m_store->getZones(), m_store->getZoneCount());
    }

    if (!saved) {
        setError(m_store->getLastError());
    }
    return saved;
}

bool WalkTracker::factoryReset(uint32_t nowMs) {
    LOG_WARN("WalkTracker: Factory reset");

    m_detector->reset();
    bool saved = m_store->reset(true);
    syncConfiguration();
    m_sampler->setMode(LocationSampler::SAMPLE_MODE_LOW_POWER, nowMs);

    if (!saved) {
        setError(m_store->getLastError());
    }
    return saved;
}

bool WalkTracker::reload() {
    if (m_detector->isWalking()) {
        setError("Cannot load during a walk");
        return false;
    }

    if (!m_store->load()) {
        setError(m_store->getLastError());
        return false;
    }

    syncConfiguration();
    LOG_INFO("WalkTracker: Store reloaded");
    return true;
}

void WalkTracker::syncConfiguration() {
    if (m_store->hasHome()) {
        m_detector->setHomeZone(m_store->getHomeZone());
    } else {
        m_detector->clearHomeZone();
    }

    m_detector->setNamedZones(m_store->getZones(), m_store->getZoneCount());
}

// ============================================================================
// Private
// ============================================================================

void WalkTracker::handleResult(WalkDetector::IngestResult& result, uint32_t nowMs) {
    switch (result.event) {
        case WalkDetector::EVENT_WALK_STARTED:
            m_sampler->setMode(LocationSampler::SAMPLE_MODE_HIGH, nowMs);
            break;

        case WalkDetector::EVENT_WALK_COMPLETED: {
            char walkId[WALK_ID_MAX_LEN];
            snprintf(walkId, sizeof(walkId), "%s", result.completedWalk.id);

            if (m_store->addWalk(std::move(result.completedWalk))) {
                m_walksSaved++;
            } else {
                // Kept in RAM history when only the write failed
                m_walkSaveFailures++;
                setError(m_store->getLastError());
                LOG_ERROR("WalkTracker: Walk %s not saved: %s", walkId, m_lastError);
            }

            m_sampler->setMode(LocationSampler::SAMPLE_MODE_LOW_POWER, nowMs);
            break;
        }

        case WalkDetector::EVENT_NONE:
            break;
    }
}

void WalkTracker::setError(const char* error) {
    snprintf(m_lastError, sizeof(m_lastError), "%s", error);
}
