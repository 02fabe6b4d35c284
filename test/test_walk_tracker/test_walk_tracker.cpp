/**
 * @file test_walk_tracker.cpp
 * @brief Integration tests: detector + store + sampler through WalkTracker
 *
 * Home is a 50 m circle at (0,0). "Park" is a 50 m zone ~333 m north.
 * Samples are 10 s apart; millis() and epoch advance together.
 */

#include <unity.h>
#include <string.h>
#include "config.h"
#include "walk_types.h"
#include "walk_tracker.h"
#include "memory_blob_storage.h"

#include "../../src/geodesy.cpp"
#include "../../src/walk_detector.cpp"
#include "../../src/walk_store.cpp"
#include "../../src/location_sampler.cpp"
#include "../../src/walk_tracker.cpp"

// Satisfy the extern Logger g_logger declared in the shadow logger.h
Logger g_logger;

#define T0          1700000000000ULL
#define STEP_MS     10000
#define PARK_LAT    0.003

static MemoryBlobStorage* storage = nullptr;
static WalkStore* store = nullptr;
static WalkDetector* detector = nullptr;
static LocationSampler* sampler = nullptr;
static WalkTracker* tracker = nullptr;

static GeoPoint point(double lat, double lon) {
    GeoPoint p;
    p.latitude = lat;
    p.longitude = lon;
    return p;
}

static PositionSample sampleAt(double lat, uint32_t step) {
    PositionSample sample;
    sample.position = point(lat, 0.0);
    sample.timestampMs = T0 + (uint64_t)step * STEP_MS;
    sample.accuracyMode = sampler->getAccuracyMode();
    return sample;
}

static WalkDetector::WalkEvent feed(double lat, uint32_t step) {
    return tracker->processSample(sampleAt(lat, step), step * STEP_MS);
}

static void setUpTracker(bool withHome) {
    storage = new MemoryBlobStorage();
    store = new WalkStore(storage);
    TEST_ASSERT_TRUE(store->begin());
    if (withHome) {
        TEST_ASSERT_TRUE(store->setHome(point(0.0, 0.0)));
    }

    detector = new WalkDetector();
    sampler = new LocationSampler();
    tracker = new WalkTracker(detector, store, sampler);
    TEST_ASSERT_TRUE(tracker->begin(0));
}

// Leave home, pass through the park, come back
static void walkThroughPark(void) {
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.002, 0));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.002, 1));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_WALK_STARTED, feed(0.002, 2));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(PARK_LAT, 3));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.0, 4));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_WALK_COMPLETED, feed(0.0, 5));
}

void setUp(void) {
}

void tearDown(void) {
    delete tracker;
    delete sampler;
    delete detector;
    delete store;
    delete storage;
    tracker = nullptr;
    sampler = nullptr;
    detector = nullptr;
    store = nullptr;
    storage = nullptr;
}

// ============================================================================
// Automatic detection
// ============================================================================

void test_begin_loads_home_into_detector(void) {
    setUpTracker(true);
    TEST_ASSERT_TRUE(detector->hasHomeZone());
    TEST_ASSERT_EQUAL_STRING(HOME_ZONE_ID, detector->getHomeZone().id);
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());
}

void test_samples_ignored_without_home(void) {
    setUpTracker(false);
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.002, 0));
    TEST_ASSERT_EQUAL_UINT32(1, tracker->getSamplesIgnored());
    TEST_ASSERT_EQUAL_UINT32(0, tracker->getSamplesProcessed());
    TEST_ASSERT_FALSE(tracker->isWalking());
}

void test_walk_is_detected_and_saved(void) {
    setUpTracker(true);
    TEST_ASSERT_NOT_NULL(tracker->addZone("Park", point(PARK_LAT, 0.0), 0.05f, nullptr, T0));

    walkThroughPark();

    TEST_ASSERT_FALSE(tracker->isWalking());
    TEST_ASSERT_EQUAL_UINT32(1, tracker->getWalksSaved());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());

    const Walk* walk = store->getLastWalk();
    TEST_ASSERT_NOT_NULL(walk);
    TEST_ASSERT_EQUAL_STRING("walk_1700000000000", walk->id);
    TEST_ASSERT_EQUAL_UINT64(T0, walk->startTime);
    TEST_ASSERT_EQUAL_UINT64(T0 + 4 * STEP_MS, walk->endTime);
    TEST_ASSERT_EQUAL_UINT32(40, walk->durationSeconds);
    TEST_ASSERT_EQUAL(3, (int)walk->path.size());
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 0.4448f, (float)walk->distanceKm);
    TEST_ASSERT_EQUAL(1, (int)walk->zonesVisited.size());
    TEST_ASSERT_EQUAL_STRING("Park", walk->zonesVisited[0].c_str());

    // Persisted, not just in RAM
    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_NOT_NULL(reloaded.findWalk("walk_1700000000000"));
}

void test_sampler_follows_walk_events(void) {
    setUpTracker(true);

    feed(0.002, 0);
    feed(0.002, 1);
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());

    feed(0.002, 2);
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_HIGH, sampler->getMode());

    feed(0.0, 3);
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_HIGH, sampler->getMode());

    feed(0.0, 4);
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());
}

void test_failed_save_keeps_walk_in_history(void) {
    setUpTracker(true);
    storage->failWrites = true;

    walkThroughPark();

    TEST_ASSERT_EQUAL_UINT32(0, tracker->getWalksSaved());
    TEST_ASSERT_EQUAL_UINT32(1, tracker->getWalkSaveFailures());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
    TEST_ASSERT_EQUAL_STRING("Failed to write store file", tracker->getLastError());
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());
}

// ============================================================================
// Manual control
// ============================================================================

void test_manual_start_and_stop(void) {
    setUpTracker(true);

    TEST_ASSERT_TRUE(tracker->startWalk(sampleAt(0.0, 0), 0));
    TEST_ASSERT_TRUE(tracker->isWalking());
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_HIGH, sampler->getMode());

    TEST_ASSERT_FALSE(tracker->startWalk(sampleAt(0.0, 1), STEP_MS));
    TEST_ASSERT_EQUAL_STRING("Walk already in progress", tracker->getLastError());

    TEST_ASSERT_TRUE(tracker->stopWalk(T0 + 600000ULL, 600000));
    TEST_ASSERT_FALSE(tracker->isWalking());
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());

    const Walk* walk = store->getLastWalk();
    TEST_ASSERT_NOT_NULL(walk);
    TEST_ASSERT_EQUAL_UINT32(600, walk->durationSeconds);
}

void test_stop_without_walk_fails(void) {
    setUpTracker(true);
    TEST_ASSERT_FALSE(tracker->stopWalk(T0, 0));
    TEST_ASSERT_EQUAL_STRING("No walk in progress", tracker->getLastError());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());
}

// ============================================================================
// Configuration routing
// ============================================================================

void test_set_home_reaches_detector(void) {
    setUpTracker(false);
    TEST_ASSERT_FALSE(detector->hasHomeZone());

    TEST_ASSERT_TRUE(tracker->setHome(point(0.0, 0.0)));
    TEST_ASSERT_TRUE(detector->hasHomeZone());
    TEST_ASSERT_TRUE(store->hasHome());

    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.002, 0));
    TEST_ASSERT_EQUAL_UINT32(1, tracker->getSamplesProcessed());
}

void test_home_cannot_move_during_walk(void) {
    setUpTracker(true);
    TEST_ASSERT_TRUE(tracker->startWalk(sampleAt(0.002, 0), 0));
    uint32_t writesBefore = storage->writeCount;

    TEST_ASSERT_FALSE(tracker->setHome(point(PARK_LAT, 0.0)));
    TEST_ASSERT_EQUAL_STRING("Cannot move home during a walk", tracker->getLastError());
    TEST_ASSERT_EQUAL_UINT32(writesBefore, storage->writeCount);
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, (float)store->getHomeZone().center.latitude);
    TEST_ASSERT_FLOAT_WITHIN(1e-9f, 0.0f, (float)detector->getHomeZone().center.latitude);

    // Walk still ends at the original home
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.0, 1));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_WALK_COMPLETED, feed(0.0, 2));

    TEST_ASSERT_TRUE(tracker->setHome(point(PARK_LAT, 0.0)));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, (float)PARK_LAT, (float)detector->getHomeZone().center.latitude);
}

void test_reload_refused_during_walk(void) {
    setUpTracker(true);
    TEST_ASSERT_TRUE(tracker->startWalk(sampleAt(0.002, 0), 0));

    // Blob on flash has no home
    storage->blobs[STORE_FILE_PATH] = "{\"version\":1,\"homeZone\":null,\"customZones\":[],\"walks\":[]}";

    TEST_ASSERT_FALSE(tracker->reload());
    TEST_ASSERT_EQUAL_STRING("Cannot load during a walk", tracker->getLastError());
    TEST_ASSERT_TRUE(detector->hasHomeZone());
    TEST_ASSERT_TRUE(store->hasHome());
    TEST_ASSERT_TRUE(tracker->isWalking());

    TEST_ASSERT_EQUAL(WalkDetector::EVENT_NONE, feed(0.0, 1));
    TEST_ASSERT_EQUAL(WalkDetector::EVENT_WALK_COMPLETED, feed(0.0, 2));
    TEST_ASSERT_EQUAL_UINT32(0, tracker->getSamplesIgnored());
}

void test_reload_applies_store_when_idle(void) {
    setUpTracker(true);
    TEST_ASSERT_TRUE(detector->hasHomeZone());

    storage->blobs[STORE_FILE_PATH] = "{\"version\":1,\"homeZone\":null,\"customZones\":[],\"walks\":[]}";
    TEST_ASSERT_TRUE(tracker->reload());
    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_FALSE(detector->hasHomeZone());

    storage->blobs[STORE_FILE_PATH] = "not json";
    TEST_ASSERT_FALSE(tracker->reload());
    TEST_ASSERT_FALSE(detector->hasHomeZone());
}

void test_zone_changes_reach_detector(void) {
    setUpTracker(true);

    const Zone* zone = tracker->addZone("Park", point(PARK_LAT, 0.0), 0.05f, nullptr, T0);
    TEST_ASSERT_NOT_NULL(zone);
    TEST_ASSERT_EQUAL(1, (int)detector->getNamedZoneCount());

    char id[ZONE_ID_MAX_LEN];
    snprintf(id, sizeof(id), "%s", zone->id);
    TEST_ASSERT_TRUE(tracker->deleteZone(id));
    TEST_ASSERT_EQUAL(0, (int)detector->getNamedZoneCount());

    TEST_ASSERT_FALSE(tracker->deleteZone(id));
    TEST_ASSERT_EQUAL_STRING("Zone not found", tracker->getLastError());

    TEST_ASSERT_NULL(tracker->addZone("Park", point(PARK_LAT, 0.0), 0.0f, nullptr, T0));
    TEST_ASSERT_EQUAL_STRING("Zone radius must be positive", tracker->getLastError());
}

void test_factory_reset_discards_walk_and_home(void) {
    setUpTracker(true);
    TEST_ASSERT_TRUE(tracker->startWalk(sampleAt(0.002, 0), 0));

    TEST_ASSERT_TRUE(tracker->factoryReset(STEP_MS));

    TEST_ASSERT_FALSE(tracker->isWalking());
    TEST_ASSERT_FALSE(detector->hasHomeZone());
    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());
    TEST_ASSERT_EQUAL(LocationSampler::SAMPLE_MODE_LOW_POWER, sampler->getMode());
}

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    UNITY_BEGIN();

    RUN_TEST(test_begin_loads_home_into_detector);
    RUN_TEST(test_samples_ignored_without_home);
    RUN_TEST(test_walk_is_detected_and_saved);
    RUN_TEST(test_sampler_follows_walk_events);
    RUN_TEST(test_failed_save_keeps_walk_in_history);

    RUN_TEST(test_manual_start_and_stop);
    RUN_TEST(test_stop_without_walk_fails);

    RUN_TEST(test_set_home_reaches_detector);
    RUN_TEST(test_home_cannot_move_during_walk);
    RUN_TEST(test_reload_refused_during_walk);
    RUN_TEST(test_reload_applies_store_when_idle);
    RUN_TEST(test_zone_changes_reach_detector);
    RUN_TEST(test_factory_reset_discards_walk_and_home);

    return UNITY_END();
}
