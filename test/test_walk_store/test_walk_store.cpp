/**
 * @file test_walk_store.cpp
 * @brief Unit tests for the persistent walk store
 *
 * Runs WalkStore against an in-memory blob backend so persistence, load
 * recovery and validation can be checked without LittleFS.
 */

#include <unity.h>
#include <string.h>
#include <string>
#include "config.h"
#include "walk_types.h"
#include "walk_store.h"
#include "memory_blob_storage.h"

#include "../../src/walk_store.cpp"

// Satisfy the extern Logger g_logger declared in the shadow logger.h
Logger g_logger;

#define T0  1700000000000ULL

static MemoryBlobStorage* storage = nullptr;
static WalkStore* store = nullptr;

static GeoPoint point(double lat, double lon) {
    GeoPoint p;
    p.latitude = lat;
    p.longitude = lon;
    return p;
}

static Walk makeWalk(uint64_t startTime, uint64_t endTime) {
    Walk walk;
    snprintf(walk.id, sizeof(walk.id), "walk_%llu", (unsigned long long)startTime);
    walk.startTime = startTime;
    walk.endTime = endTime;
    walk.durationSeconds = endTime > startTime ? (uint32_t)((endTime - startTime) / 1000) : 0;
    walk.distanceKm = 1.25;
    walk.path.push_back(point(0.001, 0.0));
    walk.path.push_back(point(0.002, 0.0));
    walk.zonesVisited.push_back("Park");
    return walk;
}

static Walk makeLongWalk(uint64_t startTime, size_t points) {
    Walk walk = makeWalk(startTime, startTime + 3600000ULL);
    walk.path.clear();
    for (size_t i = 0; i < points; i++) {
        walk.path.push_back(point(47.606201171 + i * 0.00001, -122.332107544 - i * 0.00001));
    }
    walk.distanceKm = 2.345678;
    return walk;
}

static bool storedBlob(std::string& out) {
    return storage->read(STORE_FILE_PATH, out);
}

void setUp(void) {
    storage = new MemoryBlobStorage();
    store = new WalkStore(storage);
}

void tearDown(void) {
    delete store;
    delete storage;
    store = nullptr;
    storage = nullptr;
}

// ============================================================================
// Lifecycle
// ============================================================================

void test_begin_without_blob_writes_defaults(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(storage->exists(STORE_FILE_PATH));
    TEST_ASSERT_EQUAL_UINT32(1, store->getSaveCount());

    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_EQUAL_UINT8(0, store->getZoneCount());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());
    TEST_ASSERT_FALSE(store->getNotificationSettings().enabled);
    TEST_ASSERT_EQUAL_UINT8(REMINDER_DEFAULT_HOURS, store->getNotificationSettings().hours);

    std::string blob;
    TEST_ASSERT_TRUE(storedBlob(blob));
    TEST_ASSERT_TRUE(blob.find("\"homeZone\":null") != std::string::npos);
}

void test_begin_fails_when_storage_cannot_mount(void) {
    storage->failMount = true;
    TEST_ASSERT_FALSE(store->begin());
    TEST_ASSERT_EQUAL_STRING("Failed to mount storage", store->getLastError());
}

void test_state_survives_reload(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->setHome(point(47.6062, -122.3321)));
    TEST_ASSERT_NOT_NULL(store->addZone("Park", point(47.61, -122.33), 0.15f, "#34D399", T0));
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 1800000ULL)));

    NotificationSettings settings;
    settings.enabled = true;
    settings.hours = 6;
    TEST_ASSERT_TRUE(store->setNotificationSettings(settings));

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());

    TEST_ASSERT_TRUE(reloaded.hasHome());
    TEST_ASSERT_EQUAL_STRING(HOME_ZONE_ID, reloaded.getHomeZone().id);
    TEST_ASSERT_EQUAL_STRING(HOME_ZONE_NAME, reloaded.getHomeZone().name);
    TEST_ASSERT_FLOAT_WITHIN(1e-4f, 47.6062f, (float)reloaded.getHomeZone().center.latitude);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, (float)HOME_RADIUS_KM, reloaded.getHomeZone().radiusKm);

    TEST_ASSERT_EQUAL_UINT8(1, reloaded.getZoneCount());
    const Zone* zone = reloaded.getZone(0);
    TEST_ASSERT_NOT_NULL(zone);
    TEST_ASSERT_EQUAL_STRING("zone_1700000000000", zone->id);
    TEST_ASSERT_EQUAL_STRING("Park", zone->name);
    TEST_ASSERT_EQUAL_STRING("#34D399", zone->color);
    TEST_ASSERT_FLOAT_WITHIN(1e-5f, 0.15f, zone->radiusKm);

    TEST_ASSERT_EQUAL(1, (int)reloaded.getWalkCount());
    const Walk* walk = reloaded.findWalk("walk_1700000000000");
    TEST_ASSERT_NOT_NULL(walk);
    TEST_ASSERT_EQUAL_UINT64(T0, walk->startTime);
    TEST_ASSERT_EQUAL_UINT64(T0 + 1800000ULL, walk->endTime);
    TEST_ASSERT_EQUAL_UINT32(1800, walk->durationSeconds);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 1.25f, (float)walk->distanceKm);
    TEST_ASSERT_EQUAL(2, (int)walk->path.size());
    TEST_ASSERT_FLOAT_WITHIN(1e-7f, 0.002f, (float)walk->path[1].latitude);
    TEST_ASSERT_EQUAL(1, (int)walk->zonesVisited.size());
    TEST_ASSERT_EQUAL_STRING("Park", walk->zonesVisited[0].c_str());

    TEST_ASSERT_TRUE(reloaded.getNotificationSettings().enabled);
    TEST_ASSERT_EQUAL_UINT8(6, reloaded.getNotificationSettings().hours);
}

void test_corrupt_blob_keeps_defaults(void) {
    storage->blobs[STORE_FILE_PATH] = "{\"version\":1,\"walks\":[";

    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->isLoadFailed());
    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());
    TEST_ASSERT_EQUAL_UINT32(0, store->getSaveCount());

    // Mutations apply in RAM but never replace the unreadable file
    TEST_ASSERT_FALSE(store->setHome(point(1.0, 1.0)));
    TEST_ASSERT_EQUAL_STRING("Store file unreadable, not overwriting", store->getLastError());
    TEST_ASSERT_FALSE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));
    TEST_ASSERT_TRUE(store->hasHome());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
    TEST_ASSERT_EQUAL_UINT32(2, store->getSaveFailures());
    TEST_ASSERT_EQUAL_UINT32(0, storage->writeCount);
    TEST_ASSERT_EQUAL_STRING("{\"version\":1,\"walks\":[", storage->blobs[STORE_FILE_PATH].c_str());

    // An explicit reset takes ownership of the file again
    TEST_ASSERT_TRUE(store->reset());
    TEST_ASSERT_FALSE(store->isLoadFailed());
    TEST_ASSERT_EQUAL_UINT32(1, storage->writeCount);
}

void test_oversized_blob_is_never_clobbered(void) {
    std::string huge = "{\"version\":1,\"walks\":[";
    huge.append(STORE_MAX_FILE_SIZE, ' ');
    huge += "]}";
    storage->blobs[STORE_FILE_PATH] = huge;

    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->isLoadFailed());

    TEST_ASSERT_FALSE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));
    store->addZone("Park", point(0.0, 0.0), 0.1f, nullptr, T0);
    TEST_ASSERT_EQUAL_UINT32(2, store->getSaveFailures());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
    TEST_ASSERT_EQUAL(huge.size(), storage->blobs[STORE_FILE_PATH].size());
    TEST_ASSERT_TRUE(storage->blobs[STORE_FILE_PATH] == huge);
}

void test_successful_load_reenables_saving(void) {
    storage->blobs[STORE_FILE_PATH] = "garbage";
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->isLoadFailed());
    TEST_ASSERT_FALSE(store->save());

    // File repaired on flash, then reloaded
    storage->blobs[STORE_FILE_PATH] = "{\"version\":1,\"homeZone\":null,\"customZones\":[],\"walks\":[]}";
    TEST_ASSERT_TRUE(store->load());
    TEST_ASSERT_FALSE(store->isLoadFailed());
    TEST_ASSERT_TRUE(store->setHome(point(2.0, 3.0)));

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_TRUE(reloaded.hasHome());
}

void test_interrupted_write_recovers_staged_blob(void) {
    // Reset struck after the new blob was staged but before the rename
    MemoryBlobStorage seed;
    WalkStore seeded(&seed);
    TEST_ASSERT_TRUE(seeded.begin());
    TEST_ASSERT_TRUE(seeded.setHome(point(47.6, -122.3)));
    TEST_ASSERT_TRUE(seeded.addWalk(makeWalk(T0, T0 + 60000ULL)));

    std::string temp = HAL_BlobStorage::tempPathFor(STORE_FILE_PATH);
    storage->blobs[temp] = seed.blobs[STORE_FILE_PATH];

    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_FALSE(store->isLoadFailed());
    TEST_ASSERT_TRUE(store->hasHome());
    TEST_ASSERT_NOT_NULL(store->findWalk("walk_1700000000000"));

    TEST_ASSERT_TRUE(storage->exists(STORE_FILE_PATH));
    TEST_ASSERT_FALSE(storage->exists(temp.c_str()));
    TEST_ASSERT_EQUAL_UINT32(0, storage->writeCount);
}

void test_stale_staged_blob_is_discarded(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));

    std::string temp = HAL_BlobStorage::tempPathFor(STORE_FILE_PATH);
    storage->blobs[temp] = "{\"version\":1,\"wa";

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_NOT_NULL(reloaded.findWalk("walk_1700000000000"));
    TEST_ASSERT_FALSE(storage->exists(temp.c_str()));
}

void test_empty_blob_is_rejected(void) {
    storage->blobs[STORE_FILE_PATH] = "";
    TEST_ASSERT_FALSE(store->load());
    TEST_ASSERT_EQUAL_STRING("Invalid store file size", store->getLastError());
}

void test_failed_parse_leaves_state_untouched(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));

    TEST_ASSERT_FALSE(store->fromJSON("not json"));
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());

    TEST_ASSERT_FALSE(store->fromJSON("[1,2,3]"));
    TEST_ASSERT_EQUAL_STRING("Store root is not an object", store->getLastError());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
}

void test_load_skips_invalid_entries(void) {
    const char* json =
        "{\"version\":1,"
        "\"homeZone\":null,"
        "\"customZones\":["
            "{\"id\":\"zone_1\",\"name\":\"Park\",\"latitude\":1,\"longitude\":2,\"radius\":0.1,\"color\":\"#F87171\"},"
            "{\"id\":\"zone_2\",\"name\":\"Bad\",\"latitude\":1,\"longitude\":2,\"radius\":0,\"color\":\"#F87171\"}"
        "],"
        "\"walks\":["
            "{\"id\":\"walk_1\",\"startTime\":1000,\"endTime\":null,\"duration\":0,\"distance\":0,\"path\":[],\"zonesVisited\":[]},"
            "{\"id\":\"walk_2\",\"startTime\":2000,\"endTime\":62000,\"duration\":60,\"distance\":0.5,"
                "\"path\":[{\"lat\":0.001,\"lng\":0}],\"zonesVisited\":[\"Park\",\"Park\"]}"
        "],"
        "\"settings\":{\"enabled\":true,\"hours\":20}}";

    TEST_ASSERT_TRUE(store->fromJSON(json));

    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_EQUAL_UINT8(1, store->getZoneCount());
    TEST_ASSERT_EQUAL_STRING("zone_1", store->getZone(0)->id);

    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
    TEST_ASSERT_NULL(store->findWalk("walk_1"));
    const Walk* walk = store->findWalk("walk_2");
    TEST_ASSERT_NOT_NULL(walk);
    TEST_ASSERT_EQUAL(1, (int)walk->zonesVisited.size());

    TEST_ASSERT_TRUE(store->getNotificationSettings().enabled);
    TEST_ASSERT_EQUAL_UINT8(REMINDER_DEFAULT_HOURS, store->getNotificationSettings().hours);
    TEST_ASSERT_TRUE(store->validate());
}

void test_reset_clears_everything(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->setHome(point(1.0, 1.0)));
    TEST_ASSERT_NOT_NULL(store->addZone("Park", point(1.0, 1.0), 0.1f, nullptr, T0));
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));

    TEST_ASSERT_TRUE(store->reset());

    TEST_ASSERT_FALSE(store->hasHome());
    TEST_ASSERT_EQUAL_UINT8(0, store->getZoneCount());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_FALSE(reloaded.hasHome());
    TEST_ASSERT_EQUAL(0, (int)reloaded.getWalkCount());
}

// ============================================================================
// Zones
// ============================================================================

void test_set_home_uses_fixed_identity(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->setHome(point(10.0, 20.0)));

    const Zone& home = store->getHomeZone();
    TEST_ASSERT_EQUAL_STRING(HOME_ZONE_ID, home.id);
    TEST_ASSERT_EQUAL_STRING(HOME_ZONE_COLOR, home.color);
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, (float)HOME_RADIUS_KM, home.radiusKm);

    // Setting home again replaces it
    TEST_ASSERT_TRUE(store->setHome(point(11.0, 21.0)));
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 11.0f, (float)store->getHomeZone().center.latitude);
}

void test_add_zone_defaults_to_first_palette_color(void) {
    TEST_ASSERT_TRUE(store->begin());
    const Zone* zone = store->addZone("Park", point(0.0, 0.0), 0.1f, nullptr, T0);
    TEST_ASSERT_NOT_NULL(zone);
    TEST_ASSERT_EQUAL_STRING(WalkStore::getPaletteColor(0), zone->color);
}

void test_add_zone_validation(void) {
    TEST_ASSERT_TRUE(store->begin());

    TEST_ASSERT_NULL(store->addZone("", point(0.0, 0.0), 0.1f, nullptr, T0));
    TEST_ASSERT_EQUAL_STRING("Zone name is empty", store->getLastError());

    TEST_ASSERT_NULL(store->addZone("Park", point(0.0, 0.0), 0.0f, nullptr, T0));
    TEST_ASSERT_EQUAL_STRING("Zone radius must be positive", store->getLastError());

    TEST_ASSERT_NULL(store->addZone("Park", point(0.0, 0.0), -1.0f, nullptr, T0));

    TEST_ASSERT_NULL(store->addZone("Park", point(0.0, 0.0), 0.1f, "#000000", T0));
    TEST_ASSERT_EQUAL_STRING("Zone color not in palette", store->getLastError());

    TEST_ASSERT_NULL(store->addZone("A name that is far too long to be stored", point(0.0, 0.0), 0.1f, nullptr, T0));
    TEST_ASSERT_EQUAL_STRING("Zone name too long", store->getLastError());

    TEST_ASSERT_EQUAL_UINT8(0, store->getZoneCount());
}

void test_add_zone_respects_capacity(void) {
    TEST_ASSERT_TRUE(store->begin());

    for (uint8_t i = 0; i < MAX_CUSTOM_ZONES; i++) {
        char name[16];
        snprintf(name, sizeof(name), "Zone %u", (unsigned)i);
        TEST_ASSERT_NOT_NULL(store->addZone(name, point(0.0, 0.0), 0.1f, nullptr, T0 + i * 1000));
    }

    TEST_ASSERT_NULL(store->addZone("Extra", point(0.0, 0.0), 0.1f, nullptr, T0 + 99000));
    TEST_ASSERT_EQUAL_STRING("Zone limit reached", store->getLastError());
    TEST_ASSERT_EQUAL_UINT8(MAX_CUSTOM_ZONES, store->getZoneCount());
}

void test_zone_ids_unique_within_same_millisecond(void) {
    TEST_ASSERT_TRUE(store->begin());

    const Zone* first = store->addZone("Park", point(0.0, 0.0), 0.1f, nullptr, T0);
    TEST_ASSERT_NOT_NULL(first);
    TEST_ASSERT_EQUAL_STRING("zone_1700000000000", first->id);

    const Zone* second = store->addZone("Field", point(0.0, 0.0), 0.1f, nullptr, T0);
    TEST_ASSERT_NOT_NULL(second);
    TEST_ASSERT_EQUAL_STRING("zone_1700000000001", second->id);
}

void test_delete_zone(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_NOT_NULL(store->addZone("Park", point(0.0, 0.0), 0.1f, nullptr, T0));
    TEST_ASSERT_NOT_NULL(store->addZone("Field", point(0.0, 0.0), 0.1f, nullptr, T0 + 1));

    TEST_ASSERT_TRUE(store->deleteZone("zone_1700000000000"));
    TEST_ASSERT_EQUAL_UINT8(1, store->getZoneCount());
    TEST_ASSERT_EQUAL_STRING("Field", store->getZone(0)->name);

    TEST_ASSERT_FALSE(store->deleteZone("zone_1700000000000"));
    TEST_ASSERT_EQUAL_STRING("Zone not found", store->getLastError());
}

// ============================================================================
// Walk History
// ============================================================================

void test_add_walk_rejects_incomplete(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_FALSE(store->addWalk(makeWalk(T0, 0)));
    TEST_ASSERT_EQUAL_STRING("Walk has no end time", store->getLastError());
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());
}

void test_add_walk_rejects_duplicate_id(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));
    TEST_ASSERT_FALSE(store->addWalk(makeWalk(T0, T0 + 90000ULL)));
    TEST_ASSERT_EQUAL_STRING("Duplicate walk id", store->getLastError());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());
}

void test_history_drops_oldest_when_full(void) {
    TEST_ASSERT_TRUE(store->begin());

    for (uint64_t i = 0; i <= WALK_HISTORY_MAX; i++) {
        uint64_t start = T0 + i * 3600000ULL;
        TEST_ASSERT_TRUE(store->addWalk(makeWalk(start, start + 600000ULL)));
    }

    TEST_ASSERT_EQUAL(WALK_HISTORY_MAX, (int)store->getWalkCount());
    TEST_ASSERT_NULL(store->findWalk("walk_1700000000000"));
    TEST_ASSERT_NOT_NULL(store->findWalk("walk_1700003600000"));
    TEST_ASSERT_EQUAL_UINT32(1, store->getWalksEvicted());
    TEST_ASSERT_EQUAL_STRING("walk_1700000000000", store->getLastEvictedWalkId());
}

void test_long_walk_path_is_thinned(void) {
    TEST_ASSERT_TRUE(store->begin());
    Walk walk = makeLongWalk(T0, 1000);
    GeoPoint first = walk.path.front();
    GeoPoint last = walk.path.back();

    TEST_ASSERT_TRUE(store->addWalk(std::move(walk)));

    const Walk* stored = store->findWalk("walk_1700000000000");
    TEST_ASSERT_NOT_NULL(stored);
    TEST_ASSERT_EQUAL(WALK_PATH_MAX_POINTS, (int)stored->path.size());
    TEST_ASSERT_TRUE(first.latitude == stored->path.front().latitude);
    TEST_ASSERT_TRUE(last.latitude == stored->path.back().latitude);
    TEST_ASSERT_TRUE(last.longitude == stored->path.back().longitude);

    // Measured distance is not recomputed from the thinned path
    TEST_ASSERT_FLOAT_WITHIN(1e-6f, 2.345678f, (float)stored->distanceKm);
}

void test_short_walk_path_is_kept(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->addWalk(makeLongWalk(T0, WALK_PATH_MAX_POINTS)));
    TEST_ASSERT_EQUAL(WALK_PATH_MAX_POINTS, (int)store->getLastWalk()->path.size());
}

void test_full_history_fits_and_reloads(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->setHome(point(47.606201171, -122.332107544)));
    for (uint8_t i = 0; i < MAX_CUSTOM_ZONES; i++) {
        char name[ZONE_NAME_MAX_LEN];
        snprintf(name, sizeof(name), "Neighbourhood park %u", (unsigned)i);
        TEST_ASSERT_NOT_NULL(store->addZone(name, point(47.61, -122.33), 0.25f, nullptr, T0 + i));
    }

    for (uint64_t i = 0; i < WALK_HISTORY_MAX; i++) {
        TEST_ASSERT_TRUE(store->addWalk(makeLongWalk(T0 + i * 7200000ULL, 1500)));
    }

    std::string blob;
    TEST_ASSERT_TRUE(storedBlob(blob));
    TEST_ASSERT_TRUE(blob.size() <= STORE_MAX_FILE_SIZE);
    TEST_ASSERT_EQUAL_UINT32(0, store->getSaveFailures());

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_FALSE(reloaded.isLoadFailed());
    TEST_ASSERT_EQUAL(WALK_HISTORY_MAX, (int)reloaded.getWalkCount());
    TEST_ASSERT_EQUAL_UINT8(MAX_CUSTOM_ZONES, reloaded.getZoneCount());
}

void test_last_walk_is_greatest_end_time(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_NULL(store->getLastWalk());

    // Inserted out of order
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0 + 7200000ULL, T0 + 9000000ULL)));
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 600000ULL)));

    const Walk* last = store->getLastWalk();
    TEST_ASSERT_NOT_NULL(last);
    TEST_ASSERT_EQUAL_UINT64(T0 + 9000000ULL, last->endTime);
}

void test_delete_walk(void) {
    TEST_ASSERT_TRUE(store->begin());
    TEST_ASSERT_TRUE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));

    TEST_ASSERT_TRUE(store->deleteWalk("walk_1700000000000"));
    TEST_ASSERT_EQUAL(0, (int)store->getWalkCount());

    TEST_ASSERT_FALSE(store->deleteWalk("walk_1700000000000"));
    TEST_ASSERT_EQUAL_STRING("Walk not found", store->getLastError());
}

void test_failed_save_keeps_walk_in_memory(void) {
    TEST_ASSERT_TRUE(store->begin());
    storage->failWrites = true;

    TEST_ASSERT_FALSE(store->addWalk(makeWalk(T0, T0 + 60000ULL)));
    TEST_ASSERT_EQUAL_STRING("Failed to write store file", store->getLastError());
    TEST_ASSERT_EQUAL_UINT32(1, store->getSaveFailures());
    TEST_ASSERT_EQUAL(1, (int)store->getWalkCount());

    // Next successful save persists it
    storage->failWrites = false;
    TEST_ASSERT_TRUE(store->save());

    WalkStore reloaded(storage);
    TEST_ASSERT_TRUE(reloaded.begin());
    TEST_ASSERT_NOT_NULL(reloaded.findWalk("walk_1700000000000"));
}

// ============================================================================
// Notification Settings
// ============================================================================

void test_notification_hours_validated(void) {
    TEST_ASSERT_TRUE(store->begin());

    NotificationSettings settings;
    settings.enabled = true;
    settings.hours = 0;
    TEST_ASSERT_FALSE(store->setNotificationSettings(settings));
    TEST_ASSERT_EQUAL_STRING("Invalid reminder hours (1-12)", store->getLastError());

    settings.hours = 13;
    TEST_ASSERT_FALSE(store->setNotificationSettings(settings));
    TEST_ASSERT_FALSE(store->getNotificationSettings().enabled);

    settings.hours = REMINDER_MAX_HOURS;
    TEST_ASSERT_TRUE(store->setNotificationSettings(settings));
    TEST_ASSERT_EQUAL_UINT8(REMINDER_MAX_HOURS, store->getNotificationSettings().hours);
}

void test_palette_membership(void) {
    TEST_ASSERT_TRUE(WalkStore::isPaletteColor("#F87171"));
    TEST_ASSERT_TRUE(WalkStore::isPaletteColor("#F472B6"));
    TEST_ASSERT_FALSE(WalkStore::isPaletteColor(HOME_ZONE_COLOR));
    TEST_ASSERT_FALSE(WalkStore::isPaletteColor(nullptr));
    TEST_ASSERT_NULL(WalkStore::getPaletteColor(ZONE_PALETTE_SIZE));
}

int main(int argc, char **argv) {
    (void)argc;
    (void)argv;

    UNITY_BEGIN();

    RUN_TEST(test_begin_without_blob_writes_defaults);
    RUN_TEST(test_begin_fails_when_storage_cannot_mount);
    RUN_TEST(test_state_survives_reload);
    RUN_TEST(test_corrupt_blob_keeps_defaults);
    RUN_TEST(test_oversized_blob_is_never_clobbered);
    RUN_TEST(test_successful_load_reenables_saving);
    RUN_TEST(test_interrupted_write_recovers_staged_blob);
    RUN_TEST(test_stale_staged_blob_is_discarded);
    RUN_TEST(test_empty_blob_is_rejected);
    RUN_TEST(test_failed_parse_leaves_state_untouched);
    RUN_TEST(test_load_skips_invalid_entries);
    RUN_TEST(test_reset_clears_everything);

    RUN_TEST(test_set_home_uses_fixed_identity);
    RUN_TEST(test_add_zone_defaults_to_first_palette_color);
    RUN_TEST(test_add_zone_validation);
    RUN_TEST(test_add_zone_respects_capacity);
    RUN_TEST(test_zone_ids_unique_within_same_millisecond);
    RUN_TEST(test_delete_zone);

    RUN_TEST(test_add_walk_rejects_incomplete);
    RUN_TEST(test_add_walk_rejects_duplicate_id);
    RUN_TEST(test_history_drops_oldest_when_full);
    RUN_TEST(test_long_walk_path_is_thinned);
    RUN_TEST(test_short_walk_path_is_kept);
    RUN_TEST(test_full_history_fits_and_reloads);
    RUN_TEST(test_last_walk_is_greatest_end_time);
    RUN_TEST(test_delete_walk);
    RUN_TEST(test_failed_save_keeps_walk_in_memory);

    RUN_TEST(test_notification_hours_validated);
    RUN_TEST(test_palette_membership);

    return UNITY_END();
}
