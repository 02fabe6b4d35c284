#ifndef WALKAWARE_WALK_STORE_H
#define WALKAWARE_WALK_STORE_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>
#include "config.h"
#include "walk_types.h"
#include "hal_blob_storage.h"

/**
 * @brief Persistent store for WalkAware
 *
 * Owns everything that survives a reboot: the home zone, the user's named
 * zones, the walk history and the reminder settings. The whole state is one
 * JSON document, loaded once at boot and rewritten in full after every
 * mutation (last writer wins).
 *
 * Features:
 * - JSON serialization/deserialization (ArduinoJson)
 * - Default values for all settings
 * - Validation of zones, settings and loaded data
 * - Factory reset capability
 *
 * A failed save never rolls back the in-memory state. The mutation stays in
 * RAM and is written again by the next successful save.
 *
 * Blob layout:
 * ```json
 * {
 *   "version": 1,
 *   "homeZone": { "id": "home", "name": "Home", "latitude": 0, "longitude": 0, "radius": 0.05, "color": "#A8A5A3" },
 *   "customZones": [ { "id": "zone_...", "name": "...", "latitude": 0, "longitude": 0, "radius": 0.1, "color": "#F87171" } ],
 *   "walks": [ { "id": "walk_...", "startTime": 0, "endTime": 0, "duration": 0, "distance": 0,
 *                "path": [ { "lat": 0, "lng": 0 } ], "zonesVisited": [ "..." ] } ],
 *   "settings": { "enabled": false, "hours": 8 }
 * }
 * ```
 */
class WalkStore {
public:
    /**
     * @brief Construct a new Walk Store
     *
     * @param storage Blob storage backend (not owned, must outlive the store)
     * @param path Blob path
     */
    explicit WalkStore(HAL_BlobStorage* storage, const char* path = STORE_FILE_PATH);

    ~WalkStore();

    /**
     * @brief Initialize the store
     *
     * Mounts storage, finishes any interrupted write and loads the blob. A
     * missing blob is created from defaults. An unreadable one is reported
     * and defaults are kept, but the file is not overwritten until a later
     * load() succeeds or the store is reset.
     *
     * @return true if storage is usable
     */
    bool begin();

    /**
     * @brief Load state from storage
     *
     * @return true if the blob was read and parsed
     */
    bool load();

    /**
     * @brief Write the full state to storage
     *
     * Refused while the blob on flash could not be loaded.
     *
     * @return true if the blob was written
     */
    bool save();

    /**
     * @brief Reset to factory defaults (no home, no zones, no walks)
     *
     * @param save If true, saves defaults to storage
     * @return true if reset successful
     */
    bool reset(bool save = true);

    /**
     * @brief Validate current state
     *
     * @return true if home, zones and settings are within range
     */
    bool validate();

    // =========================================================================
    // Serialization
    // =========================================================================

    /**
     * @brief Serialize state to JSON
     *
     * @param out Receives the JSON document
     * @return true if JSON generated successfully
     */
    bool toJSON(std::string& out);

    /**
     * @brief Replace state from a JSON document
     *
     * Invalid zones and walks are skipped. On a parse error the current
     * state is left untouched.
     *
     * @param json JSON string
     * @return true if JSON parsed successfully
     */
    bool fromJSON(const char* json);

    // =========================================================================
    // Home Zone
    // =========================================================================

    bool hasHome() const { return m_hasHome; }
    const Zone& getHomeZone() const { return m_homeZone; }

    /**
     * @brief Set the home zone centered on a position and save
     *
     * @param center Home position
     * @return true if saved
     */
    bool setHome(const GeoPoint& center);

    // =========================================================================
    // Named Zones
    // =========================================================================

    uint8_t getZoneCount() const { return m_zoneCount; }
    const Zone* getZones() const { return m_zones; }

    /**
     * @brief Get zone by index
     *
     * @return const Zone* Zone, or nullptr if out of range
     */
    const Zone* getZone(uint8_t index) const;

    /**
     * @brief Find zone by id
     *
     * @return const Zone* Zone, or nullptr if not found
     */
    const Zone* findZone(const char* id) const;

    /**
     * @brief Add a named zone and save
     *
     * @param name Display name (non-empty)
     * @param center Zone center
     * @param radiusKm Radius in km (> 0)
     * @param color Palette color, or nullptr for the first palette color
     * @param nowMs Current epoch ms, used for the zone id
     * @return const Zone* New zone, or nullptr if rejected (see getLastError())
     */
    const Zone* addZone(const char* name, const GeoPoint& center, float radiusKm,
                        const char* color, uint64_t nowMs);

    /**
     * @brief Delete a named zone by id and save
     *
     * @return true if the zone existed and the store was saved
     */
    bool deleteZone(const char* id);

    /**
     * @brief Check whether a color belongs to the zone palette
     */
    static bool isPaletteColor(const char* color);

    /**
     * @brief Get palette color by index
     *
     * @return const char* Color, or nullptr if out of range
     */
    static const char* getPaletteColor(uint8_t index);

    // =========================================================================
    // Walk History
    // =========================================================================

    const std::vector<Walk>& getWalks() const { return m_walks; }
    size_t getWalkCount() const { return m_walks.size(); }

    /**
     * @brief Find walk by id
     *
     * @return const Walk* Walk, or nullptr if not found
     */
    const Walk* findWalk(const char* id) const;

    /**
     * @brief Get the most recent walk (greatest endTime)
     *
     * @return const Walk* Walk, or nullptr when history is empty
     */
    const Walk* getLastWalk() const;

    /**
     * @brief Append a completed walk to history and save
     *
     * Walks without an end time or with a duplicate id are rejected. The
     * path is thinned to WALK_PATH_MAX_POINTS (distance is kept as measured).
     * When history holds WALK_HISTORY_MAX walks the one that ended first is
     * dropped and reported through getWalksEvicted().
     *
     * @param walk Completed walk (moved into history)
     * @return true if added and saved
     */
    bool addWalk(Walk&& walk);

    /**
     * @brief Delete a walk by id and save
     *
     * @return true if the walk existed and the store was saved
     */
    bool deleteWalk(const char* id);

    // =========================================================================
    // Notification Settings
    // =========================================================================

    const NotificationSettings& getNotificationSettings() const { return m_settings; }

    /**
     * @brief Replace reminder settings and save
     *
     * @param settings New settings (hours must be 1-12)
     * @return true if valid and saved
     */
    bool setNotificationSettings(const NotificationSettings& settings);

    // =========================================================================
    // Status
    // =========================================================================

    uint32_t getSaveCount() const { return m_saveCount; }
    uint32_t getSaveFailures() const { return m_saveFailures; }
    bool isLoadFailed() const { return m_loadFailed; }
    uint32_t getWalksEvicted() const { return m_walksEvicted; }
    const char* getLastEvictedWalkId() const { return m_lastEvictedWalkId; }

    /**
     * @brief Get last error message
     *
     * @return const char* Error message
     */
    const char* getLastError() const;

private:
    HAL_BlobStorage* m_storage;            ///< Blob backend (not owned)
    const char* m_path;                    ///< Blob path
    bool m_initialized;                    ///< begin() completed

    Zone m_homeZone;                       ///< Home zone (valid when m_hasHome)
    bool m_hasHome;                        ///< Home zone configured
    Zone m_zones[MAX_CUSTOM_ZONES];        ///< Named zones
    uint8_t m_zoneCount;                   ///< Named zones in use
    std::vector<Walk> m_walks;             ///< Completed walks, in insertion order
    NotificationSettings m_settings;       ///< Reminder settings

    bool m_loadFailed;                     ///< Blob exists but could not be loaded
    uint32_t m_saveCount;                  ///< Successful saves
    uint32_t m_saveFailures;               ///< Failed saves
    uint32_t m_walksEvicted;               ///< Walks dropped by the history cap
    char m_lastEvictedWalkId[WALK_ID_MAX_LEN];
    char m_lastError[128];                 ///< Last error message

    /**
     * @brief Load default state
     */
    void loadDefaults();

    /**
     * @brief Estimate JSON document capacity for the current state
     */
    size_t jsonCapacity() const;

    /**
     * @brief Validate a zone definition
     *
     * @return true if name, radius and color are usable
     */
    bool validateZone(const char* name, float radiusKm, const char* color);

    /**
     * @brief Set error message
     *
     * @param error Error message
     */
    void setError(const char* error);
};

#endif // WALKAWARE_WALK_STORE_H
