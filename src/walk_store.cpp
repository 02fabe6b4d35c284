#include "walk_store.h"
#include "logger.h"
#include "debug_logger.h"
#include <stdio.h>
#include <string.h>
#include <utility>

// 64-bit epoch timestamps and std::string output on every target
#define ARDUINOJSON_USE_LONG_LONG 1
#define ARDUINOJSON_ENABLE_STD_STRING 1
#include <ArduinoJson.h>

static const char* const s_palette[ZONE_PALETTE_SIZE] = ZONE_PALETTE;

static void copyString(char* dst, size_t size, const char* src) {
    snprintf(dst, size, "%s", src ? src : "");
}

// Upper bound on the document a JSON text parses into: one slot per value
// and a copy of every string
static size_t parsedCapacity(const char* json) {
    size_t slots = 0;
    size_t stringBytes = 0;
    bool inString = false;

    for (const char* c = json; *c; c++) {
        if (inString) {
            if (*c == '\\' && c[1]) {
                c++;
                stringBytes++;
            } else if (*c == '"') {
                inString = false;
                stringBytes++;
            } else {
                stringBytes++;
            }
            continue;
        }

        switch (*c) {
            case '"': inString = true; break;
            case '{':
            case '[':
            case ',': slots++; break;
            default: break;
        }
    }

    return JSON_ARRAY_SIZE(slots) + stringBytes;
}

// Keep maxPoints evenly spaced points, always the first and the last
static void thinPath(std::vector<GeoPoint>& path, size_t maxPoints) {
    size_t count = path.size();
    if (count <= maxPoints) {
        return;
    }

    std::vector<GeoPoint> thinned;
    thinned.reserve(maxPoints);
    for (size_t i = 0; i < maxPoints; i++) {
        thinned.push_back(path[i * (count - 1) / (maxPoints - 1)]);
    }
    path.swap(thinned);
}

static void zoneToJson(const Zone& zone, JsonObject obj) {
    obj["id"] = zone.id;
    obj["name"] = zone.name;
    obj["latitude"] = zone.center.latitude;
    obj["longitude"] = zone.center.longitude;
    obj["radius"] = zone.radiusKm;
    obj["color"] = zone.color;
}

static bool zoneFromJson(JsonObjectConst obj, Zone& zone) {
    const char* id = obj["id"] | "";
    const char* name = obj["name"] | "";
    float radius = obj["radius"] | 0.0f;

    if (id[0] == '\0' || name[0] == '\0' || !(radius > 0.0f)) {
        return false;
    }

    memset(&zone, 0, sizeof(zone));
    copyString(zone.id, sizeof(zone.id), id);
    copyString(zone.name, sizeof(zone.name), name);
    zone.center.latitude = obj["latitude"] | 0.0;
    zone.center.longitude = obj["longitude"] | 0.0;
    zone.radiusKm = radius;
    copyString(zone.color, sizeof(zone.color), obj["color"] | "");
    return true;
}

WalkStore::WalkStore(HAL_BlobStorage* storage, const char* path)
    : m_storage(storage)
    , m_path(path)
    , m_initialized(false)
    , m_hasHome(false)
    , m_zoneCount(0)
    , m_loadFailed(false)
    , m_saveCount(0)
    , m_saveFailures(0)
    , m_walksEvicted(0)
{
    memset(m_lastError, 0, sizeof(m_lastError));
    memset(m_lastEvictedWalkId, 0, sizeof(m_lastEvictedWalkId));
    loadDefaults();
}

WalkStore::~WalkStore() {
}

bool WalkStore::begin() {
    if (m_initialized) {
        return true;
    }

    DEBUG_LOG_STORE("WalkStore: Initializing...");

    if (!m_storage) {
        setError("No storage backend");
        return false;
    }

    if (!m_storage->begin()) {
        setError("Failed to mount storage");
        DEBUG_LOG_STORE("WalkStore: Failed to mount storage");
        return false;
    }

    loadDefaults();

    if (m_storage->recover(m_path)) {
        LOG_WARN("WalkStore: Recovered %s from an interrupted write", m_path);
    }

    if (m_storage->exists(m_path)) {
        DEBUG_LOG_STORE("WalkStore: %s found, loading...", m_path);
        if (!load()) {
            // Saves stay blocked until a load succeeds or the store is reset
            m_loadFailed = true;
            LOG_ERROR("WalkStore: Load failed (%s), running on defaults without saving",
                      m_lastError);
        }
    } else {
        DEBUG_LOG_STORE("WalkStore: No store found, writing defaults");
        save();
    }

    m_initialized = true;
    LOG_INFO("WalkStore: home=%s, zones=%u, walks=%u, reminder=%s/%uh",
             m_hasHome ? "set" : "unset", m_zoneCount, (unsigned)m_walks.size(),
             m_settings.enabled ? "on" : "off", m_settings.hours);
    return true;
}

bool WalkStore::load() {
    if (!m_storage) {
        setError("No storage backend");
        return false;
    }

    std::string blob;
    if (!m_storage->read(m_path, blob)) {
        setError("Failed to read store file");
        return false;
    }

    if (blob.empty() || blob.size() > STORE_MAX_FILE_SIZE) {
        setError("Invalid store file size");
        return false;
    }

    bool result = fromJSON(blob.c_str());
    if (result) {
        m_loadFailed = false;
        DEBUG_LOG_STORE("WalkStore: Loaded %u bytes", (unsigned)blob.size());
    } else {
        DEBUG_LOG_STORE("WalkStore: Failed to parse store (%s)", m_lastError);
    }

    return result;
}

bool WalkStore::save() {
    if (!m_storage) {
        setError("No storage backend");
        m_saveFailures++;
        return false;
    }

    if (m_loadFailed) {
        setError("Store file unreadable, not overwriting");
        LOG_ERROR("WalkStore: Save refused, %s could not be loaded", m_path);
        m_saveFailures++;
        return false;
    }

    std::string json;
    if (!toJSON(json)) {
        LOG_ERROR("WalkStore: Save failed, %s", m_lastError);
        m_saveFailures++;
        return false;
    }

    if (json.size() > STORE_MAX_FILE_SIZE) {
        setError("Store exceeds maximum file size");
        LOG_ERROR("WalkStore: Save failed, %u bytes exceeds limit", (unsigned)json.size());
        m_saveFailures++;
        return false;
    }

    if (!m_storage->write(m_path, json)) {
        setError("Failed to write store file");
        LOG_ERROR("WalkStore: Save failed, write error");
        m_saveFailures++;
        return false;
    }

    m_saveCount++;
    DEBUG_LOG_STORE("WalkStore: Saved %u bytes (zones=%u, walks=%u)",
                    (unsigned)json.size(), m_zoneCount, (unsigned)m_walks.size());
    return true;
}

bool WalkStore::reset(bool save) {
    LOG_WARN("WalkStore: Resetting to factory defaults");
    loadDefaults();
    m_loadFailed = false;

    if (save) {
        return this->save();
    }

    return true;
}

bool WalkStore::validate() {
    if (m_hasHome && !(m_homeZone.radiusKm > 0.0f)) {
        setError("Invalid home radius");
        return false;
    }

    if (m_zoneCount > MAX_CUSTOM_ZONES) {
        setError("Too many zones");
        return false;
    }

    for (uint8_t i = 0; i < m_zoneCount; i++) {
        if (m_zones[i].name[0] == '\0' || !(m_zones[i].radiusKm > 0.0f)) {
            setError("Invalid zone");
            return false;
        }
    }

    if (m_settings.hours < REMINDER_MIN_HOURS || m_settings.hours > REMINDER_MAX_HOURS) {
        setError("Invalid reminder hours (1-12)");
        return false;
    }

    return true;
}

// ============================================================================
// Serialization
// ============================================================================

bool WalkStore::toJSON(std::string& out) {
    DynamicJsonDocument doc(jsonCapacity());

    doc["version"] = STORE_FORMAT_VERSION;

    if (m_hasHome) {
        zoneToJson(m_homeZone, doc.createNestedObject("homeZone"));
    } else {
        doc["homeZone"] = nullptr;
    }

    JsonArray zones = doc.createNestedArray("customZones");
    for (uint8_t i = 0; i < m_zoneCount; i++) {
        zoneToJson(m_zones[i], zones.createNestedObject());
    }

    JsonArray walks = doc.createNestedArray("walks");
    for (size_t i = 0; i < m_walks.size(); i++) {
        const Walk& walk = m_walks[i];
        JsonObject obj = walks.createNestedObject();
        obj["id"] = walk.id;
        obj["startTime"] = walk.startTime;
        if (walk.endTime) {
            obj["endTime"] = walk.endTime;
        } else {
            obj["endTime"] = nullptr;
        }
        obj["duration"] = walk.durationSeconds;
        obj["distance"] = walk.distanceKm;

        JsonArray path = obj.createNestedArray("path");
        for (size_t p = 0; p < walk.path.size(); p++) {
            JsonObject point = path.createNestedObject();
            point["lat"] = walk.path[p].latitude;
            point["lng"] = walk.path[p].longitude;
        }

        JsonArray visited = obj.createNestedArray("zonesVisited");
        for (size_t z = 0; z < walk.zonesVisited.size(); z++) {
            visited.add(walk.zonesVisited[z].c_str());
        }
    }

    JsonObject settings = doc.createNestedObject("settings");
    settings["enabled"] = m_settings.enabled;
    settings["hours"] = m_settings.hours;

    if (doc.overflowed()) {
        setError("JSON document too small");
        return false;
    }

    out.clear();
    serializeJson(doc, out);
    return true;
}

bool WalkStore::fromJSON(const char* json) {
    if (!json) {
        setError("Null JSON");
        return false;
    }

    size_t length = strlen(json);
    DEBUG_LOG_STORE("WalkStore: Parsing %u bytes", (unsigned)length);

    DynamicJsonDocument doc(parsedCapacity(json));
    if (doc.capacity() == 0) {
        setError("Not enough memory to parse store");
        LOG_ERROR("WalkStore: Cannot allocate document for %u bytes", (unsigned)length);
        return false;
    }

    DeserializationError error = deserializeJson(doc, json);

    if (error) {
        setError(error.c_str());
        LOG_ERROR("WalkStore: JSON parse error: %s", error.c_str());
        return false;
    }

    if (!doc.is<JsonObject>()) {
        setError("Store root is not an object");
        return false;
    }

    // Build the new state aside so a rejected document changes nothing
    Zone home;
    memset(&home, 0, sizeof(home));
    bool hasHome = false;

    JsonObjectConst homeObj = doc["homeZone"];
    if (!homeObj.isNull()) {
        if (zoneFromJson(homeObj, home)) {
            hasHome = true;
        } else {
            LOG_WARN("WalkStore: Ignoring invalid home zone");
        }
    }

    std::vector<Zone> zones;
    JsonArrayConst zonesArr = doc["customZones"];
    for (JsonObjectConst obj : zonesArr) {
        Zone zone;
        if (!zoneFromJson(obj, zone)) {
            LOG_WARN("WalkStore: Skipping invalid zone");
            continue;
        }
        if (zones.size() >= MAX_CUSTOM_ZONES) {
            LOG_WARN("WalkStore: Zone limit reached, dropping '%s'", zone.name);
            continue;
        }
        zones.push_back(zone);
    }

    std::vector<Walk> walks;
    JsonArrayConst walksArr = doc["walks"];
    for (JsonObjectConst obj : walksArr) {
        const char* id = obj["id"] | "";
        uint64_t endTime = obj["endTime"].isNull() ? 0 : obj["endTime"].as<uint64_t>();
        if (id[0] == '\0' || endTime == 0) {
            LOG_WARN("WalkStore: Skipping incomplete walk '%s'", id);
            continue;
        }

        Walk walk;
        copyString(walk.id, sizeof(walk.id), id);
        walk.startTime = obj["startTime"].as<uint64_t>();
        walk.endTime = endTime;
        walk.durationSeconds = obj["duration"] | 0u;
        walk.distanceKm = obj["distance"] | 0.0;

        JsonArrayConst path = obj["path"];
        walk.path.reserve(path.size());
        for (JsonObjectConst point : path) {
            GeoPoint p;
            p.latitude = point["lat"] | 0.0;
            p.longitude = point["lng"] | 0.0;
            walk.path.push_back(p);
        }

        JsonArrayConst visited = obj["zonesVisited"];
        for (JsonVariantConst name : visited) {
            const char* zoneName = name.as<const char*>();
            if (zoneName && !walk.hasVisited(zoneName)) {
                walk.zonesVisited.push_back(zoneName);
            }
        }

        walks.push_back(std::move(walk));
    }

    NotificationSettings settings;
    settings.enabled = doc["settings"]["enabled"] | false;
    int hours = doc["settings"]["hours"] | REMINDER_DEFAULT_HOURS;
    if (hours < REMINDER_MIN_HOURS || hours > REMINDER_MAX_HOURS) {
        LOG_WARN("WalkStore: Reminder hours %d out of range, using %d", hours, REMINDER_DEFAULT_HOURS);
        hours = REMINDER_DEFAULT_HOURS;
    }
    settings.hours = (uint8_t)hours;

    // Commit
    m_homeZone = home;
    m_hasHome = hasHome;
    m_zoneCount = (uint8_t)zones.size();
    for (uint8_t i = 0; i < m_zoneCount; i++) {
        m_zones[i] = zones[i];
    }
    m_walks.swap(walks);
    m_settings = settings;

    DEBUG_LOG_STORE("WalkStore: home=%s, zones=%u, walks=%u",
                    m_hasHome ? "set" : "unset", m_zoneCount, (unsigned)m_walks.size());
    return true;
}

// ============================================================================
// Home Zone
// ============================================================================

bool WalkStore::setHome(const GeoPoint& center) {
    memset(&m_homeZone, 0, sizeof(m_homeZone));
    copyString(m_homeZone.id, sizeof(m_homeZone.id), HOME_ZONE_ID);
    copyString(m_homeZone.name, sizeof(m_homeZone.name), HOME_ZONE_NAME);
    copyString(m_homeZone.color, sizeof(m_homeZone.color), HOME_ZONE_COLOR);
    m_homeZone.center = center;
    m_homeZone.radiusKm = HOME_RADIUS_KM;
    m_hasHome = true;

    LOG_INFO("WalkStore: Home set to %.6f, %.6f", center.latitude, center.longitude);
    return save();
}

// ============================================================================
// Named Zones
// ============================================================================

const Zone* WalkStore::getZone(uint8_t index) const {
    if (index >= m_zoneCount) {
        return nullptr;
    }
    return &m_zones[index];
}

const Zone* WalkStore::findZone(const char* id) const {
    if (!id) {
        return nullptr;
    }

    for (uint8_t i = 0; i < m_zoneCount; i++) {
        if (strcmp(m_zones[i].id, id) == 0) {
            return &m_zones[i];
        }
    }
    return nullptr;
}

const Zone* WalkStore::addZone(const char* name, const GeoPoint& center, float radiusKm,
                               const char* color, uint64_t nowMs) {
    if (!color) {
        color = s_palette[0];
    }

    if (!validateZone(name, radiusKm, color)) {
        LOG_WARN("WalkStore: Zone rejected: %s", m_lastError);
        return nullptr;
    }

    if (m_zoneCount >= MAX_CUSTOM_ZONES) {
        setError("Zone limit reached");
        LOG_WARN("WalkStore: Zone rejected: %s", m_lastError);
        return nullptr;
    }

    Zone& zone = m_zones[m_zoneCount];
    memset(&zone, 0, sizeof(zone));

    // Ids are "zone_<ms>"; two adds in the same millisecond take the next free ms
    uint64_t stamp = nowMs;
    do {
        snprintf(zone.id, sizeof(zone.id), "zone_%llu", (unsigned long long)stamp);
        stamp++;
    } while (findZone(zone.id) != nullptr);

    copyString(zone.name, sizeof(zone.name), name);
    zone.center = center;
    zone.radiusKm = radiusKm;
    copyString(zone.color, sizeof(zone.color), color);
    m_zoneCount++;

    LOG_INFO("WalkStore: Added zone %s '%s' (%.0f m)", zone.id, zone.name, radiusKm * 1000.0f);
    save();
    return &zone;
}

bool WalkStore::deleteZone(const char* id) {
    if (!id) {
        setError("Zone not found");
        return false;
    }

    for (uint8_t i = 0; i < m_zoneCount; i++) {
        if (strcmp(m_zones[i].id, id) == 0) {
            LOG_INFO("WalkStore: Deleted zone %s '%s'", m_zones[i].id, m_zones[i].name);
            for (uint8_t j = i; j + 1 < m_zoneCount; j++) {
                m_zones[j] = m_zones[j + 1];
            }
            m_zoneCount--;
            memset(&m_zones[m_zoneCount], 0, sizeof(Zone));
            return save();
        }
    }

    setError("Zone not found");
    return false;
}

bool WalkStore::isPaletteColor(const char* color) {
    if (!color) {
        return false;
    }

    for (uint8_t i = 0; i < ZONE_PALETTE_SIZE; i++) {
        if (strcmp(s_palette[i], color) == 0) {
            return true;
        }
    }
    return false;
}

const char* WalkStore::getPaletteColor(uint8_t index) {
    if (index >= ZONE_PALETTE_SIZE) {
        return nullptr;
    }
    return s_palette[index];
}

// ============================================================================
// Walk History
// ============================================================================

const Walk* WalkStore::findWalk(const char* id) const {
    if (!id) {
        return nullptr;
    }

    for (size_t i = 0; i < m_walks.size(); i++) {
        if (strcmp(m_walks[i].id, id) == 0) {
            return &m_walks[i];
        }
    }
    return nullptr;
}

const Walk* WalkStore::getLastWalk() const {
    const Walk* last = nullptr;
    for (size_t i = 0; i < m_walks.size(); i++) {
        if (!last || m_walks[i].endTime > last->endTime) {
            last = &m_walks[i];
        }
    }
    return last;
}

bool WalkStore::addWalk(Walk&& walk) {
    if (!walk.isComplete()) {
        setError("Walk has no end time");
        return false;
    }

    if (findWalk(walk.id) != nullptr) {
        setError("Duplicate walk id");
        LOG_WARN("WalkStore: Walk %s already recorded", walk.id);
        return false;
    }

    if (walk.path.size() > WALK_PATH_MAX_POINTS) {
        DEBUG_LOG_STORE("WalkStore: Thinning %s path from %u to %u points",
                        walk.id, (unsigned)walk.path.size(), (unsigned)WALK_PATH_MAX_POINTS);
        thinPath(walk.path, WALK_PATH_MAX_POINTS);
    }

    if (m_walks.size() >= WALK_HISTORY_MAX) {
        size_t oldest = 0;
        for (size_t i = 1; i < m_walks.size(); i++) {
            if (m_walks[i].endTime < m_walks[oldest].endTime) {
                oldest = i;
            }
        }
        LOG_WARN("WalkStore: History full, dropping %s", m_walks[oldest].id);
        copyString(m_lastEvictedWalkId, sizeof(m_lastEvictedWalkId), m_walks[oldest].id);
        m_walksEvicted++;
        m_walks.erase(m_walks.begin() + oldest);
    }

    LOG_INFO("WalkStore: Recorded walk %s (%lu s, %.3f km)",
             walk.id, (unsigned long)walk.durationSeconds, walk.distanceKm);
    m_walks.push_back(std::move(walk));
    return save();
}

bool WalkStore::deleteWalk(const char* id) {
    if (!id) {
        setError("Walk not found");
        return false;
    }

    for (size_t i = 0; i < m_walks.size(); i++) {
        if (strcmp(m_walks[i].id, id) == 0) {
            LOG_INFO("WalkStore: Deleted walk %s", id);
            m_walks.erase(m_walks.begin() + i);
            return save();
        }
    }

    setError("Walk not found");
    return false;
}

// ============================================================================
// Notification Settings
// ============================================================================

bool WalkStore::setNotificationSettings(const NotificationSettings& settings) {
    if (settings.hours < REMINDER_MIN_HOURS || settings.hours > REMINDER_MAX_HOURS) {
        setError("Invalid reminder hours (1-12)");
        return false;
    }

    m_settings = settings;
    LOG_INFO("WalkStore: Reminder %s, %u hours",
             m_settings.enabled ? "enabled" : "disabled", m_settings.hours);
    return save();
}

const char* WalkStore::getLastError() const {
    return m_lastError;
}

// ============================================================================
// Private
// ============================================================================

void WalkStore::loadDefaults() {
    DEBUG_LOG_STORE("WalkStore: Loading factory defaults");

    memset(&m_homeZone, 0, sizeof(m_homeZone));
    m_hasHome = false;
    memset(m_zones, 0, sizeof(m_zones));
    m_zoneCount = 0;
    m_walks.clear();
    m_settings.enabled = false;
    m_settings.hours = REMINDER_DEFAULT_HOURS;
}

size_t WalkStore::jsonCapacity() const {
    size_t capacity = JSON_OBJECT_SIZE(5)                       // root
                    + JSON_OBJECT_SIZE(6)                       // homeZone
                    + JSON_ARRAY_SIZE(m_zoneCount)
                    + m_zoneCount * JSON_OBJECT_SIZE(6)
                    + JSON_ARRAY_SIZE(m_walks.size())
                    + JSON_OBJECT_SIZE(2);                      // settings

    // Strings from char arrays are copied into the document
    capacity += (m_zoneCount + 1) * (ZONE_ID_MAX_LEN + ZONE_NAME_MAX_LEN + ZONE_COLOR_MAX_LEN);

    for (size_t i = 0; i < m_walks.size(); i++) {
        const Walk& walk = m_walks[i];
        capacity += JSON_OBJECT_SIZE(7)
                  + JSON_ARRAY_SIZE(walk.path.size())
                  + walk.path.size() * JSON_OBJECT_SIZE(2)
                  + JSON_ARRAY_SIZE(walk.zonesVisited.size())
                  + WALK_ID_MAX_LEN;
    }

    return capacity + 256;
}

bool WalkStore::validateZone(const char* name, float radiusKm, const char* color) {
    if (!name || name[0] == '\0') {
        setError("Zone name is empty");
        return false;
    }

    if (strlen(name) >= ZONE_NAME_MAX_LEN) {
        setError("Zone name too long");
        return false;
    }

    if (!(radiusKm > 0.0f)) {
        setError("Zone radius must be positive");
        return false;
    }

    if (!isPaletteColor(color)) {
        setError("Zone color not in palette");
        return false;
    }

    return true;
}

void WalkStore::setError(const char* error) {
    snprintf(m_lastError, sizeof(m_lastError), "%s", error);
}
