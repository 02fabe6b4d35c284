#include "hal_littlefs_storage.h"
#include "config.h"
#include "logger.h"
#include "debug_logger.h"
#include <Arduino.h>
#include <LittleFS.h>

HAL_LittleFSStorage::HAL_LittleFSStorage()
    : m_mounted(false)
{
}

HAL_LittleFSStorage::~HAL_LittleFSStorage() {
    // LittleFS cleanup handled by framework
}

bool HAL_LittleFSStorage::begin() {
    if (m_mounted) {
        return true;
    }

    if (!LittleFS.begin(true)) {  // true = format on fail
        LOG_ERROR("Storage: Failed to mount LittleFS");
        return false;
    }

    m_mounted = true;
    DEBUG_LOG_STORE("Storage: LittleFS mounted (%u / %u bytes used)",
                    (unsigned)LittleFS.usedBytes(), (unsigned)LittleFS.totalBytes());
    return true;
}

bool HAL_LittleFSStorage::exists(const char* path) {
    return m_mounted && LittleFS.exists(path);
}

bool HAL_LittleFSStorage::read(const char* path, std::string& out) {
    if (!m_mounted) {
        return false;
    }

    File file = LittleFS.open(path, "r");
    if (!file) {
        DEBUG_LOG_STORE("Storage: Cannot open %s for reading", path);
        return false;
    }

    size_t size = file.size();
    if (size > STORE_MAX_FILE_SIZE) {
        LOG_ERROR("Storage: %s too large (%u bytes)", path, (unsigned)size);
        file.close();
        return false;
    }

    out.clear();
    out.resize(size);
    size_t readBytes = size > 0 ? file.readBytes(&out[0], size) : 0;
    file.close();

    if (readBytes != size) {
        LOG_ERROR("Storage: Short read on %s (%u of %u bytes)",
                  path, (unsigned)readBytes, (unsigned)size);
        out.clear();
        return false;
    }

    DEBUG_LOG_STORE("Storage: Read %s (%u bytes)", path, (unsigned)size);
    return true;
}

bool HAL_LittleFSStorage::write(const char* path, const std::string& data) {
    if (!m_mounted) {
        return false;
    }

    std::string tempPath = tempPathFor(path);

    File file = LittleFS.open(tempPath.c_str(), "w");
    if (!file) {
        LOG_ERROR("Storage: Cannot open %s for writing", tempPath.c_str());
        return false;
    }

    size_t written = file.write((const uint8_t*)data.data(), data.size());
    file.close();

    if (written != data.size()) {
        LOG_ERROR("Storage: Short write on %s (%u of %u bytes)",
                  tempPath.c_str(), (unsigned)written, (unsigned)data.size());
        LittleFS.remove(tempPath.c_str());
        return false;
    }

    // Rename replaces the target atomically; never remove it first
    if (!LittleFS.rename(tempPath.c_str(), path)) {
        LOG_ERROR("Storage: Rename %s -> %s failed", tempPath.c_str(), path);
        LittleFS.remove(tempPath.c_str());
        return false;
    }

    DEBUG_LOG_STORE("Storage: Wrote %s (%u bytes)", path, (unsigned)written);
    return true;
}

bool HAL_LittleFSStorage::remove(const char* path) {
    if (!m_mounted) {
        return false;
    }

    if (!LittleFS.exists(path)) {
        return true;
    }

    bool ok = LittleFS.remove(path);
    DEBUG_LOG_STORE("Storage: Remove %s %s", path, ok ? "OK" : "FAILED");
    return ok;
}

bool HAL_LittleFSStorage::rename(const char* from, const char* to) {
    if (!m_mounted) {
        return false;
    }

    bool ok = LittleFS.rename(from, to);
    DEBUG_LOG_STORE("Storage: Rename %s -> %s %s", from, to, ok ? "OK" : "FAILED");
    return ok;
}

size_t HAL_LittleFSStorage::getUsedBytes() const {
    return m_mounted ? LittleFS.usedBytes() : 0;
}

size_t HAL_LittleFSStorage::getTotalBytes() const {
    return m_mounted ? LittleFS.totalBytes() : 0;
}
