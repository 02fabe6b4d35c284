#ifndef WALKAWARE_HAL_LITTLEFS_STORAGE_H
#define WALKAWARE_HAL_LITTLEFS_STORAGE_H

#include "hal_blob_storage.h"

/**
 * @brief Blob storage on the ESP32 LittleFS partition
 *
 * Writes go through a temporary file that is renamed over the target once
 * every byte is on flash. LittleFS renames atomically, so the target is
 * always either the old or the new blob. A reset before the rename leaves
 * the previous blob in place; recover() handles a missing target.
 */
class HAL_LittleFSStorage : public HAL_BlobStorage {
public:
    HAL_LittleFSStorage();
    ~HAL_LittleFSStorage() override;

    /**
     * @brief Mount LittleFS (formats the partition if mounting fails)
     *
     * @return true if mounted
     */
    bool begin() override;

    bool exists(const char* path) override;
    bool read(const char* path, std::string& out) override;
    bool write(const char* path, const std::string& data) override;
    bool remove(const char* path) override;
    bool rename(const char* from, const char* to) override;

    size_t getUsedBytes() const override;
    size_t getTotalBytes() const override;

private:
    bool m_mounted;
};

#endif // WALKAWARE_HAL_LITTLEFS_STORAGE_H
