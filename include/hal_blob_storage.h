#ifndef WALKAWARE_HAL_BLOB_STORAGE_H
#define WALKAWARE_HAL_BLOB_STORAGE_H

#include <stddef.h>
#include <string>

/**
 * @file hal_blob_storage.h
 * @brief Abstract base class for whole-file blob storage
 *
 * WalkStore persists its state as a single document that is read once at
 * boot and rewritten in full on every mutation. This interface is the only
 * thing the store knows about the filesystem, so the store can be unit
 * tested against an in-memory implementation.
 *
 * Usage:
 * ```cpp
 * HAL_BlobStorage* storage = new HAL_LittleFSStorage();
 * storage->begin();
 *
 * std::string blob;
 * if (storage->read("/walkaware.json", blob)) {
 *     // Parse blob
 * }
 * ```
 */
class HAL_BlobStorage {
public:
    virtual ~HAL_BlobStorage() = default;

    /**
     * @brief Mount the underlying storage
     *
     * @return true if storage is usable
     */
    virtual bool begin() = 0;

    /**
     * @brief Check whether a blob exists
     */
    virtual bool exists(const char* path) = 0;

    /**
     * @brief Read a whole blob
     *
     * @param path Blob path
     * @param out Receives the blob contents
     * @return true if the blob was read
     */
    virtual bool read(const char* path, std::string& out) = 0;

    /**
     * @brief Replace a blob with new contents
     *
     * @param path Blob path
     * @param data New contents
     * @return true if every byte was written
     */
    virtual bool write(const char* path, const std::string& data) = 0;

    /**
     * @brief Delete a blob
     *
     * @return true if removed (or already absent)
     */
    virtual bool remove(const char* path) = 0;

    /**
     * @brief Rename a blob, replacing any existing target in one step
     *
     * @return true if renamed
     */
    virtual bool rename(const char* from, const char* to) = 0;

    /**
     * @brief Temporary path a blob is staged at while being written
     */
    static std::string tempPathFor(const char* path) {
        return std::string(path) + ".tmp";
    }

    /**
     * @brief Finish a replace that was interrupted before its rename
     *
     * A staged copy is promoted only when the blob itself is missing. A
     * staged copy beside an existing blob may be partial and is removed.
     *
     * @param path Blob path
     * @return true if the staged copy became the blob
     */
    bool recover(const char* path) {
        std::string temp = tempPathFor(path);
        if (!exists(temp.c_str())) {
            return false;
        }

        if (exists(path)) {
            remove(temp.c_str());
            return false;
        }

        return rename(temp.c_str(), path);
    }

    virtual size_t getUsedBytes() const { return 0; }
    virtual size_t getTotalBytes() const { return 0; }
};

#endif // WALKAWARE_HAL_BLOB_STORAGE_H
