/**
 * @file memory_blob_storage.h
 * @brief In-memory HAL_BlobStorage for native unit tests.
 */
#ifndef WALKAWARE_MEMORY_BLOB_STORAGE_H
#define WALKAWARE_MEMORY_BLOB_STORAGE_H

#include <map>
#include <string>
#include "hal_blob_storage.h"

class MemoryBlobStorage : public HAL_BlobStorage {
public:
    bool mounted = false;
    bool failMount = false;
    bool failWrites = false;
    unsigned writeCount = 0;
    std::map<std::string, std::string> blobs;

    bool begin() override {
        mounted = !failMount;
        return mounted;
    }

    bool exists(const char* path) override {
        return blobs.find(path) != blobs.end();
    }

    bool read(const char* path, std::string& out) override {
        std::map<std::string, std::string>::const_iterator it = blobs.find(path);
        if (it == blobs.end()) {
            return false;
        }
        out = it->second;
        return true;
    }

    bool write(const char* path, const std::string& data) override {
        if (failWrites) {
            return false;
        }
        blobs[path] = data;
        writeCount++;
        return true;
    }

    bool remove(const char* path) override {
        blobs.erase(path);
        return true;
    }

    bool rename(const char* from, const char* to) override {
        std::map<std::string, std::string>::iterator it = blobs.find(from);
        if (it == blobs.end()) {
            return false;
        }
        std::string data = it->second;
        blobs.erase(it);
        blobs[to] = data;
        return true;
    }
};

#endif // WALKAWARE_MEMORY_BLOB_STORAGE_H
