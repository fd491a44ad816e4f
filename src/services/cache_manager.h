#ifndef PRISM_CACHE_MANAGER_H
#define PRISM_CACHE_MANAGER_H

#include "../interfaces/file_service_interface.h"
#include "../models/artifact.h"
#include <string>
#include <memory>
#include <list>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace prism {

struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t evictions = 0;
    size_t entries = 0;
    size_t bytes = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Fingerprint -> artifact cache
 *
 * In-memory LRU bounded by entry count and encoded bytes, optionally backed
 * by a persistent tier on a FileServiceInterface. Memory misses fall through
 * to the persistent tier and are promoted on a hit.
 *
 * Thread-safe. Artifacts are shared read-only, so evicting an entry never
 * invalidates a pointer a caller already holds.
 */
class CacheManager {
public:
    /**
     * @param max_entries Maximum number of artifacts kept in memory
     * @param max_bytes Maximum total encoded bytes kept in memory
     * @param file_service Persistent tier; nullptr for memory only
     */
    CacheManager(size_t max_entries, size_t max_bytes,
                 std::shared_ptr<FileServiceInterface> file_service = nullptr);
    ~CacheManager() = default;

    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    // Complete artifact or nullptr on a miss
    ArtifactPtr get(const std::string& fingerprint);

    /**
     * @brief Store an artifact under its fingerprint
     *
     * The persistent tier is written first; the artifact is only indexed
     * once that succeeds. Artifacts larger than max_bytes are persisted but
     * not kept in memory.
     * @throws exceptions::CacheUnavailableException if the persistent tier
     *         cannot be written
     */
    void put(const std::string& fingerprint, ArtifactPtr artifact);

    // Drop from memory and the persistent tier; true if anything was removed
    bool remove(const std::string& fingerprint);

    // Drop every in-memory entry (the persistent tier is left alone)
    void clear();

    // In-memory membership only, does not touch LRU order
    bool contains(const std::string& fingerprint) const;

    CacheStats stats() const;

    size_t maxEntries() const { return max_entries_; }
    size_t maxBytes() const { return max_bytes_; }

private:
    struct Entry {
        ArtifactPtr artifact;
        std::list<std::string>::iterator lru_it;
    };

    size_t max_entries_;
    size_t max_bytes_;
    std::shared_ptr<FileServiceInterface> file_service_;

    mutable std::mutex mutex_;
    std::list<std::string> lru_;  // Front is most recently used
    std::unordered_map<std::string, Entry> entries_;
    size_t current_bytes_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;

    // Caller holds mutex_
    void insertLocked(const std::string& fingerprint, ArtifactPtr artifact);
    void evictLocked();

    ArtifactPtr loadPersistent(const std::string& fingerprint);
    void storePersistent(const std::string& fingerprint, const Artifact& artifact);
};

} // namespace prism

#endif // PRISM_CACHE_MANAGER_H
