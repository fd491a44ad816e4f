#include "cache_manager.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/file_utils.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace prism {

nlohmann::json CacheStats::toJson() const {
    return {
        {"hits", hits},
        {"misses", misses},
        {"evictions", evictions},
        {"entries", entries},
        {"bytes", bytes}
    };
}

CacheManager::CacheManager(size_t max_entries, size_t max_bytes,
                           std::shared_ptr<FileServiceInterface> file_service)
    : max_entries_(max_entries),
      max_bytes_(max_bytes),
      file_service_(std::move(file_service)) {
    prism::Logger::log_structured(spdlog::level::info, "Artifact cache initialized", {
        {"max_entries", max_entries_},
        {"max_bytes", max_bytes_},
        {"persistent_tier", file_service_ != nullptr}
    });
}

ArtifactPtr CacheManager::get(const std::string& fingerprint) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it != entries_.end()) {
            lru_.splice(lru_.begin(), lru_, it->second.lru_it);
            ++hits_;
            METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "hit"}});
            LOG_DEBUG("Cache hit (memory): {}", fingerprint);
            return it->second.artifact;
        }
    }

    ArtifactPtr persisted = loadPersistent(fingerprint);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!persisted) {
        ++misses_;
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "miss"}});
        LOG_DEBUG("Cache miss: {}", fingerprint);
        return nullptr;
    }

    ++hits_;
    METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "get"}, {"status", "hit_persistent"}});
    prism::Logger::log_structured(spdlog::level::debug, "Cache hit (persistent tier)", {
        {"fingerprint", fingerprint},
        {"size_bytes", persisted->size_bytes}
    });

    // Another thread may have promoted it meanwhile
    auto it = entries_.find(fingerprint);
    if (it != entries_.end()) {
        lru_.splice(lru_.begin(), lru_, it->second.lru_it);
        return it->second.artifact;
    }
    insertLocked(fingerprint, persisted);
    return persisted;
}

void CacheManager::put(const std::string& fingerprint, ArtifactPtr artifact) {
    if (!artifact || !artifact->data) {
        throw std::invalid_argument("Cannot cache an empty artifact");
    }

    auto timer = prism::Metrics::get()->start_timer("CacheDuration", {{"operation", "put"}});

    if (file_service_) {
        storePersistent(fingerprint, *artifact);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = entries_.find(fingerprint);
    if (existing != entries_.end()) {
        current_bytes_ -= existing->second.artifact->size_bytes;
        lru_.erase(existing->second.lru_it);
        entries_.erase(existing);
    }

    if (artifact->size_bytes > max_bytes_) {
        prism::Logger::log_structured(spdlog::level::info, "Artifact exceeds memory cache capacity, not retained", {
            {"fingerprint", fingerprint},
            {"size_bytes", artifact->size_bytes},
            {"max_bytes", max_bytes_}
        });
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "oversize"}});
        return;
    }

    insertLocked(fingerprint, std::move(artifact));
    METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "success"}});
}

bool CacheManager::remove(const std::string& fingerprint) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(fingerprint);
        if (it != entries_.end()) {
            current_bytes_ -= it->second.artifact->size_bytes;
            lru_.erase(it->second.lru_it);
            entries_.erase(it);
            removed = true;
        }
    }

    if (file_service_) {
        std::string meta_key = Artifact::metadataKey(fingerprint);
        std::vector<char> sidecar = file_service_->downloadData(meta_key);
        if (!sidecar.empty()) {
            try {
                Artifact meta = Artifact::fromJson(nlohmann::json::parse(sidecar.begin(), sidecar.end()));
                removed = file_service_->deleteObject(Artifact::storageKey(fingerprint, meta.format)) || removed;
            } catch (const std::exception& e) {
                LOG_WARN("Unreadable cache sidecar for {}: {}", fingerprint, e.what());
            }
            removed = file_service_->deleteObject(meta_key) || removed;
        }
    }

    if (removed) {
        LOG_DEBUG("Cache entry removed: {}", fingerprint);
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "remove"}, {"status", "success"}});
    }
    return removed;
}

void CacheManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = entries_.size();
    entries_.clear();
    lru_.clear();
    current_bytes_ = 0;
    LOG_INFO("Artifact cache cleared ({} entries)", dropped);
}

bool CacheManager::contains(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(fingerprint) > 0;
}

CacheStats CacheManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.evictions = evictions_;
    s.entries = entries_.size();
    s.bytes = current_bytes_;
    return s;
}

void CacheManager::insertLocked(const std::string& fingerprint, ArtifactPtr artifact) {
    lru_.push_front(fingerprint);
    current_bytes_ += artifact->size_bytes;
    entries_[fingerprint] = Entry{std::move(artifact), lru_.begin()};
    evictLocked();
}

void CacheManager::evictLocked() {
    // The newest entry fits on its own, so eviction never removes it
    while (entries_.size() > max_entries_ || current_bytes_ > max_bytes_) {
        const std::string& victim = lru_.back();
        auto it = entries_.find(victim);
        current_bytes_ -= it->second.artifact->size_bytes;

        prism::Logger::log_structured(spdlog::level::debug, "Evicted artifact from cache", {
            {"fingerprint", victim},
            {"size_bytes", it->second.artifact->size_bytes},
            {"entries", entries_.size() - 1},
            {"bytes", current_bytes_}
        });

        entries_.erase(it);
        lru_.pop_back();
        ++evictions_;
        METRICS_COUNT("CacheEvictions", 1.0, "Count");
    }
}

ArtifactPtr CacheManager::loadPersistent(const std::string& fingerprint) {
    if (!file_service_) {
        return nullptr;
    }

    std::vector<char> sidecar = file_service_->downloadData(Artifact::metadataKey(fingerprint));
    if (sidecar.empty()) {
        return nullptr;
    }

    try {
        Artifact artifact = Artifact::fromJson(nlohmann::json::parse(sidecar.begin(), sidecar.end()));
        std::vector<char> bytes = file_service_->downloadData(Artifact::storageKey(fingerprint, artifact.format));
        if (bytes.empty() || bytes.size() != artifact.size_bytes) {
            prism::Logger::log_structured(spdlog::level::warn, "Persistent cache entry incomplete", {
                {"fingerprint", fingerprint},
                {"expected_bytes", artifact.size_bytes},
                {"actual_bytes", bytes.size()}
            });
            return nullptr;
        }
        artifact.fingerprint = fingerprint;
        artifact.data = std::make_shared<const std::vector<char>>(std::move(bytes));
        return std::make_shared<const Artifact>(std::move(artifact));
    } catch (const std::exception& e) {
        LOG_WARN("Unreadable cache sidecar for {}: {}", fingerprint, e.what());
        return nullptr;
    }
}

void CacheManager::storePersistent(const std::string& fingerprint, const Artifact& artifact) {
    std::string data_key = Artifact::storageKey(fingerprint, artifact.format);
    std::string meta_key = Artifact::metadataKey(fingerprint);
    std::string content_type = utils::FileUtils::getMimeType(artifact.format);

    // Bytes before the sidecar: a sidecar is only visible once its data is complete
    bool success = file_service_->uploadData(*artifact.data, data_key, content_type);
    if (success) {
        std::string meta = artifact.toJson().dump();
        success = file_service_->uploadData(std::vector<char>(meta.begin(), meta.end()),
                                            meta_key, "application/json");
    }

    if (!success) {
        prism::Logger::log_structured(spdlog::level::err, "Failed to write artifact to persistent cache", {
            {"fingerprint", fingerprint},
            {"storage_key", data_key},
            {"size_bytes", artifact.size_bytes}
        });
        METRICS_COUNT("CacheOperations", 1.0, "Count", {{"operation", "put"}, {"status", "failure"}});
        throw exceptions::CacheUnavailableException("Persistent cache tier unavailable for " + fingerprint);
    }

    prism::Logger::log_structured(spdlog::level::info, "Cached transformed image", {
        {"fingerprint", fingerprint},
        {"storage_key", data_key},
        {"format", artifact.format},
        {"width", artifact.width},
        {"height", artifact.height},
        {"size_bytes", artifact.size_bytes}
    });
}

} // namespace prism
