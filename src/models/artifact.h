#ifndef PRISM_ARTIFACT_H
#define PRISM_ARTIFACT_H

#include <string>
#include <vector>
#include <memory>
#include <ctime>
#include <nlohmann/json.hpp>

namespace prism {

/**
 * @brief Encoded output of a successful transform (or an original)
 *
 * Artifacts are shared read-only; the bytes are never modified after
 * construction, so eviction from the cache never invalidates a copy a
 * caller already holds.
 */
struct Artifact {
    std::shared_ptr<const std::vector<char>> data;
    std::string fingerprint;
    std::string format;        // Canonical format name ("jpeg", "png", ...)
    int width = 0;
    int height = 0;
    size_t size_bytes = 0;
    std::time_t created_at = 0;

    std::string mimeType() const;

    // Storage key of the encoded bytes in the persistent cache tier
    static std::string storageKey(const std::string& fingerprint, const std::string& format);

    // Storage key of the JSON sidecar holding the metadata
    static std::string metadataKey(const std::string& fingerprint);

    // Metadata only; bytes are never serialized into JSON
    nlohmann::json toJson() const;

    static Artifact fromJson(const nlohmann::json& j);
};

using ArtifactPtr = std::shared_ptr<const Artifact>;

} // namespace prism

#endif // PRISM_ARTIFACT_H
