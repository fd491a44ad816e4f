#ifndef PRISM_IMAGE_METADATA_H
#define PRISM_IMAGE_METADATA_H

#include <string>
#include <ctime>
#include <nlohmann/json.hpp>

namespace prism {

/**
 * @brief Immutable record of an uploaded original image
 */
struct ImageMetadata {
    std::string image_id;          // Opaque id ("img_<ts>_<uuid>")
    std::string owner_id;          // User that uploaded the image
    std::string content_hash;      // SHA256 hex of the original bytes
    std::string storage_key;       // Storage key of the original bytes
    std::string mime_type;         // e.g. "image/jpeg"
    std::string name;              // Original filename without extension
    size_t size_bytes;             // Original byte size
    int width;                     // Pixels
    int height;                    // Pixels
    std::time_t created_at;        // Upload time

    ImageMetadata();
    ImageMetadata(const std::string& id, const std::string& owner,
                  const std::string& hash, const std::string& mime,
                  size_t size, int w, int h);

    // Storage key for an original: raw/<content_hash>.<extension>
    static std::string generateRawKey(const std::string& hash, const std::string& extension);

    // Canonical format name of the original ("jpeg", "png", ...)
    std::string format() const;

    // Convert to JSON for API responses and persistence
    nlohmann::json toJson() const;

    static ImageMetadata fromJson(const nlohmann::json& j);
};

// ISO 8601 UTC rendering shared by the model serializers
std::string formatTimestamp(std::time_t timestamp);

} // namespace prism

#endif // PRISM_IMAGE_METADATA_H
