#include "image_metadata.h"
#include "../utils/file_utils.h"

namespace prism {

ImageMetadata::ImageMetadata()
    : image_id(""), owner_id(""), content_hash(""), storage_key(""),
      mime_type(""), name(""), size_bytes(0), width(0), height(0), created_at(0) {}

ImageMetadata::ImageMetadata(const std::string& id, const std::string& owner,
                             const std::string& hash, const std::string& mime,
                             size_t size, int w, int h)
    : image_id(id), owner_id(owner), content_hash(hash), storage_key(""),
      mime_type(mime), name(""), size_bytes(size), width(w), height(h),
      created_at(std::time(nullptr)) {}

std::string ImageMetadata::generateRawKey(const std::string& hash, const std::string& extension) {
    return "raw/" + hash + "." + extension;
}

std::string ImageMetadata::format() const {
    return utils::FileUtils::getFormatFromMimeType(mime_type);
}

nlohmann::json ImageMetadata::toJson() const {
    nlohmann::json j;
    j["id"] = image_id;
    j["owner"] = owner_id;
    j["name"] = name;
    j["contentHash"] = content_hash;
    j["storageKey"] = storage_key;
    j["mimeType"] = mime_type;
    j["size"] = size_bytes;
    j["width"] = width;
    j["height"] = height;
    j["createdAt"] = formatTimestamp(created_at);
    j["createdAtEpoch"] = static_cast<long long>(created_at);
    return j;
}

ImageMetadata ImageMetadata::fromJson(const nlohmann::json& j) {
    ImageMetadata metadata;
    metadata.image_id = j.value("id", "");
    metadata.owner_id = j.value("owner", "");
    metadata.name = j.value("name", "");
    metadata.content_hash = j.value("contentHash", "");
    metadata.storage_key = j.value("storageKey", "");
    metadata.mime_type = j.value("mimeType", "");
    metadata.size_bytes = j.value("size", static_cast<size_t>(0));
    metadata.width = j.value("width", 0);
    metadata.height = j.value("height", 0);
    metadata.created_at = static_cast<std::time_t>(j.value("createdAtEpoch", 0LL));
    return metadata;
}

std::string formatTimestamp(std::time_t timestamp) {
    char buffer[80];
    std::tm timeinfo{};
    gmtime_r(&timestamp, &timeinfo);
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S.000Z", &timeinfo);
    return buffer;
}

} // namespace prism
