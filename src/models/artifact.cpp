#include "artifact.h"
#include "image_metadata.h"
#include "../utils/file_utils.h"

namespace prism {

std::string Artifact::mimeType() const {
    return utils::FileUtils::getMimeType(format);
}

std::string Artifact::storageKey(const std::string& fingerprint, const std::string& format) {
    return "transformed/" + fingerprint + "." + format;
}

std::string Artifact::metadataKey(const std::string& fingerprint) {
    return "transformed/" + fingerprint + ".json";
}

nlohmann::json Artifact::toJson() const {
    return {
        {"fingerprint", fingerprint},
        {"format", format},
        {"mimeType", mimeType()},
        {"width", width},
        {"height", height},
        {"size", size_bytes},
        {"createdAt", formatTimestamp(created_at)},
        {"createdAtEpoch", static_cast<long long>(created_at)}
    };
}

Artifact Artifact::fromJson(const nlohmann::json& j) {
    Artifact artifact;
    artifact.fingerprint = j.value("fingerprint", "");
    artifact.format = j.value("format", "");
    artifact.width = j.value("width", 0);
    artifact.height = j.value("height", 0);
    artifact.size_bytes = j.value("size", static_cast<size_t>(0));
    artifact.created_at = static_cast<std::time_t>(j.value("createdAtEpoch", 0LL));
    return artifact;
}

} // namespace prism
