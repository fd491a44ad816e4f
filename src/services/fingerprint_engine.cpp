#include "fingerprint_engine.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/file_utils.h"
#include <algorithm>

namespace prism {

std::string FingerprintEngine::fingerprintInput(const std::string& content_hash,
                                                const TransformSpec& spec,
                                                const std::string& output_format) {
    if (content_hash.empty()) {
        throw exceptions::ValidationException("Source content hash is required for fingerprinting");
    }

    std::string format = image_formats::requireSupported(output_format);
    std::string canonical = spec.canonicalize();

    return std::string(VERSION_TAG) + "\n" + content_hash + "\n" + canonical + "\n" + format;
}

std::string FingerprintEngine::fingerprint(const std::string& content_hash,
                                           const TransformSpec& spec,
                                           const std::string& output_format) {
    std::string digest = utils::FileUtils::calculateSHA256(
        fingerprintInput(content_hash, spec, output_format));

    if (digest.empty()) {
        throw exceptions::ExecutionException("SHA256 digest unavailable");
    }
    return digest;
}

bool FingerprintEngine::isValidFingerprint(const std::string& value) {
    return value.size() == 64 &&
           std::all_of(value.begin(), value.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

} // namespace prism
