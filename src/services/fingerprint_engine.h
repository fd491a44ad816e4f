#ifndef PRISM_FINGERPRINT_ENGINE_H
#define PRISM_FINGERPRINT_ENGINE_H

#include <string>
#include "../models/transform_spec.h"

namespace prism {

/**
 * @brief Derives cache and deduplication keys for transform requests
 *
 * The fingerprint is the SHA256 (hex) of the source content hash, the
 * canonical spec and the output format, with a version tag so the key
 * space can be rotated if the canonical encoding ever changes.
 */
class FingerprintEngine {
public:
    static constexpr const char* VERSION_TAG = "prism-fp-v1";

    /**
     * @brief Compute the fingerprint of (source, spec, format)
     * @param content_hash SHA256 hex of the original image bytes
     * @param spec Ordered transform spec (validated here)
     * @param output_format Resolved output format ("jpeg", "png", ...)
     * @return 64 character lowercase hex digest
     * @throws exceptions::ValidationException on an invalid spec, an
     *         unsupported format or an empty content hash
     */
    static std::string fingerprint(const std::string& content_hash,
                                   const TransformSpec& spec,
                                   const std::string& output_format);

    // The exact byte string that is hashed, exposed for diagnostics
    static std::string fingerprintInput(const std::string& content_hash,
                                        const TransformSpec& spec,
                                        const std::string& output_format);

    // 64 lowercase hex characters
    static bool isValidFingerprint(const std::string& value);
};

} // namespace prism

#endif // PRISM_FINGERPRINT_ENGINE_H
