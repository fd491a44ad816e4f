#ifndef PRISM_IMAGE_SERVICE_H
#define PRISM_IMAGE_SERVICE_H

#include "../interfaces/database_client_interface.h"
#include "../interfaces/file_service_interface.h"
#include "../models/image_metadata.h"
#include "../models/request_identity.h"
#include "image_processor.h"
#include "rate_limiter.h"
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace prism {

namespace ImageUploadLimits {
    constexpr size_t MAX_FILE_SIZE = 100 * 1024 * 1024;  // 100MB
    constexpr int DEFAULT_LIST_LIMIT = 100;
    constexpr int MAX_LIST_LIMIT = 1000;
}

/**
 * @brief Ingestion and ownership of original images
 *
 * Originals are stored once per content hash; every upload still gets its
 * own image id, so two users uploading the same bytes own distinct images.
 */
class ImageService {
public:
    ImageService(std::shared_ptr<FileServiceInterface> file_service,
                 std::shared_ptr<DatabaseClientInterface> db_client,
                 std::shared_ptr<ImageProcessor> image_processor,
                 std::shared_ptr<RateLimiter> rate_limiter = nullptr);

    /**
     * @brief Validate, store and register an uploaded original
     * @throws exceptions::UnauthorizedException for anonymous callers
     * @throws exceptions::ThrottledException when the upload budget is spent
     * @throws exceptions::ValidationException for empty, oversized,
     *         unsupported or undecodable files
     * @throws std::runtime_error when storage or the database fails
     */
    ImageMetadata uploadImage(const std::vector<char>& data,
                              const std::string& filename,
                              const RequestIdentity& identity);

    /**
     * @brief Image record, visible to its owner only
     * @throws exceptions::NotFoundException, exceptions::ForbiddenException
     */
    ImageMetadata getImageRecord(const std::string& image_id, const RequestIdentity& identity);

    // Record lookup without an ownership check; nullopt if unknown
    std::optional<ImageMetadata> findImage(const std::string& image_id);

    /**
     * @brief Bytes of a stored original
     * @throws exceptions::NotFoundException if the blob is missing
     */
    std::vector<char> loadOriginal(const ImageMetadata& image);

    // The caller's images, newest first
    std::vector<ImageMetadata> listImages(const RequestIdentity& identity, int limit, int offset);

    /**
     * @brief Delete an image record; the stored original goes with the last
     *        record referencing its content hash
     * @throws exceptions::NotFoundException, exceptions::ForbiddenException
     */
    void deleteImage(const std::string& image_id, const RequestIdentity& identity);

private:
    std::shared_ptr<FileServiceInterface> file_service_;
    std::shared_ptr<DatabaseClientInterface> db_client_;
    std::shared_ptr<ImageProcessor> image_processor_;
    std::shared_ptr<RateLimiter> rate_limiter_;

    // Uploads and deletes sharing a content hash run one at a time, so a
    // delete never removes a blob a concurrent upload just deduplicated onto
    static constexpr size_t HASH_LOCK_STRIPES = 64;
    std::array<std::mutex, HASH_LOCK_STRIPES> hash_locks_;

    std::mutex& lockFor(const std::string& content_hash);
    void requireAuthenticated(const RequestIdentity& identity) const;
    ImageMetadata requireOwned(const std::string& image_id, const RequestIdentity& identity);
};

} // namespace prism

#endif // PRISM_IMAGE_SERVICE_H
