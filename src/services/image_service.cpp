#include "image_service.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/file_utils.h"
#include "../utils/id_generator.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>

namespace prism {

ImageService::ImageService(std::shared_ptr<FileServiceInterface> file_service,
                           std::shared_ptr<DatabaseClientInterface> db_client,
                           std::shared_ptr<ImageProcessor> image_processor,
                           std::shared_ptr<RateLimiter> rate_limiter)
    : file_service_(std::move(file_service)),
      db_client_(std::move(db_client)),
      image_processor_(std::move(image_processor)),
      rate_limiter_(std::move(rate_limiter)) {
}

ImageMetadata ImageService::uploadImage(const std::vector<char>& data,
                                        const std::string& filename,
                                        const RequestIdentity& identity) {
    requireAuthenticated(identity);

    if (rate_limiter_) {
        rate_limiter_->admit(identity.admissionKey(), ActionClass::UPLOAD);
    }

    auto timer = prism::Metrics::get()->start_timer("UploadDuration");

    std::string extension = utils::FileUtils::getFileExtension(filename);
    if (!utils::FileUtils::isValidImageFormat(extension)) {
        METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "invalid_extension"}});
        throw exceptions::ValidationException("Unsupported file type '" + extension +
                                              "'. Allowed: jpg, jpeg, png, gif, tiff, webp");
    }

    if (data.empty()) {
        throw exceptions::ValidationException("Uploaded file is empty");
    }

    if (data.size() > ImageUploadLimits::MAX_FILE_SIZE) {
        METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "too_large"}});
        throw exceptions::ValidationException("File too large. Maximum file size is 100MB");
    }

    if (!image_processor_->isValidImage(data)) {
        prism::Logger::log_structured(spdlog::level::warn, "Invalid image file uploaded", {
            {"filename", filename},
            {"extension", extension},
            {"user_id", identity.user_id}
        });
        METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "invalid_image"}});
        throw exceptions::ValidationException("File is not a decodable image");
    }

    ImageInfo info = image_processor_->getImageInfo(data);

    // Trust the decoder over the filename when they disagree
    std::string format = image_formats::isSupported(info.format)
        ? info.format
        : image_formats::normalize(extension);

    std::string content_hash = utils::FileUtils::calculateSHA256(data);
    if (content_hash.empty()) {
        throw std::runtime_error("Failed to hash uploaded image");
    }

    std::string storage_key = ImageMetadata::generateRawKey(content_hash, format);
    std::string content_type = utils::FileUtils::getMimeType(format);

    std::lock_guard<std::mutex> hash_lock(lockFor(content_hash));

    bool stored_now = false;
    if (file_service_->objectExists(storage_key)) {
        prism::Logger::log_structured(spdlog::level::info, "Original already stored (deduplicated)", {
            {"content_hash", content_hash},
            {"storage_key", storage_key},
            {"size_bytes", data.size()}
        });
        METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "deduplicated"}});
    } else {
        if (!file_service_->uploadData(data, storage_key, content_type)) {
            prism::Logger::log_structured(spdlog::level::err, "Failed to store original image", {
                {"content_hash", content_hash},
                {"storage_key", storage_key},
                {"content_type", content_type}
            });
            METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "storage_error"}});
            throw std::runtime_error("Failed to store uploaded image");
        }
        stored_now = true;
    }

    ImageMetadata metadata(utils::IdGenerator::generateImageId(), identity.user_id,
                           content_hash, content_type, data.size(), info.width, info.height);
    metadata.storage_key = storage_key;

    size_t dot = filename.find_last_of('.');
    metadata.name = dot == std::string::npos ? filename : filename.substr(0, dot);

    // Fail the upload if metadata storage fails, for consistency
    if (!db_client_->putImageMetadata(metadata)) {
        if (stored_now && !file_service_->deleteObject(storage_key)) {
            LOG_WARN("Failed to roll back stored original {}", storage_key);
        }
        prism::Logger::log_structured(spdlog::level::err, "Upload rolled back due to metadata storage failure", {
            {"image_id", metadata.image_id},
            {"storage_key", storage_key}
        });
        METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "metadata_storage_error"}});
        throw std::runtime_error("Failed to store image metadata");
    }

    prism::Logger::log_structured(spdlog::level::info, "Image uploaded successfully", {
        {"image_id", metadata.image_id},
        {"owner", metadata.owner_id},
        {"storage_key", storage_key},
        {"size_bytes", data.size()},
        {"content_type", content_type},
        {"width", metadata.width},
        {"height", metadata.height}
    });
    METRICS_COUNT("UploadOperations", 1.0, "Count", {{"status", "success"}});

    return metadata;
}

ImageMetadata ImageService::getImageRecord(const std::string& image_id, const RequestIdentity& identity) {
    requireAuthenticated(identity);
    return requireOwned(image_id, identity);
}

std::optional<ImageMetadata> ImageService::findImage(const std::string& image_id) {
    return db_client_->getImageMetadata(image_id);
}

std::vector<char> ImageService::loadOriginal(const ImageMetadata& image) {
    std::vector<char> data = file_service_->downloadData(image.storage_key);
    if (data.empty()) {
        prism::Logger::log_structured(spdlog::level::err, "Stored original missing", {
            {"image_id", image.image_id},
            {"storage_key", image.storage_key}
        });
        throw exceptions::NotFoundException("Original bytes not found for image " + image.image_id);
    }
    return data;
}

std::vector<ImageMetadata> ImageService::listImages(const RequestIdentity& identity, int limit, int offset) {
    requireAuthenticated(identity);

    if (limit < 1 || limit > ImageUploadLimits::MAX_LIST_LIMIT) {
        throw exceptions::ValidationException("limit must be between 1 and " +
                                              std::to_string(ImageUploadLimits::MAX_LIST_LIMIT));
    }
    if (offset < 0) {
        throw exceptions::ValidationException("offset must be non-negative");
    }

    return db_client_->listImages(identity.user_id, limit, offset);
}

void ImageService::deleteImage(const std::string& image_id, const RequestIdentity& identity) {
    requireAuthenticated(identity);
    ImageMetadata image = requireOwned(image_id, identity);

    {
        std::lock_guard<std::mutex> hash_lock(lockFor(image.content_hash));

        if (!db_client_->deleteImageMetadata(image_id)) {
            throw exceptions::NotFoundException("Image not found: " + image_id);
        }

        if (db_client_->countImagesWithHash(image.content_hash) == 0) {
            if (!file_service_->deleteObject(image.storage_key)) {
                LOG_WARN("Stored original {} was already gone", image.storage_key);
            }
        }
    }

    prism::Logger::log_structured(spdlog::level::info, "Image deleted", {
        {"image_id", image_id},
        {"owner", image.owner_id},
        {"content_hash", image.content_hash}
    });
    METRICS_COUNT("ImageDeletions", 1.0, "Count");
}

std::mutex& ImageService::lockFor(const std::string& content_hash) {
    return hash_locks_[std::hash<std::string>{}(content_hash) % HASH_LOCK_STRIPES];
}

void ImageService::requireAuthenticated(const RequestIdentity& identity) const {
    if (!identity.authenticated || identity.user_id.empty()) {
        throw exceptions::UnauthorizedException("Authentication required");
    }
}

ImageMetadata ImageService::requireOwned(const std::string& image_id, const RequestIdentity& identity) {
    std::optional<ImageMetadata> image = db_client_->getImageMetadata(image_id);
    if (!image) {
        throw exceptions::NotFoundException("Image not found: " + image_id);
    }
    if (image->owner_id != identity.user_id) {
        prism::Logger::log_structured(spdlog::level::warn, "Access to foreign image denied", {
            {"image_id", image_id},
            {"user_id", identity.user_id}
        });
        throw exceptions::ForbiddenException("Image " + image_id + " belongs to another user");
    }
    return *image;
}

} // namespace prism
