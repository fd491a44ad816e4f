#ifndef PRISM_INTERFACES_DATABASE_CLIENT_INTERFACE_H
#define PRISM_INTERFACES_DATABASE_CLIENT_INTERFACE_H

#include <string>
#include <vector>
#include <optional>
#include "../models/image_metadata.h"
#include "../models/job.h"

namespace prism {

/**
 * @brief Database-agnostic interface for image and job records
 *
 * This interface abstracts away the underlying database implementation.
 * Implementations must be safe to call from several threads.
 */
class DatabaseClientInterface {
public:
    virtual ~DatabaseClientInterface() = default;

    /**
     * @brief Store or update image metadata
     * @param metadata The image metadata to store
     * @return true if successful, false otherwise
     */
    virtual bool putImageMetadata(const ImageMetadata& metadata) = 0;

    /**
     * @brief Retrieve image metadata by ID
     * @param image_id The image ID to retrieve
     * @return Optional image metadata if found, nullopt otherwise
     */
    virtual std::optional<ImageMetadata> getImageMetadata(const std::string& image_id) = 0;

    /**
     * @brief Delete an image record
     * @return true if a record was removed
     */
    virtual bool deleteImageMetadata(const std::string& image_id) = 0;

    /**
     * @brief List one owner's images, newest first
     * @param owner_id Owner to filter by
     * @param limit Maximum number of images to return
     * @param offset Number of images to skip
     */
    virtual std::vector<ImageMetadata> listImages(const std::string& owner_id,
                                                  int limit, int offset) = 0;

    /**
     * @brief Count images still referencing a content hash
     *
     * Originals are stored by content hash, so the stored bytes may only be
     * removed once no image references them.
     */
    virtual int countImagesWithHash(const std::string& content_hash) = 0;

    /**
     * @brief Check if an image exists in the database
     */
    virtual bool imageExists(const std::string& image_id) = 0;

    /**
     * @brief Insert or replace a job record (called on every state change)
     */
    virtual bool putJob(const JobRecord& job) = 0;

    virtual std::optional<JobRecord> getJob(const std::string& job_id) = 0;

    /**
     * @brief Delete a job record once its retention period has passed
     * @return true if a record was removed
     */
    virtual bool deleteJob(const std::string& job_id) = 0;

    // Jobs currently in the given state, oldest first
    virtual std::vector<JobRecord> listJobsByState(JobState state) = 0;
};

} // namespace prism

#endif // PRISM_INTERFACES_DATABASE_CLIENT_INTERFACE_H
