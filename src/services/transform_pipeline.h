#ifndef PRISM_TRANSFORM_PIPELINE_H
#define PRISM_TRANSFORM_PIPELINE_H

#include "cache_manager.h"
#include "image_processor.h"
#include "image_service.h"
#include "job_scheduler.h"
#include "rate_limiter.h"
#include "../interfaces/database_client_interface.h"
#include "../models/pipeline_config.h"
#include "../models/request_identity.h"
#include "../models/transform_spec.h"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace prism {

/**
 * @brief Outcome of a delivery request
 *
 * Exactly one of artifact and job is set: the artifact when it could be
 * served immediately, the job handle when a transform is pending.
 */
struct Delivery {
    ArtifactPtr artifact;
    std::optional<JobHandle> job;
    bool from_cache = false;

    bool ready() const { return artifact != nullptr; }
};

/**
 * @brief Request-facing surface of the pipeline (delivery resolver)
 *
 * Every entry point authenticates, then runs admission, before any other
 * work. Transform requests are validated and fingerprinted; cache hits are
 * returned directly and misses become scheduler jobs.
 */
class TransformPipeline {
public:
    TransformPipeline(const PipelineConfig& config,
                      std::shared_ptr<ImageService> image_service,
                      std::shared_ptr<ImageProcessor> image_processor,
                      std::shared_ptr<CacheManager> cache_manager,
                      std::shared_ptr<RateLimiter> rate_limiter,
                      std::shared_ptr<DatabaseClientInterface> db_client = nullptr);
    ~TransformPipeline();

    TransformPipeline(const TransformPipeline&) = delete;
    TransformPipeline& operator=(const TransformPipeline&) = delete;

    bool start();
    void stop();

    /**
     * @brief Request a transform of an owned image
     * @param output_format Requested format, empty to fall back to the source format
     * @return Cached artifact or a handle to the job producing it
     * @throws exceptions::UnauthorizedException, ThrottledException,
     *         NotFoundException, ForbiddenException, ValidationException
     */
    Delivery submitTransform(const std::string& image_id,
                             const TransformSpec& spec,
                             const std::string& output_format,
                             const RequestIdentity& identity);

    /**
     * @brief Resolve an image, optionally transformed
     *
     * Without a spec and without a format change the stored original is
     * returned. Otherwise behaves like submitTransform.
     */
    Delivery getImage(const std::string& image_id,
                      const std::optional<TransformSpec>& spec,
                      const std::string& output_format,
                      const RequestIdentity& identity);

    /**
     * Only users whose submit created or attached to the job may read it.
     * @throws exceptions::UnauthorizedException, ThrottledException, NotFoundException,
     *         ForbiddenException
     */
    JobStatus getJobStatus(const std::string& job_id, const RequestIdentity& identity);

    /**
     * @brief Status of a job whose result the caller wants to download
     *
     * Like getJobStatus, but a failed job surfaces its error.
     * @throws exceptions::TimeoutException when the job ran out of its budget
     * @throws exceptions::ExecutionException when the transform failed
     * @throws exceptions::NotFoundException when the artifact is no longer cached
     */
    JobStatus getJobResult(const std::string& job_id, const RequestIdentity& identity);

    // Raise the error recorded on a failed job; no-op for other states
    static void requireResult(const JobStatus& status);

    /**
     * @brief Block until the job is terminal or the timeout elapses
     * @throws exceptions::UnauthorizedException, ThrottledException, NotFoundException,
     *         ForbiddenException
     */
    JobStatus waitForJob(const std::string& job_id,
                         std::chrono::milliseconds timeout,
                         const RequestIdentity& identity);

    /**
     * @brief Cancel a queued job requested by the caller
     * @return true if the job was cancelled, false if it already started or finished
     * @throws exceptions::UnauthorizedException, NotFoundException, ForbiddenException
     */
    bool cancelJob(const std::string& job_id, const RequestIdentity& identity);

    /**
     * @brief Output format for a request
     *
     * Last format operation, else the requested format, else the source
     * image's format, else jpeg.
     * @throws exceptions::ValidationException for unsupported formats
     */
    static std::string resolveOutputFormat(const TransformSpec& spec,
                                           const std::string& requested_format,
                                           const ImageMetadata& source);

    nlohmann::json healthSnapshot() const;

    const std::shared_ptr<JobScheduler>& scheduler() const { return scheduler_; }
    const std::shared_ptr<CacheManager>& cacheManager() const { return cache_manager_; }

private:
    JobStatus authorizedStatus(const std::string& job_id, const RequestIdentity& identity) const;

    PipelineConfig config_;
    std::shared_ptr<ImageService> image_service_;
    std::shared_ptr<ImageProcessor> image_processor_;
    std::shared_ptr<CacheManager> cache_manager_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<JobScheduler> scheduler_;

    void authenticate(const RequestIdentity& identity) const;
    void admit(const RequestIdentity& identity, ActionClass action) const;

    // Everything after admission for a transform request
    Delivery resolveTransform(const ImageMetadata& image,
                              const TransformSpec& spec,
                              const std::string& output_format,
                              const RequestIdentity& identity,
                              bool admit_on_miss);

    void checkOverlays(const TransformSpec& spec, const RequestIdentity& identity);

    Artifact runJob(const JobRequest& request);
};

} // namespace prism

#endif // PRISM_TRANSFORM_PIPELINE_H
