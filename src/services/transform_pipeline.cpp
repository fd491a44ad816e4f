#include "transform_pipeline.h"
#include "fingerprint_engine.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace prism {

TransformPipeline::TransformPipeline(const PipelineConfig& config,
                                     std::shared_ptr<ImageService> image_service,
                                     std::shared_ptr<ImageProcessor> image_processor,
                                     std::shared_ptr<CacheManager> cache_manager,
                                     std::shared_ptr<RateLimiter> rate_limiter,
                                     std::shared_ptr<DatabaseClientInterface> db_client)
    : config_(config),
      image_service_(std::move(image_service)),
      image_processor_(std::move(image_processor)),
      cache_manager_(std::move(cache_manager)),
      rate_limiter_(std::move(rate_limiter)) {
    scheduler_ = std::make_shared<JobScheduler>(
        config_,
        [this](const JobRequest& request) { return runJob(request); },
        cache_manager_,
        std::move(db_client));
}

TransformPipeline::~TransformPipeline() {
    stop();
}

bool TransformPipeline::start() {
    return scheduler_->start();
}

void TransformPipeline::stop() {
    scheduler_->stop();
}

Delivery TransformPipeline::submitTransform(const std::string& image_id,
                                            const TransformSpec& spec,
                                            const std::string& output_format,
                                            const RequestIdentity& identity) {
    authenticate(identity);
    admit(identity, ActionClass::TRANSFORM);

    ImageMetadata image = image_service_->getImageRecord(image_id, identity);
    return resolveTransform(image, spec, output_format, identity, false);
}

Delivery TransformPipeline::getImage(const std::string& image_id,
                                     const std::optional<TransformSpec>& spec,
                                     const std::string& output_format,
                                     const RequestIdentity& identity) {
    authenticate(identity);
    admit(identity, ActionClass::READ);

    ImageMetadata image = image_service_->getImageRecord(image_id, identity);

    bool no_ops = !spec || spec->empty();
    bool same_format = output_format.empty() ||
                       image_formats::normalize(output_format) == image.format();

    if (no_ops && same_format) {
        std::vector<char> bytes = image_service_->loadOriginal(image);

        Artifact original;
        original.fingerprint = image.content_hash;
        original.format = image.format();
        original.width = image.width;
        original.height = image.height;
        original.size_bytes = bytes.size();
        original.created_at = image.created_at;
        original.data = std::make_shared<const std::vector<char>>(std::move(bytes));

        METRICS_COUNT("DeliveryRequests", 1.0, "Count", {{"source", "original"}});
        Delivery delivery;
        delivery.artifact = std::make_shared<const Artifact>(std::move(original));
        return delivery;
    }

    return resolveTransform(image, spec.value_or(TransformSpec()), output_format, identity, true);
}

JobStatus TransformPipeline::authorizedStatus(const std::string& job_id,
                                              const RequestIdentity& identity) const {
    std::optional<JobStatus> current = scheduler_->status(job_id);
    if (!current) {
        throw exceptions::NotFoundException("Job not found: " + job_id);
    }
    if (!current->requestedBy(identity.user_id)) {
        prism::Logger::log_structured(spdlog::level::warn, "Job access denied", {
            {"job_id", job_id},
            {"user_id", identity.user_id}
        });
        throw exceptions::ForbiddenException("Job " + job_id + " was requested by another user");
    }
    return *current;
}

JobStatus TransformPipeline::getJobStatus(const std::string& job_id, const RequestIdentity& identity) {
    authenticate(identity);
    admit(identity, ActionClass::READ);

    return authorizedStatus(job_id, identity);
}

JobStatus TransformPipeline::getJobResult(const std::string& job_id, const RequestIdentity& identity) {
    JobStatus status = getJobStatus(job_id, identity);
    requireResult(status);
    return status;
}

void TransformPipeline::requireResult(const JobStatus& status) {
    const JobRecord& record = status.record;
    if (record.state == JobState::FAILED) {
        if (record.error_kind == JobErrorKind::TIMEOUT) {
            throw exceptions::TimeoutException("Job " + record.job_id + " timed out: " +
                                               record.error_message);
        }
        throw exceptions::ExecutionException("Job " + record.job_id + " failed: " +
                                             record.error_message);
    }
    if (record.state == JobState::SUCCEEDED && !status.artifact) {
        // Evicted from the cache after the job finished
        throw exceptions::NotFoundException("Result for job " + record.job_id +
                                            " is no longer cached");
    }
}

JobStatus TransformPipeline::waitForJob(const std::string& job_id,
                                        std::chrono::milliseconds timeout,
                                        const RequestIdentity& identity) {
    authenticate(identity);
    admit(identity, ActionClass::READ);

    if (timeout.count() < 0) {
        throw exceptions::ValidationException("Wait timeout must be non-negative");
    }
    authorizedStatus(job_id, identity);

    JobStatus status = scheduler_->wait(job_id, timeout);
    if (!status.requestedBy(identity.user_id)) {
        // Reclaimed and recovered from the database while waiting
        throw exceptions::ForbiddenException("Job " + job_id + " was requested by another user");
    }
    return status;
}

bool TransformPipeline::cancelJob(const std::string& job_id, const RequestIdentity& identity) {
    authenticate(identity);

    std::optional<JobStatus> current = scheduler_->status(job_id);
    if (!current) {
        throw exceptions::NotFoundException("Job not found: " + job_id);
    }
    if (current->record.user_id != identity.user_id) {
        throw exceptions::ForbiddenException("Job " + job_id + " was requested by another user");
    }

    bool cancelled = scheduler_->cancel(job_id);
    prism::Logger::log_structured(spdlog::level::info, "Cancel requested", {
        {"job_id", job_id},
        {"user_id", identity.user_id},
        {"cancelled", cancelled}
    });
    return cancelled;
}

std::string TransformPipeline::resolveOutputFormat(const TransformSpec& spec,
                                                   const std::string& requested_format,
                                                   const ImageMetadata& source) {
    if (auto from_spec = spec.formatOverride()) {
        return image_formats::requireSupported(*from_spec);
    }
    if (!requested_format.empty()) {
        return image_formats::requireSupported(requested_format);
    }
    std::string source_format = source.format();
    if (image_formats::isSupported(source_format)) {
        return source_format;
    }
    return "jpeg";
}

nlohmann::json TransformPipeline::healthSnapshot() const {
    return {
        {"cache", cache_manager_->stats().toJson()},
        {"scheduler", scheduler_->stats().toJson()},
        {"running", scheduler_->isRunning()},
        {"rateLimitBuckets", rate_limiter_ ? rate_limiter_->bucketCount() : 0},
        {"metrics", prism::Metrics::get()->summariesJson()}
    };
}

void TransformPipeline::authenticate(const RequestIdentity& identity) const {
    if (!identity.authenticated || identity.user_id.empty()) {
        prism::Logger::log_structured(spdlog::level::debug, "Unauthenticated request rejected", {
            {"client_ip", identity.client_ip}
        });
        throw exceptions::UnauthorizedException("Authentication required");
    }
}

void TransformPipeline::admit(const RequestIdentity& identity, ActionClass action) const {
    if (rate_limiter_) {
        rate_limiter_->admit(identity.admissionKey(), action);
    }
}

Delivery TransformPipeline::resolveTransform(const ImageMetadata& image,
                                             const TransformSpec& spec,
                                             const std::string& output_format,
                                             const RequestIdentity& identity,
                                             bool admit_on_miss) {
    spec.validate();
    checkOverlays(spec, identity);

    std::string format = resolveOutputFormat(spec, output_format, image);

    // Reject crops outside the image before anything is queued
    spec.planOutputDimensions(Dimensions{image.width, image.height});

    std::string fingerprint = FingerprintEngine::fingerprint(image.content_hash, spec, format);

    Delivery delivery;
    if (ArtifactPtr cached = cache_manager_->get(fingerprint)) {
        prism::Logger::log_structured(spdlog::level::info, "Cache hit", {
            {"fingerprint", fingerprint},
            {"image_id", image.image_id},
            {"format", format}
        });
        METRICS_COUNT("DeliveryRequests", 1.0, "Count", {{"source", "cache"}});
        delivery.artifact = cached;
        delivery.from_cache = true;
        return delivery;
    }

    prism::Logger::log_structured(spdlog::level::info, "Cache miss - scheduling transform", {
        {"fingerprint", fingerprint},
        {"image_id", image.image_id},
        {"format", format},
        {"operations", spec.size()}
    });

    if (admit_on_miss) {
        admit(identity, ActionClass::TRANSFORM);
    }

    JobRequest request;
    request.fingerprint = fingerprint;
    request.image_id = image.image_id;
    request.user_id = identity.user_id;
    request.output_format = format;
    request.spec = spec;

    delivery.job = scheduler_->submit(request);
    METRICS_COUNT("DeliveryRequests", 1.0, "Count", {{"source", "job"}});
    return delivery;
}

void TransformPipeline::checkOverlays(const TransformSpec& spec, const RequestIdentity& identity) {
    for (const std::string& overlay_id : spec.overlayReferences()) {
        std::optional<ImageMetadata> overlay = image_service_->findImage(overlay_id);
        if (!overlay) {
            throw exceptions::ValidationException("Watermark overlay image not found: " + overlay_id);
        }
        if (overlay->owner_id != identity.user_id) {
            throw exceptions::ForbiddenException("Watermark overlay " + overlay_id +
                                                 " belongs to another user");
        }
    }
}

Artifact TransformPipeline::runJob(const JobRequest& request) {
    std::optional<ImageMetadata> image = image_service_->findImage(request.image_id);
    if (!image) {
        throw exceptions::ExecutionException("Source image no longer exists: " + request.image_id);
    }

    std::vector<char> source = image_service_->loadOriginal(*image);

    OverlayLoader overlay_loader = [this](const std::string& overlay_id) -> std::vector<char> {
        std::optional<ImageMetadata> overlay = image_service_->findImage(overlay_id);
        if (!overlay) {
            return {};
        }
        return image_service_->loadOriginal(*overlay);
    };

    return image_processor_->execute(source, request.spec, request.output_format,
                                     request.fingerprint, overlay_loader);
}

} // namespace prism
