#include "job_controller.h"
#include "../middleware/auth_middleware.h"

using json = nlohmann::json;

namespace prism {

JobController::JobController(std::shared_ptr<TransformPipeline> pipeline,
                             std::shared_ptr<ConfigServiceInterface> config_service)
    : pipeline_(std::move(pipeline)),
      config_service_(std::move(config_service)) {
}

std::chrono::milliseconds JobController::parseWait(const char* value) {
    if (!value) {
        return std::chrono::milliseconds(0);
    }

    long long parsed = 0;
    try {
        size_t consumed = 0;
        parsed = std::stoll(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw exceptions::ValidationException("wait_ms must be an integer");
        }
    } catch (const std::logic_error&) {
        throw exceptions::ValidationException("wait_ms must be an integer");
    }

    parsed = std::max<long long>(0, std::min<long long>(parsed, JobPollLimits::MAX_WAIT_MS));
    return std::chrono::milliseconds(parsed);
}

crow::response JobController::handleStatus(const crow::request& req, const std::string& job_id) {
    return http::handleErrors("/api/jobs/:id", [&]() {
        RequestIdentity identity = middleware::AuthMiddleware::authenticate(req, *config_service_);

        std::chrono::milliseconds wait = parseWait(req.url_params.get("wait_ms"));
        JobStatus status = wait.count() > 0
            ? pipeline_->waitForJob(job_id, wait, identity)
            : pipeline_->getJobStatus(job_id, identity);

        return http::jsonResponse(200, status.toJson());
    });
}

crow::response JobController::handleResult(const crow::request& req, const std::string& job_id) {
    return http::handleErrors("/api/jobs/:id/result", [&]() {
        RequestIdentity identity = middleware::AuthMiddleware::authenticate(req, *config_service_);
        JobStatus status = pipeline_->getJobResult(job_id, identity);

        switch (status.state()) {
            case JobState::SUCCEEDED:
                return http::artifactResponse(*status.artifact, false);

            case JobState::CANCELLED:
                return http::jsonResponse(409, {
                    {"error", "Job cancelled"},
                    {"job", status.toJson()}
                });

            case JobState::FAILED:
            case JobState::QUEUED:
            case JobState::RUNNING:
                break;
        }

        JobHandle handle{status.record.job_id, status.record.fingerprint, false};
        return http::pendingResponse(handle);
    });
}

crow::response JobController::handleCancel(const crow::request& req, const std::string& job_id) {
    return http::handleErrors("/api/jobs/:id", [&]() {
        RequestIdentity identity = middleware::AuthMiddleware::authenticate(req, *config_service_);

        bool cancelled = pipeline_->cancelJob(job_id, identity);

        json body = {{"jobId", job_id}, {"cancelled", cancelled}};
        if (auto status = pipeline_->scheduler()->status(job_id)) {
            body["state"] = jobStateToString(status->state());
        }
        return http::jsonResponse(cancelled ? 200 : 409, body);
    });
}

} // namespace prism
