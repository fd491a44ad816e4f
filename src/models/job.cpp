#include "job.h"
#include "image_metadata.h"

namespace prism {

std::string jobStateToString(JobState state) {
    switch (state) {
        case JobState::QUEUED: return "queued";
        case JobState::RUNNING: return "running";
        case JobState::SUCCEEDED: return "succeeded";
        case JobState::FAILED: return "failed";
        case JobState::CANCELLED: return "cancelled";
    }
    return "unknown";
}

std::optional<JobState> jobStateFromString(const std::string& value) {
    if (value == "queued") return JobState::QUEUED;
    if (value == "running") return JobState::RUNNING;
    if (value == "succeeded") return JobState::SUCCEEDED;
    if (value == "failed") return JobState::FAILED;
    if (value == "cancelled") return JobState::CANCELLED;
    return std::nullopt;
}

bool isTerminal(JobState state) {
    return state == JobState::SUCCEEDED ||
           state == JobState::FAILED ||
           state == JobState::CANCELLED;
}

std::string jobErrorKindToString(JobErrorKind kind) {
    switch (kind) {
        case JobErrorKind::NONE: return "none";
        case JobErrorKind::EXECUTION: return "execution";
        case JobErrorKind::TIMEOUT: return "timeout";
    }
    return "none";
}

JobErrorKind jobErrorKindFromString(const std::string& value) {
    if (value == "execution") return JobErrorKind::EXECUTION;
    if (value == "timeout") return JobErrorKind::TIMEOUT;
    return JobErrorKind::NONE;
}

nlohmann::json JobRecord::toJson() const {
    nlohmann::json j = {
        {"jobId", job_id},
        {"fingerprint", fingerprint},
        {"imageId", image_id},
        {"userId", user_id},
        {"format", output_format},
        {"spec", canonical_spec},
        {"state", jobStateToString(state)},
        {"enqueuedAt", formatTimestamp(enqueued_at)},
        {"enqueuedAtEpoch", static_cast<long long>(enqueued_at)}
    };

    if (started_at > 0) {
        j["startedAt"] = formatTimestamp(started_at);
        j["startedAtEpoch"] = static_cast<long long>(started_at);
    }
    if (completed_at > 0) {
        j["completedAt"] = formatTimestamp(completed_at);
        j["completedAtEpoch"] = static_cast<long long>(completed_at);
    }
    if (error_kind != JobErrorKind::NONE) {
        j["error"] = {
            {"kind", jobErrorKindToString(error_kind)},
            {"message", error_message}
        };
    }
    return j;
}

JobRecord JobRecord::fromJson(const nlohmann::json& j) {
    JobRecord record;
    record.job_id = j.value("jobId", "");
    record.fingerprint = j.value("fingerprint", "");
    record.image_id = j.value("imageId", "");
    record.user_id = j.value("userId", "");
    record.output_format = j.value("format", "");
    record.canonical_spec = j.value("spec", "");
    record.state = jobStateFromString(j.value("state", "queued")).value_or(JobState::QUEUED);
    record.enqueued_at = static_cast<std::time_t>(j.value("enqueuedAtEpoch", 0LL));
    record.started_at = static_cast<std::time_t>(j.value("startedAtEpoch", 0LL));
    record.completed_at = static_cast<std::time_t>(j.value("completedAtEpoch", 0LL));

    auto error_it = j.find("error");
    if (error_it != j.end() && error_it->is_object()) {
        record.error_kind = jobErrorKindFromString(error_it->value("kind", "none"));
        record.error_message = error_it->value("message", "");
    }
    return record;
}

nlohmann::json JobStatus::toJson() const {
    nlohmann::json j = record.toJson();
    if (artifact) {
        j["artifact"] = artifact->toJson();
    }
    return j;
}

} // namespace prism
