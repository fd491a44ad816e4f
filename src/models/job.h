#ifndef PRISM_JOB_H
#define PRISM_JOB_H

#include <string>
#include <ctime>
#include <optional>
#include <set>
#include <nlohmann/json.hpp>
#include "artifact.h"

namespace prism {

/**
 * @brief Job lifecycle
 *
 * QUEUED -> RUNNING -> SUCCEEDED | FAILED, or QUEUED -> CANCELLED.
 * SUCCEEDED, FAILED and CANCELLED are terminal.
 */
enum class JobState {
    QUEUED,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

// Why a job ended in FAILED
enum class JobErrorKind {
    NONE,
    EXECUTION,   // Transform raised an error
    TIMEOUT      // Exceeded the execution budget
};

std::string jobStateToString(JobState state);
std::optional<JobState> jobStateFromString(const std::string& value);
bool isTerminal(JobState state);

std::string jobErrorKindToString(JobErrorKind kind);
JobErrorKind jobErrorKindFromString(const std::string& value);

/**
 * @brief Persisted view of a job
 */
struct JobRecord {
    std::string job_id;
    std::string fingerprint;
    std::string image_id;
    std::string user_id;
    std::string output_format;
    std::string canonical_spec;
    JobState state = JobState::QUEUED;
    JobErrorKind error_kind = JobErrorKind::NONE;
    std::string error_message;
    std::time_t enqueued_at = 0;
    std::time_t started_at = 0;
    std::time_t completed_at = 0;

    nlohmann::json toJson() const;
    static JobRecord fromJson(const nlohmann::json& j);
};

/**
 * @brief What a caller gets back from submit
 *
 * attached is true when the request joined an existing in-flight job
 * for the same fingerprint instead of creating a new one.
 */
struct JobHandle {
    std::string job_id;
    std::string fingerprint;
    bool attached = false;
};

/**
 * @brief Result of a status query
 *
 * artifact is set only when the job SUCCEEDED. requesters holds every user
 * whose submit created or attached to the job; only they may read it.
 */
struct JobStatus {
    JobRecord record;
    ArtifactPtr artifact;
    std::set<std::string> requesters;

    JobState state() const { return record.state; }
    bool terminal() const { return isTerminal(record.state); }
    bool requestedBy(const std::string& user_id) const { return requesters.count(user_id) > 0; }

    nlohmann::json toJson() const;
};

} // namespace prism

#endif // PRISM_JOB_H
