#ifndef PRISM_JOB_SCHEDULER_H
#define PRISM_JOB_SCHEDULER_H

#include "cache_manager.h"
#include "../interfaces/database_client_interface.h"
#include "../models/job.h"
#include "../models/pipeline_config.h"
#include "../models/transform_spec.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace prism {

// Everything a worker needs to run one transform
struct JobRequest {
    std::string fingerprint;
    std::string image_id;
    std::string user_id;
    std::string output_format;
    TransformSpec spec;
};

// Runs the transform for a request; throws on failure
using JobExecutor = std::function<Artifact(const JobRequest& request)>;

struct SchedulerStats {
    size_t queued = 0;
    size_t running = 0;
    size_t retained = 0;       // Jobs in the registry, any state
    size_t workers = 0;        // Live worker threads
    size_t submitted = 0;
    size_t attached = 0;       // Submits that joined an existing job
    size_t succeeded = 0;
    size_t failed = 0;
    size_t timed_out = 0;
    size_t cancelled = 0;
    size_t reclaimed = 0;

    nlohmann::json toJson() const;
};

/**
 * @brief Bounded worker pool with a single-flight job registry
 *
 * At most one non-terminal job exists per fingerprint; a submit for a
 * fingerprint that is already queued or running attaches to that job, and
 * a submit for one whose job recently succeeded attaches to the finished
 * job. Every state change is written through to the database and wakes
 * all waiters.
 *
 * A maintenance thread marks jobs that exceed the execution budget as
 * FAILED(timeout) and starts a replacement worker; the overdue worker
 * retires once its run returns and its result is discarded. The same
 * thread reclaims terminal jobs after the retention period.
 */
class JobScheduler {
public:
    JobScheduler(const PipelineConfig& config,
                 JobExecutor executor,
                 std::shared_ptr<CacheManager> cache_manager,
                 std::shared_ptr<DatabaseClientInterface> db_client = nullptr);
    ~JobScheduler();

    JobScheduler(const JobScheduler&) = delete;
    JobScheduler& operator=(const JobScheduler&) = delete;

    /**
     * @brief Start the workers and the maintenance thread
     *
     * Jobs left QUEUED or RUNNING in the database by a previous process
     * are marked FAILED.
     * @return false if already running or no executor was given
     */
    bool start();

    // Stop all threads; jobs still queued become CANCELLED
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Enqueue a transform, or attach to the job already handling it
     * @throws exceptions::ThrottledException if the queue is full
     * @throws std::runtime_error if the scheduler is not running
     */
    JobHandle submit(const JobRequest& request);

    // Current state of a job; nullopt if unknown or already reclaimed
    std::optional<JobStatus> status(const std::string& job_id);

    /**
     * @brief Block until the job is terminal or the timeout elapses
     * @return The status at return time (possibly still non-terminal)
     * @throws exceptions::NotFoundException for unknown job ids
     */
    JobStatus wait(const std::string& job_id, std::chrono::milliseconds timeout);

    /**
     * @brief Cancel a queued job
     *
     * Running jobs cannot be interrupted; they run to completion and their
     * result is cached. Terminal jobs are left untouched.
     * @return true if the job moved to CANCELLED
     * @throws exceptions::NotFoundException for unknown job ids
     */
    bool cancel(const std::string& job_id);

    // Job currently queued or running for the fingerprint
    std::optional<std::string> activeJobFor(const std::string& fingerprint) const;

    /**
     * @brief One maintenance pass: time out overdue jobs, reclaim expired
     *        terminal jobs and join retired workers
     *
     * Runs periodically on the maintenance thread; exposed for tests.
     */
    void runMaintenance();

    size_t queueDepth() const;

    SchedulerStats stats() const;

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Job {
        JobRecord record;
        JobRequest request;
        ArtifactPtr artifact;
        std::set<std::string> requesters;
        SteadyClock::time_point started;
        SteadyClock::time_point completed;
        bool timed_out = false;
    };

    PipelineConfig config_;
    JobExecutor executor_;
    std::shared_ptr<CacheManager> cache_manager_;
    std::shared_ptr<DatabaseClientInterface> db_client_;

    std::atomic<bool> running_{false};
    bool stopping_ = false;

    mutable std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable state_changed_;
    std::condition_variable maintenance_wakeup_;

    std::deque<std::shared_ptr<Job>> queue_;
    std::unordered_map<std::string, std::shared_ptr<Job>> jobs_;
    std::unordered_map<std::string, std::string> in_flight_;   // fingerprint -> active job id
    std::unordered_map<std::string, std::string> completed_;   // fingerprint -> succeeded job id

    std::map<int, std::thread> workers_;
    std::vector<int> retired_workers_;
    int next_worker_id_ = 0;
    std::thread maintenance_thread_;

    SchedulerStats counters_;

    void workerLoop(int worker_id);
    void maintenanceLoop();

    // Caller holds mutex_
    void spawnWorkerLocked();
    void finishLocked(Job& job, JobState state, JobErrorKind kind, const std::string& message);
    void persistLocked(const JobRecord& record);
    JobStatus snapshotLocked(const Job& job) const;

    void recoverInterruptedJobs();
};

} // namespace prism

#endif // PRISM_JOB_SCHEDULER_H
