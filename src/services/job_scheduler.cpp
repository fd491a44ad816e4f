#include "job_scheduler.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/id_generator.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <stdexcept>

namespace prism {

nlohmann::json SchedulerStats::toJson() const {
    return {
        {"queued", queued},
        {"running", running},
        {"retained", retained},
        {"workers", workers},
        {"submitted", submitted},
        {"attached", attached},
        {"succeeded", succeeded},
        {"failed", failed},
        {"timedOut", timed_out},
        {"cancelled", cancelled},
        {"reclaimed", reclaimed}
    };
}

JobScheduler::JobScheduler(const PipelineConfig& config,
                           JobExecutor executor,
                           std::shared_ptr<CacheManager> cache_manager,
                           std::shared_ptr<DatabaseClientInterface> db_client)
    : config_(config),
      executor_(std::move(executor)),
      cache_manager_(std::move(cache_manager)),
      db_client_(std::move(db_client)) {
    if (!cache_manager_) {
        throw std::invalid_argument("JobScheduler requires a cache manager");
    }
}

JobScheduler::~JobScheduler() {
    stop();
}

bool JobScheduler::start() {
    if (running_.load()) {
        LOG_WARN("Job scheduler already running");
        return false;
    }

    if (!executor_) {
        LOG_ERROR("Invalid job executor provided");
        return false;
    }

    recoverInterruptedJobs();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = false;
        for (int i = 0; i < config_.worker_count; ++i) {
            spawnWorkerLocked();
        }
    }

    maintenance_thread_ = std::thread(&JobScheduler::maintenanceLoop, this);
    running_.store(true);

    prism::Logger::log_structured(spdlog::level::info, "Job scheduler started", {
        {"workers", config_.worker_count},
        {"max_queue_size", config_.max_queue_size},
        {"job_timeout_ms", config_.job_timeout_ms},
        {"job_retention_ms", config_.job_retention_ms}
    });
    return true;
}

void JobScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping job scheduler...");

    std::map<int, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;

        while (!queue_.empty()) {
            std::shared_ptr<Job> job = queue_.front();
            queue_.pop_front();
            finishLocked(*job, JobState::CANCELLED, JobErrorKind::NONE, "Scheduler shut down");
        }

        workers.swap(workers_);
        retired_workers_.clear();
    }

    work_available_.notify_all();
    maintenance_wakeup_.notify_all();
    state_changed_.notify_all();

    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    for (auto& entry : workers) {
        if (entry.second.joinable()) {
            entry.second.join();
        }
    }

    LOG_INFO("Job scheduler stopped");
}

JobHandle JobScheduler::submit(const JobRequest& request) {
    if (!running_.load()) {
        throw std::runtime_error("Job scheduler is not running");
    }

    std::unique_lock<std::mutex> lock(mutex_);

    std::optional<std::string> existing;
    auto active = in_flight_.find(request.fingerprint);
    if (active != in_flight_.end()) {
        existing = active->second;
    } else {
        auto done = completed_.find(request.fingerprint);
        if (done != completed_.end() && jobs_.count(done->second) > 0) {
            existing = done->second;
        }
    }

    if (existing) {
        jobs_[*existing]->requesters.insert(request.user_id);
        ++counters_.attached;
        prism::Logger::log_structured(spdlog::level::debug, "Attached to existing job", {
            {"job_id", *existing},
            {"fingerprint", request.fingerprint},
            {"user_id", request.user_id}
        });
        METRICS_COUNT("JobsAttached", 1.0, "Count");
        return JobHandle{*existing, request.fingerprint, true};
    }

    if (queue_.size() >= config_.max_queue_size) {
        lock.unlock();
        prism::Logger::log_structured(spdlog::level::warn, "Job queue full, rejecting submit", {
            {"fingerprint", request.fingerprint},
            {"max_queue_size", config_.max_queue_size}
        });
        METRICS_COUNT("RequestsThrottled", 1.0, "Count", {{"action", "queue_full"}});
        throw exceptions::ThrottledException("Transform queue is full", 1);
    }

    auto job = std::make_shared<Job>();
    job->request = request;
    job->record.job_id = utils::IdGenerator::generateJobId();
    job->record.fingerprint = request.fingerprint;
    job->record.image_id = request.image_id;
    job->record.user_id = request.user_id;
    job->record.output_format = request.output_format;
    job->record.canonical_spec = request.spec.canonicalize();
    job->record.state = JobState::QUEUED;
    job->record.enqueued_at = std::time(nullptr);
    job->requesters.insert(request.user_id);

    jobs_[job->record.job_id] = job;
    in_flight_[request.fingerprint] = job->record.job_id;
    queue_.push_back(job);
    ++counters_.submitted;
    persistLocked(job->record);

    size_t depth = queue_.size();
    lock.unlock();
    work_available_.notify_one();

    prism::Logger::log_structured(spdlog::level::info, "Job queued", {
        {"job_id", job->record.job_id},
        {"fingerprint", request.fingerprint},
        {"image_id", request.image_id},
        {"user_id", request.user_id},
        {"format", request.output_format},
        {"queue_depth", depth}
    });
    METRICS_GAUGE("QueueDepth", static_cast<double>(depth), "Count");

    return JobHandle{job->record.job_id, request.fingerprint, false};
}

std::optional<JobStatus> JobScheduler::status(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it != jobs_.end()) {
            return snapshotLocked(*it->second);
        }
    }

    if (!db_client_) {
        return std::nullopt;
    }

    // Recovered from an earlier process, not tracked in memory
    std::optional<JobRecord> record = db_client_->getJob(job_id);
    if (!record) {
        return std::nullopt;
    }

    JobStatus result;
    result.record = *record;
    result.requesters.insert(record->user_id);
    if (record->state == JobState::SUCCEEDED) {
        result.artifact = cache_manager_->get(record->fingerprint);
    }
    return result;
}

JobStatus JobScheduler::wait(const std::string& job_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        lock.unlock();
        std::optional<JobStatus> stored = status(job_id);
        if (!stored) {
            throw exceptions::NotFoundException("Job not found: " + job_id);
        }
        return *stored;
    }

    std::shared_ptr<Job> job = it->second;
    state_changed_.wait_for(lock, timeout, [&job, this] {
        return isTerminal(job->record.state) || stopping_;
    });

    return snapshotLocked(*job);
}

bool JobScheduler::cancel(const std::string& job_id) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        lock.unlock();
        if (db_client_ && db_client_->getJob(job_id)) {
            return false;
        }
        throw exceptions::NotFoundException("Job not found: " + job_id);
    }

    std::shared_ptr<Job> job = it->second;
    if (job->record.state != JobState::QUEUED) {
        LOG_DEBUG("Job {} is {}, not cancellable", job_id, jobStateToString(job->record.state));
        return false;
    }

    for (auto queued = queue_.begin(); queued != queue_.end(); ++queued) {
        if (*queued == job) {
            queue_.erase(queued);
            break;
        }
    }

    finishLocked(*job, JobState::CANCELLED, JobErrorKind::NONE, "Cancelled by request");
    lock.unlock();
    state_changed_.notify_all();
    return true;
}

std::optional<std::string> JobScheduler::activeJobFor(const std::string& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(fingerprint);
    if (it == in_flight_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t JobScheduler::queueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

SchedulerStats JobScheduler::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SchedulerStats s = counters_;
    s.queued = queue_.size();
    s.running = 0;
    for (const auto& entry : jobs_) {
        if (entry.second->record.state == JobState::RUNNING) {
            ++s.running;
        }
    }
    s.retained = jobs_.size();
    s.workers = workers_.size() - retired_workers_.size();
    return s;
}

void JobScheduler::runMaintenance() {
    auto now = SteadyClock::now();
    auto timeout = std::chrono::milliseconds(config_.job_timeout_ms);
    auto retention = std::chrono::milliseconds(config_.job_retention_ms);

    std::vector<std::thread> to_join;
    bool timed_out_any = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto it = jobs_.begin(); it != jobs_.end();) {
            Job& job = *it->second;

            if (job.record.state == JobState::RUNNING && now - job.started > timeout) {
                job.timed_out = true;
                finishLocked(job, JobState::FAILED, JobErrorKind::TIMEOUT,
                             "Job exceeded the execution budget of " +
                             std::to_string(config_.job_timeout_ms) + " ms");
                ++counters_.timed_out;
                timed_out_any = true;

                // Keep the pool at capacity while the overdue worker finishes
                if (!stopping_) {
                    spawnWorkerLocked();
                }
                ++it;
                continue;
            }

            if (isTerminal(job.record.state) && now - job.completed >= retention) {
                auto completed = completed_.find(job.record.fingerprint);
                if (completed != completed_.end() && completed->second == job.record.job_id) {
                    completed_.erase(completed);
                }
                if (db_client_ && !db_client_->deleteJob(job.record.job_id)) {
                    LOG_DEBUG("No stored record to reclaim for job {}", job.record.job_id);
                }
                LOG_DEBUG("Reclaimed job {} ({})", job.record.job_id, jobStateToString(job.record.state));
                ++counters_.reclaimed;
                it = jobs_.erase(it);
                continue;
            }

            ++it;
        }

        for (int worker_id : retired_workers_) {
            auto worker = workers_.find(worker_id);
            if (worker != workers_.end()) {
                to_join.push_back(std::move(worker->second));
                workers_.erase(worker);
            }
        }
        retired_workers_.clear();
    }

    if (timed_out_any) {
        state_changed_.notify_all();
    }

    // Retired workers have left their loop; joining only waits for the exit
    for (auto& thread : to_join) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

void JobScheduler::workerLoop(int worker_id) {
    LOG_DEBUG("Worker-{} thread started", worker_id);

    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_available_.wait(lock, [this] {
                return !queue_.empty() || stopping_;
            });

            if (stopping_) {
                break;
            }

            job = queue_.front();
            queue_.pop_front();

            job->record.state = JobState::RUNNING;
            job->record.started_at = std::time(nullptr);
            job->started = SteadyClock::now();
            persistLocked(job->record);
        }
        state_changed_.notify_all();

        prism::Logger::ScopedContext log_context({
            {"job_id", job->record.job_id},
            {"fingerprint", job->record.fingerprint},
            {"worker", worker_id}
        });
        prism::Logger::log_structured(spdlog::level::info, "Job started");

        ArtifactPtr artifact;
        std::string error_message;
        auto started = SteadyClock::now();

        try {
            Artifact result = executor_(job->request);
            result.fingerprint = job->record.fingerprint;
            artifact = std::make_shared<const Artifact>(std::move(result));
        } catch (const std::exception& e) {
            error_message = e.what();
        }

        auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            SteadyClock::now() - started).count();

        bool discard;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            discard = job->timed_out;
        }

        if (artifact && !discard) {
            try {
                cache_manager_->put(job->record.fingerprint, artifact);
            } catch (const exceptions::CacheUnavailableException& e) {
                prism::Logger::log_structured(spdlog::level::warn, "Artifact cache unavailable, serving result uncached", {
                    {"job_id", job->record.job_id},
                    {"fingerprint", job->record.fingerprint},
                    {"error", e.what()},
                    {"mode", "degraded"}
                });
                METRICS_COUNT("CacheDegraded", 1.0, "Count");
            }
        }

        bool retire = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (job->timed_out) {
                retire = true;
                retired_workers_.push_back(worker_id);
            } else if (artifact) {
                job->artifact = artifact;
                finishLocked(*job, JobState::SUCCEEDED, JobErrorKind::NONE, "");
            } else {
                finishLocked(*job, JobState::FAILED, JobErrorKind::EXECUTION, error_message);
            }
        }
        state_changed_.notify_all();

        if (retire) {
            prism::Logger::log_structured(spdlog::level::warn, "Overdue worker finished, result discarded", {
                {"job_id", job->record.job_id},
                {"worker", worker_id},
                {"duration_ms", elapsed_ms}
            });
            break;
        }

        prism::Logger::log_structured(artifact ? spdlog::level::info : spdlog::level::err,
            artifact ? "Job succeeded" : "Job failed", {
            {"job_id", job->record.job_id},
            {"fingerprint", job->record.fingerprint},
            {"worker", worker_id},
            {"duration_ms", elapsed_ms},
            {"error", error_message}
        });
        METRICS_DURATION("JobDuration", static_cast<double>(elapsed_ms));
    }

    LOG_DEBUG("Worker-{} thread exiting", worker_id);
}

void JobScheduler::maintenanceLoop() {
    auto interval = std::chrono::milliseconds(config_.maintenance_interval_ms);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            maintenance_wakeup_.wait_for(lock, interval, [this] { return stopping_; });
            if (stopping_) {
                break;
            }
        }
        runMaintenance();
    }
}

void JobScheduler::spawnWorkerLocked() {
    int worker_id = next_worker_id_++;
    workers_.emplace(worker_id, std::thread(&JobScheduler::workerLoop, this, worker_id));
}

void JobScheduler::finishLocked(Job& job, JobState state, JobErrorKind kind, const std::string& message) {
    job.record.state = state;
    job.record.error_kind = kind;
    job.record.error_message = message;
    job.record.completed_at = std::time(nullptr);
    job.completed = SteadyClock::now();

    auto active = in_flight_.find(job.record.fingerprint);
    if (active != in_flight_.end() && active->second == job.record.job_id) {
        in_flight_.erase(active);
    }

    switch (state) {
        case JobState::SUCCEEDED:
            completed_[job.record.fingerprint] = job.record.job_id;
            ++counters_.succeeded;
            break;
        case JobState::FAILED:
            ++counters_.failed;
            break;
        case JobState::CANCELLED:
            ++counters_.cancelled;
            break;
        default:
            break;
    }

    persistLocked(job.record);

    prism::Logger::log_structured(spdlog::level::debug, "Job state changed", {
        {"job_id", job.record.job_id},
        {"state", jobStateToString(state)},
        {"error_kind", jobErrorKindToString(kind)}
    });
    METRICS_COUNT("JobOutcomes", 1.0, "Count", {
        {"state", jobStateToString(state)},
        {"error_kind", jobErrorKindToString(kind)}
    });
}

void JobScheduler::persistLocked(const JobRecord& record) {
    if (db_client_ && !db_client_->putJob(record)) {
        prism::Logger::log_structured(spdlog::level::err, "Failed to persist job record", {
            {"job_id", record.job_id},
            {"state", jobStateToString(record.state)}
        });
    }
}

JobStatus JobScheduler::snapshotLocked(const Job& job) const {
    JobStatus result;
    result.record = job.record;
    result.artifact = job.artifact;
    result.requesters = job.requesters;
    return result;
}

void JobScheduler::recoverInterruptedJobs() {
    if (!db_client_) {
        return;
    }

    size_t recovered = 0;
    for (JobState state : {JobState::QUEUED, JobState::RUNNING}) {
        for (JobRecord record : db_client_->listJobsByState(state)) {
            record.state = JobState::FAILED;
            record.error_kind = JobErrorKind::EXECUTION;
            record.error_message = "Interrupted by service restart";
            record.completed_at = std::time(nullptr);
            if (!db_client_->putJob(record)) {
                LOG_ERROR("Failed to mark interrupted job {} as failed", record.job_id);
                continue;
            }

            // Track in memory so retention reclaims it like any other job
            auto job = std::make_shared<Job>();
            job->record = record;
            job->requesters.insert(record.user_id);
            job->completed = SteadyClock::now();
            std::lock_guard<std::mutex> lock(mutex_);
            jobs_[record.job_id] = job;
            ++recovered;
        }
    }

    if (recovered > 0) {
        LOG_WARN("Marked {} interrupted jobs as failed", recovered);
    }
}

} // namespace prism
