#ifndef PRISM_PIPELINE_CONFIG_H
#define PRISM_PIPELINE_CONFIG_H

#include <string>
#include <cstdlib>
#include <cstddef>

namespace prism {

// Token bucket parameters for one action class
struct RateLimitConfig {
    double refill_per_second;  // Tokens added per second
    double burst;              // Bucket capacity

    RateLimitConfig() : refill_per_second(1.0), burst(1.0) {}
    RateLimitConfig(double rate, double capacity)
        : refill_per_second(rate), burst(capacity) {}

    bool isValid() const {
        return refill_per_second > 0.0 && burst >= 1.0;
    }
};

struct PipelineConfig {
    int worker_count;              // Transform worker threads
    size_t max_queue_size;         // Queued jobs before submits are throttled
    size_t cache_max_entries;      // LRU capacity by count
    size_t cache_max_bytes;        // LRU capacity by encoded bytes
    long job_timeout_ms;           // Running longer than this -> FAILED(timeout)
    long job_retention_ms;         // Terminal records stay queryable this long
    long maintenance_interval_ms;  // Reaper / watchdog tick
    int default_quality;           // Encoder quality without a compress op
    RateLimitConfig upload_limit;
    RateLimitConfig transform_limit;
    RateLimitConfig read_limit;

    PipelineConfig()
        : worker_count(4),
          max_queue_size(1000),
          cache_max_entries(512),
          cache_max_bytes(256 * 1024 * 1024),
          job_timeout_ms(120 * 1000),
          job_retention_ms(300 * 1000),
          maintenance_interval_ms(1000),
          default_quality(85),
          upload_limit(0.5, 5.0),
          transform_limit(2.0, 10.0),
          read_limit(20.0, 100.0) {}

    // Factory method to create config from environment variables
    static PipelineConfig fromEnvironment() {
        PipelineConfig config;

        if (const char* env = std::getenv("PIPELINE_WORKERS")) {
            config.worker_count = std::atoi(env);
        }
        if (const char* env = std::getenv("PIPELINE_MAX_QUEUE")) {
            config.max_queue_size = static_cast<size_t>(std::atol(env));
        }
        if (const char* env = std::getenv("CACHE_MAX_ENTRIES")) {
            config.cache_max_entries = static_cast<size_t>(std::atol(env));
        }
        if (const char* env = std::getenv("CACHE_MAX_MB")) {
            config.cache_max_bytes = static_cast<size_t>(std::atol(env)) * 1024 * 1024;
        }
        if (const char* env = std::getenv("JOB_TIMEOUT_SECONDS")) {
            config.job_timeout_ms = std::atol(env) * 1000;
        }
        if (const char* env = std::getenv("JOB_RETENTION_SECONDS")) {
            config.job_retention_ms = std::atol(env) * 1000;
        }
        if (const char* env = std::getenv("DEFAULT_QUALITY")) {
            config.default_quality = std::atoi(env);
        }
        if (const char* env = std::getenv("RATE_UPLOAD_PER_SECOND")) {
            config.upload_limit.refill_per_second = std::atof(env);
        }
        if (const char* env = std::getenv("RATE_UPLOAD_BURST")) {
            config.upload_limit.burst = std::atof(env);
        }
        if (const char* env = std::getenv("RATE_TRANSFORM_PER_SECOND")) {
            config.transform_limit.refill_per_second = std::atof(env);
        }
        if (const char* env = std::getenv("RATE_TRANSFORM_BURST")) {
            config.transform_limit.burst = std::atof(env);
        }
        if (const char* env = std::getenv("RATE_READ_PER_SECOND")) {
            config.read_limit.refill_per_second = std::atof(env);
        }
        if (const char* env = std::getenv("RATE_READ_BURST")) {
            config.read_limit.burst = std::atof(env);
        }

        return config;
    }

    // Validate configuration
    bool isValid() const {
        if (worker_count < 1 || worker_count > 256) return false;
        if (max_queue_size < 1) return false;
        if (cache_max_entries < 1 || cache_max_bytes < 1) return false;
        if (job_timeout_ms <= 0 || job_retention_ms < 0) return false;
        if (maintenance_interval_ms <= 0) return false;
        if (default_quality < 0 || default_quality > 100) return false;

        return upload_limit.isValid() && transform_limit.isValid() && read_limit.isValid();
    }
};

} // namespace prism

#endif // PRISM_PIPELINE_CONFIG_H
