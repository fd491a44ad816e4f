#ifndef PRISM_RATE_LIMITER_H
#define PRISM_RATE_LIMITER_H

#include "../models/pipeline_config.h"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace prism {

enum class ActionClass {
    UPLOAD,
    TRANSFORM,
    READ
};

std::string actionClassToString(ActionClass action);

/**
 * @brief Admission controller: one token bucket per (identity, action class)
 *
 * Buckets start full at the class burst size and refill continuously at the
 * class rate. Each admitted request consumes one token. Identities never
 * share a bucket, so one client exhausting its budget does not affect any
 * other client.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    struct Decision {
        bool allowed = false;
        double retry_after_seconds = 0.0;  // Time until one token is available
    };

    /**
     * @param upload Limits for image uploads
     * @param transform Limits for transform submissions
     * @param read Limits for status and delivery reads
     * @param clock Time source, steady_clock::now when empty
     */
    RateLimiter(const RateLimitConfig& upload,
                const RateLimitConfig& transform,
                const RateLimitConfig& read,
                ClockFn clock = nullptr);

    explicit RateLimiter(const PipelineConfig& config, ClockFn clock = nullptr);

    // Consume a token if one is available
    bool allow(const std::string& identity, ActionClass action);

    // Like allow(), but also reports how long to wait when denied
    Decision check(const std::string& identity, ActionClass action);

    /**
     * @brief Consume a token or fail
     * @throws exceptions::ThrottledException carrying the retry-after in
     *         whole seconds (rounded up, at least 1)
     */
    void admit(const std::string& identity, ActionClass action);

    // Drop buckets that have refilled completely; returns how many were dropped
    size_t pruneIdle();

    size_t bucketCount() const;

    const RateLimitConfig& limitFor(ActionClass action) const;

private:
    struct Bucket {
        double tokens;
        Clock::time_point last_refill;
    };

    RateLimitConfig upload_;
    RateLimitConfig transform_;
    RateLimitConfig read_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<std::pair<std::string, ActionClass>, Bucket> buckets_;
    Clock::time_point last_prune_;

    // Caller holds mutex_
    void refillLocked(Bucket& bucket, const RateLimitConfig& limit, Clock::time_point now) const;
    size_t pruneLocked(Clock::time_point now);
};

} // namespace prism

#endif // PRISM_RATE_LIMITER_H
