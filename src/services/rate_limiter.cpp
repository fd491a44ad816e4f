#include "rate_limiter.h"
#include "../exceptions/pipeline_exceptions.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace prism {

namespace {

constexpr std::chrono::seconds PRUNE_INTERVAL(60);

} // namespace

std::string actionClassToString(ActionClass action) {
    switch (action) {
        case ActionClass::UPLOAD: return "upload";
        case ActionClass::TRANSFORM: return "transform";
        case ActionClass::READ: return "read";
    }
    return "unknown";
}

RateLimiter::RateLimiter(const RateLimitConfig& upload,
                         const RateLimitConfig& transform,
                         const RateLimitConfig& read,
                         ClockFn clock)
    : upload_(upload),
      transform_(transform),
      read_(read),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {
    if (!upload_.isValid() || !transform_.isValid() || !read_.isValid()) {
        throw std::invalid_argument("Rate limits need a positive rate and a burst of at least 1");
    }
    last_prune_ = clock_();
}

RateLimiter::RateLimiter(const PipelineConfig& config, ClockFn clock)
    : RateLimiter(config.upload_limit, config.transform_limit, config.read_limit, std::move(clock)) {
}

const RateLimitConfig& RateLimiter::limitFor(ActionClass action) const {
    switch (action) {
        case ActionClass::UPLOAD: return upload_;
        case ActionClass::TRANSFORM: return transform_;
        case ActionClass::READ: break;
    }
    return read_;
}

bool RateLimiter::allow(const std::string& identity, ActionClass action) {
    return check(identity, action).allowed;
}

RateLimiter::Decision RateLimiter::check(const std::string& identity, ActionClass action) {
    const RateLimitConfig& limit = limitFor(action);
    Clock::time_point now = clock_();

    std::lock_guard<std::mutex> lock(mutex_);

    if (now - last_prune_ >= PRUNE_INTERVAL) {
        pruneLocked(now);
    }

    auto key = std::make_pair(identity, action);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{limit.burst, now}).first;
    } else {
        refillLocked(it->second, limit, now);
    }

    Decision decision;
    if (it->second.tokens >= 1.0) {
        it->second.tokens -= 1.0;
        decision.allowed = true;
        return decision;
    }

    decision.retry_after_seconds = (1.0 - it->second.tokens) / limit.refill_per_second;
    return decision;
}

void RateLimiter::admit(const std::string& identity, ActionClass action) {
    Decision decision = check(identity, action);
    if (decision.allowed) {
        return;
    }

    int retry_after = std::max(1, static_cast<int>(std::ceil(decision.retry_after_seconds)));

    prism::Logger::log_structured(spdlog::level::warn, "Request throttled", {
        {"identity", identity},
        {"action", actionClassToString(action)},
        {"retry_after_seconds", retry_after}
    });
    METRICS_COUNT("RequestsThrottled", 1.0, "Count", {{"action", actionClassToString(action)}});

    throw exceptions::ThrottledException(
        "Rate limit exceeded for " + actionClassToString(action) + " requests", retry_after);
}

size_t RateLimiter::pruneIdle() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pruneLocked(clock_());
}

size_t RateLimiter::bucketCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

void RateLimiter::refillLocked(Bucket& bucket, const RateLimitConfig& limit, Clock::time_point now) const {
    if (now <= bucket.last_refill) {
        return;
    }
    double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
    bucket.tokens = std::min(limit.burst, bucket.tokens + elapsed * limit.refill_per_second);
    bucket.last_refill = now;
}

size_t RateLimiter::pruneLocked(Clock::time_point now) {
    size_t dropped = 0;
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        const RateLimitConfig& limit = limitFor(it->first.second);
        refillLocked(it->second, limit, now);
        // A full bucket is indistinguishable from a fresh one
        if (it->second.tokens >= limit.burst) {
            it = buckets_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    last_prune_ = now;

    if (dropped > 0) {
        LOG_DEBUG("Pruned {} idle rate limit buckets", dropped);
    }
    return dropped;
}

} // namespace prism
