#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <mutex>
#include <chrono>
#include <memory>

namespace prism {

/**
 * Pipeline metrics
 *
 * Every sample is folded into an in-process summary that the health
 * endpoint reports. When emission is enabled each sample is also written
 * to stdout as one Embedded Metric Format (EMF) JSON line, next to the
 * structured logs, for a log-based collector to pick up.
 */
class Metrics : public std::enable_shared_from_this<Metrics> {
public:
    using DimensionMap = std::map<std::string, std::string>;

    // Aggregate of every sample recorded under one metric name
    struct Summary {
        std::string unit;
        size_t samples = 0;
        double total = 0.0;
        double min = 0.0;
        double max = 0.0;

        nlohmann::json toJson() const;
    };

    /**
     * Replace the process-wide instance
     * @param namespace_name EMF namespace (e.g., "PrismImage")
     * @param service_name Default ServiceName dimension
     * @param environment Default Environment dimension
     * @param emit Write EMF lines to stdout; summaries are kept either way
     */
    static void initialize(
        const std::string& namespace_name,
        const std::string& service_name,
        const std::string& environment = "production",
        bool emit = true
    );

    static std::shared_ptr<Metrics> get();

    // Counter sample (e.g., "CacheHits")
    void publish_count(
        const std::string& name,
        double value = 1.0,
        const std::string& unit = "Count",
        const DimensionMap& dimensions = {}
    );

    // Duration sample in milliseconds (e.g., "TransformDuration")
    void publish_duration(
        const std::string& name,
        double duration_ms,
        const DimensionMap& dimensions = {}
    );

    // Point-in-time value (e.g., "QueueDepth")
    void publish_gauge(
        const std::string& name,
        double value,
        const std::string& unit = "None",
        const DimensionMap& dimensions = {}
    );

    /**
     * Publishes its lifetime as a duration sample when destroyed
     */
    class Timer {
    public:
        Timer(std::shared_ptr<Metrics> owner,
              const std::string& metric_name,
              const DimensionMap& dimensions = {});
        ~Timer();

        Timer(const Timer&) = delete;
        Timer& operator=(const Timer&) = delete;

        double elapsed_ms() const;

    private:
        std::shared_ptr<Metrics> owner_;
        std::string metric_name_;
        DimensionMap dimensions_;
        std::chrono::steady_clock::time_point start_time_;
    };

    /**
     * Usage:
     *   {
     *     auto timer = Metrics::get()->start_timer("TransformDuration");
     *     // ... run the transform ...
     *   } // duration is published here
     */
    std::unique_ptr<Timer> start_timer(
        const std::string& metric_name,
        const DimensionMap& dimensions = {}
    );

    // Summaries keyed by metric name; dimensions are not split out
    std::map<std::string, Summary> summaries() const;
    nlohmann::json summariesJson() const;

    bool is_emitting() const { return emit_; }

private:
    Metrics(
        const std::string& namespace_name,
        const std::string& service_name,
        const std::string& environment,
        bool emit
    );

    void record(
        const std::string& name,
        double value,
        const std::string& unit,
        const DimensionMap& dimensions
    );

    nlohmann::json create_emf_log(
        const std::string& name,
        double value,
        const std::string& unit,
        const DimensionMap& dimensions
    ) const;

    static std::shared_ptr<Metrics> instance_;
    static std::mutex instance_mutex_;

    std::string namespace_;
    std::string service_name_;
    std::string environment_;
    bool emit_;

    mutable std::mutex mutex_;
    std::map<std::string, Summary> summaries_;
};

#define METRICS_COUNT(name, ...) \
    if (auto m = prism::Metrics::get()) { \
        m->publish_count(name, ##__VA_ARGS__); \
    }

#define METRICS_DURATION(name, duration_ms, ...) \
    if (auto m = prism::Metrics::get()) { \
        m->publish_duration(name, duration_ms, ##__VA_ARGS__); \
    }

#define METRICS_GAUGE(name, value, ...) \
    if (auto m = prism::Metrics::get()) { \
        m->publish_gauge(name, value, ##__VA_ARGS__); \
    }

} // namespace prism
