#include "utils/metrics.h"
#include "utils/logger.h"
#include <algorithm>
#include <iostream>

namespace prism {

std::shared_ptr<Metrics> Metrics::instance_;
std::mutex Metrics::instance_mutex_;

nlohmann::json Metrics::Summary::toJson() const {
    return {
        {"unit", unit},
        {"samples", samples},
        {"total", total},
        {"min", min},
        {"max", max},
        {"mean", samples > 0 ? total / static_cast<double>(samples) : 0.0}
    };
}

void Metrics::initialize(
    const std::string& namespace_name,
    const std::string& service_name,
    const std::string& environment,
    bool emit
) {
    {
        std::lock_guard<std::mutex> lock(instance_mutex_);
        instance_ = std::shared_ptr<Metrics>(
            new Metrics(namespace_name, service_name, environment, emit)
        );
    }

    LOG_INFO("Metrics initialized: namespace={}, service={}, environment={}, emit={}",
             namespace_name, service_name, environment, emit);
}

std::shared_ptr<Metrics> Metrics::get() {
    std::lock_guard<std::mutex> lock(instance_mutex_);
    if (!instance_) {
        instance_ = std::shared_ptr<Metrics>(
            new Metrics("PrismImage", "prism-image", "production", false)
        );
    }
    return instance_;
}

Metrics::Metrics(
    const std::string& namespace_name,
    const std::string& service_name,
    const std::string& environment,
    bool emit
)
    : namespace_(namespace_name)
    , service_name_(service_name)
    , environment_(environment)
    , emit_(emit)
{}

void Metrics::publish_count(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    record(name, value, unit, dimensions);
}

void Metrics::publish_duration(
    const std::string& name,
    double duration_ms,
    const DimensionMap& dimensions
) {
    record(name, duration_ms, "Milliseconds", dimensions);
}

void Metrics::publish_gauge(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    record(name, value, unit, dimensions);
}

void Metrics::record(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Summary& summary = summaries_[name];
        if (summary.samples == 0) {
            summary.unit = unit;
            summary.min = value;
            summary.max = value;
        } else {
            summary.min = std::min(summary.min, value);
            summary.max = std::max(summary.max, value);
        }
        summary.samples++;
        summary.total += value;
    }

    if (emit_) {
        // One EMF document per line
        std::cout << create_emf_log(name, value, unit, dimensions).dump() << std::endl;
    }
}

std::map<std::string, Metrics::Summary> Metrics::summaries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return summaries_;
}

nlohmann::json Metrics::summariesJson() const {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [name, summary] : summaries()) {
        result[name] = summary.toJson();
    }
    return result;
}

nlohmann::json Metrics::create_emf_log(
    const std::string& name,
    double value,
    const std::string& unit,
    const DimensionMap& dimensions
) const {
    std::vector<std::string> dimension_names = {"ServiceName", "Environment"};
    for (const auto& [key, val] : dimensions) {
        dimension_names.push_back(key);
    }

    nlohmann::json emf_log = {
        {"_aws", {
            {"Timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()
            ).count()},
            {"CloudWatchMetrics", nlohmann::json::array({
                {
                    {"Namespace", namespace_},
                    {"Dimensions", nlohmann::json::array({dimension_names})},
                    {"Metrics", nlohmann::json::array({{{"Name", name}, {"Unit", unit}}})}
                }
            })}
        }},
        {"ServiceName", service_name_},
        {"Environment", environment_},
        {name, value}
    };

    for (const auto& [key, val] : dimensions) {
        emf_log[key] = val;
    }

    return emf_log;
}

std::unique_ptr<Metrics::Timer> Metrics::start_timer(
    const std::string& metric_name,
    const DimensionMap& dimensions
) {
    return std::make_unique<Timer>(shared_from_this(), metric_name, dimensions);
}

Metrics::Timer::Timer(std::shared_ptr<Metrics> owner,
                      const std::string& metric_name,
                      const DimensionMap& dimensions)
    : owner_(std::move(owner))
    , metric_name_(metric_name)
    , dimensions_(dimensions)
    , start_time_(std::chrono::steady_clock::now())
{}

Metrics::Timer::~Timer() {
    if (!owner_) {
        return;
    }
    try {
        owner_->publish_duration(metric_name_, elapsed_ms(), dimensions_);
    } catch (const std::exception& e) {
        LOG_DEBUG("Dropped timer metric {}: {}", metric_name_, e.what());
    }
}

double Metrics::Timer::elapsed_ms() const {
    auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

} // namespace prism
