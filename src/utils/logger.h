#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <chrono>

namespace prism {

/**
 * Structured logger for the pipeline service
 * Outputs JSON-formatted logs to stdout so log collectors can index fields
 */
class Logger {
public:
    enum class Format {
        JSON,    // Structured JSON, one object per line
        TEXT     // Human-readable text format
    };

    /**
     * Initialize the global logger
     * @param service_name Name of the service (e.g., "prism-image")
     * @param log_level Minimum log level (trace, debug, info, warn, error, critical)
     * @param format Output format (JSON or TEXT)
     * @param environment Environment name (e.g., "production", "staging")
     */
    static void initialize(
        const std::string& service_name,
        const std::string& log_level = "info",
        Format format = Format::JSON,
        const std::string& environment = "production"
    );

    /**
     * Get the singleton logger instance
     */
    static std::shared_ptr<spdlog::logger> get();

    /**
     * Log structured data with additional context fields
     * @param level Log level
     * @param message Log message
     * @param fields Additional JSON fields (e.g., {"job_id": "job_123", "duration_ms": 45})
     */
    static void log_structured(
        spdlog::level::level_enum level,
        const std::string& message,
        const nlohmann::json& fields = {}
    );

    /**
     * Log with request context
     * @param level Log level
     * @param message Log message
     * @param request_id Request correlation ID
     * @param endpoint Endpoint being accessed
     * @param fields Additional JSON fields
     */
    static void log_with_request(
        spdlog::level::level_enum level,
        const std::string& message,
        const std::string& request_id,
        const std::string& endpoint = "",
        const nlohmann::json& fields = {}
    );

    /**
     * Log error with exception details
     * @param message Error message
     * @param exception Exception object
     * @param request_id Optional request correlation ID
     */
    static void log_error(
        const std::string& message,
        const std::exception& exception,
        const std::string& request_id = ""
    );

    /**
     * Fields attached to every structured log written by the current thread
     * while the guard is alive. Guards nest; inner fields shadow outer ones
     * and the previous set is restored on destruction.
     *
     * Workers use it to tag everything logged during a job with its id.
     */
    class ScopedContext {
    public:
        explicit ScopedContext(const nlohmann::json& fields);
        ~ScopedContext();

        ScopedContext(const ScopedContext&) = delete;
        ScopedContext& operator=(const ScopedContext&) = delete;

    private:
        nlohmann::json previous_;
    };

    // Fields of the innermost live ScopedContext on this thread
    static const nlohmann::json& current_context();

    /**
     * Get current timestamp in ISO 8601 format
     */
    static std::string get_timestamp();

    /**
     * Convert log level string to spdlog level enum
     */
    static spdlog::level::level_enum parse_log_level(const std::string& level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static std::string service_name_;
    static std::string environment_;
    static Format format_;
};

// Convenience macros for structured logging
#define LOG_TRACE(...) prism::Logger::get()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) prism::Logger::get()->debug(__VA_ARGS__)
#define LOG_INFO(...) prism::Logger::get()->info(__VA_ARGS__)
#define LOG_WARN(...) prism::Logger::get()->warn(__VA_ARGS__)
#define LOG_ERROR(...) prism::Logger::get()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) prism::Logger::get()->critical(__VA_ARGS__)

} // namespace prism
