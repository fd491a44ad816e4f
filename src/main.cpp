#include <crow.h>
#include <iostream>
#include <memory>
#include <filesystem>

#include "services/local_file_service.h"
#include "services/image_processor.h"
#include "services/cache_manager.h"
#include "services/local_config_service.h"
#include "services/watermark_service.h"
#include "services/rate_limiter.h"
#include "services/image_service.h"
#include "services/transform_pipeline.h"
#include "db/sqlite_client.h"
#include "controllers/image_controller.h"
#include "controllers/job_controller.h"
#include "middleware/request_context_middleware.h"
#include "utils/logger.h"
#include "utils/metrics.h"

#ifndef PRISM_SCHEMA_PATH
#define PRISM_SCHEMA_PATH "src/db/schema.sql"
#endif

int main() {
    // Get logging configuration from environment
    const char* log_level_env = std::getenv("LOG_LEVEL");
    const char* log_format_env = std::getenv("LOG_FORMAT");
    const char* environment_env = std::getenv("ENVIRONMENT");

    std::string log_level = log_level_env ? log_level_env : "info";
    std::string log_format_str = log_format_env ? log_format_env : "json";
    std::string environment = environment_env ? environment_env : "production";

    // Initialize logging
    auto log_format = (log_format_str == "text")
        ? prism::Logger::Format::TEXT
        : prism::Logger::Format::JSON;

    prism::Logger::initialize("prism-image", log_level, log_format, environment);

    // Initialize metrics
    const char* metrics_enabled_env = std::getenv("METRICS_ENABLED");
    const char* metrics_namespace_env = std::getenv("METRICS_NAMESPACE");

    bool metrics_enabled = metrics_enabled_env
        ? (std::string(metrics_enabled_env) == "true")
        : true;
    std::string metrics_namespace = metrics_namespace_env ? metrics_namespace_env : "PrismImage";

    prism::Metrics::initialize(metrics_namespace, "prism-image", environment, metrics_enabled);

    // Initialize libvips
    if (!prism::ImageProcessor::initialize()) {
        LOG_CRITICAL("Failed to initialize image processor");
        return 1;
    }

    // Get configuration from environment
    const char* storage_path_env = std::getenv("STORAGE_PATH");
    const char* db_path_env = std::getenv("DATABASE_PATH");
    const char* schema_path_env = std::getenv("SCHEMA_PATH");
    const char* api_keys_env_var = std::getenv("API_KEYS_ENV_VAR");

    std::string storage_path = storage_path_env ? storage_path_env : "./data/images";
    std::string db_path = db_path_env ? db_path_env : "./data/prism.db";
    std::string schema_path = schema_path_env ? schema_path_env : PRISM_SCHEMA_PATH;
    std::string api_keys_var = api_keys_env_var ? api_keys_env_var : "API_KEYS";

    prism::PipelineConfig pipeline_config = prism::PipelineConfig::fromEnvironment();
    if (!pipeline_config.isValid()) {
        LOG_WARN("Invalid pipeline configuration in environment, using defaults");
        pipeline_config = prism::PipelineConfig();
    }

    LOG_INFO("Starting Prism Image Service");
    prism::Logger::log_structured(spdlog::level::info, "Service configuration", {
        {"storage_path", storage_path},
        {"database_path", db_path},
        {"api_keys_env_var", api_keys_var},
        {"workers", pipeline_config.worker_count},
        {"max_queue_size", pipeline_config.max_queue_size},
        {"cache_max_entries", pipeline_config.cache_max_entries},
        {"cache_max_bytes", pipeline_config.cache_max_bytes},
        {"job_timeout_ms", pipeline_config.job_timeout_ms},
        {"job_retention_ms", pipeline_config.job_retention_ms}
    });

    // Create data directories if they don't exist
    try {
        std::filesystem::create_directories(storage_path);
        std::filesystem::path db_parent = std::filesystem::path(db_path).parent_path();
        if (!db_parent.empty()) {
            std::filesystem::create_directories(db_parent);
        }
        LOG_INFO("Data directories created/verified");
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create data directories: " + std::string(e.what()));
        return 1;
    }

    // Initialize SQLite database
    std::shared_ptr<prism::SQLiteClient> db_client;
    try {
        db_client = std::make_shared<prism::SQLiteClient>(db_path);
        if (!db_client->initialize(schema_path)) {
            LOG_CRITICAL("Failed to initialize database schema from " + schema_path);
            return 1;
        }
        LOG_INFO("Database initialized successfully");
    } catch (const std::exception& e) {
        LOG_CRITICAL("Failed to open database: " + std::string(e.what()));
        return 1;
    }

    // Initialize services
    auto file_service = std::make_shared<prism::LocalFileService>(storage_path);
    auto config_service = std::make_shared<prism::LocalConfigService>(api_keys_var);
    auto watermark_service = std::make_shared<prism::WatermarkService>();
    auto image_processor = std::make_shared<prism::ImageProcessor>(pipeline_config.default_quality,
                                                                   watermark_service);
    auto cache_manager = std::make_shared<prism::CacheManager>(pipeline_config.cache_max_entries,
                                                               pipeline_config.cache_max_bytes,
                                                               file_service);
    auto rate_limiter = std::make_shared<prism::RateLimiter>(pipeline_config);

    // Check if config service has API keys
    if (!config_service->isInitialized()) {
        LOG_WARN("No API keys configured - every request will be rejected as unauthenticated");
        LOG_WARN("Set " + api_keys_var + " to key:user pairs to enable authentication");
    } else {
        prism::Logger::log_structured(spdlog::level::info, "API key authentication enabled", {
            {"key_count", config_service->getApiKeys().size()}
        });
    }

    auto image_service = std::make_shared<prism::ImageService>(file_service, db_client,
                                                               image_processor, rate_limiter);
    auto pipeline = std::make_shared<prism::TransformPipeline>(pipeline_config, image_service,
                                                               image_processor, cache_manager,
                                                               rate_limiter, db_client);

    if (!pipeline->start()) {
        LOG_CRITICAL("Failed to start job scheduler");
        return 1;
    }

    // Initialize controllers
    prism::ImageController image_controller(image_service, pipeline, config_service);
    prism::JobController job_controller(pipeline, config_service);

    // Startup App with middleware
    using App = crow::App<prism::RequestContextMiddleware>;
    App app;

    // Basic routes
    CROW_ROUTE(app, "/")([](){
        return "Prism Image Service - Image transformation and delivery pipeline";
    });

    CROW_ROUTE(app, "/health")([pipeline, config_service]() {
        nlohmann::json health_status = {
            {"status", "healthy"},
            {"timestamp", prism::Logger::get_timestamp()},
            {"pipeline", pipeline->healthSnapshot()},
            {"services", {
                {"config", config_service->isInitialized() ? "ok" : "unavailable"}
            }}
        };

        int status_code = pipeline->scheduler()->isRunning() ? 200 : 503;
        if (status_code != 200) {
            health_status["status"] = "degraded";
        }

        crow::response resp(status_code, health_status.dump());
        resp.add_header("Content-Type", "application/json");
        return resp;
    });

    image_controller.registerRoutes(app);
    job_controller.registerRoutes(app);

    // Get port from environment
    char* port_env = std::getenv("PORT");
    int port = 8080;
    if (port_env) {
        try {
            port = std::stoi(port_env);
            if (port <= 0 || port > 65535) {
                LOG_WARN("Invalid port number, using default 8080");
                port = 8080;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Invalid PORT value, using default 8080");
        }
    }

    prism::Logger::log_structured(spdlog::level::info, "Starting server", {
        {"port", port},
        {"log_level", log_level},
        {"log_format", log_format_str},
        {"metrics_enabled", metrics_enabled}
    });

    // Run app
    app
    .port(port)
    .loglevel(crow::LogLevel::Warning)
    .multithreaded().run();

    // Cleanup
    LOG_INFO("Shutting down");
    pipeline->stop();
    prism::ImageProcessor::shutdown();

    return 0;
}
