#pragma once

#include <crow.h>
#include <chrono>
#include <memory>
#include <string>
#include "../utils/id_generator.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace prism {

/**
 * Request context middleware for correlation tracking
 *
 * Assigns each request an id (or keeps the caller's X-Request-ID), echoes it
 * back, tags every structured log written while the handler runs, and logs
 * completion with the request duration.
 */
struct RequestContextMiddleware {
    struct context {
        std::string request_id;
        std::string endpoint;
        std::chrono::steady_clock::time_point start_time;
        std::unique_ptr<Logger::ScopedContext> log_context;
    };

    void before_handle(crow::request& req, crow::response& res, context& ctx) {
        auto header_id = req.get_header_value("X-Request-ID");
        if (!header_id.empty()) {
            ctx.request_id = header_id;
        } else {
            ctx.request_id = utils::IdGenerator::generateUuid();
        }

        ctx.endpoint = req.url;
        ctx.start_time = std::chrono::steady_clock::now();

        // Handlers run synchronously on this thread until after_handle
        ctx.log_context = std::make_unique<Logger::ScopedContext>(nlohmann::json{
            {"request_id", ctx.request_id}
        });

        res.add_header("X-Request-ID", ctx.request_id);
    }

    void after_handle(crow::request& req, crow::response& res, context& ctx) {
        ctx.log_context.reset();

        double duration_ms = get_elapsed_ms(ctx);

        prism::Logger::log_with_request(spdlog::level::info, "Request completed",
            ctx.request_id, ctx.endpoint, {
                {"method", crow::method_name(req.method)},
                {"status", res.code},
                {"duration_ms", duration_ms}
            });
        METRICS_DURATION("RequestDuration", duration_ms, {{"status", std::to_string(res.code)}});
    }

    static double get_elapsed_ms(const context& ctx) {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double, std::milli>(now - ctx.start_time).count();
    }
};

} // namespace prism
