#ifndef PRISM_HTTP_RESPONSES_H
#define PRISM_HTTP_RESPONSES_H

#include <crow.h>
#include <string>
#include <nlohmann/json.hpp>
#include "../exceptions/pipeline_exceptions.h"
#include "../models/artifact.h"
#include "../models/job.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"

namespace prism {
namespace http {

void addCorsHeaders(crow::response& resp);

crow::response jsonResponse(int status_code, const nlohmann::json& body);

crow::response errorResponse(int status_code, const std::string& error, const std::string& details);

// Encoded bytes with their MIME type; fingerprint doubles as the ETag
crow::response artifactResponse(const Artifact& artifact, bool cache_hit);

// 202 with the job handle and where to poll it
crow::response pendingResponse(const JobHandle& handle);

crow::response preflightResponse();

/**
 * Run a handler and map pipeline exceptions to HTTP statuses:
 * validation 400, unauthorized 401, forbidden 403, not found 404,
 * throttled 429 with Retry-After, anything else 500.
 */
template<typename HandlerFunc>
crow::response handleErrors(const std::string& endpoint, HandlerFunc handler) {
    try {
        return handler();
    } catch (const nlohmann::json::exception& e) {
        return errorResponse(400, "Invalid JSON", e.what());
    } catch (const exceptions::ValidationException& e) {
        return errorResponse(400, "Validation Error", e.what());
    } catch (const exceptions::UnauthorizedException& e) {
        return errorResponse(401, "Unauthorized", e.what());
    } catch (const exceptions::ForbiddenException& e) {
        return errorResponse(403, "Forbidden", e.what());
    } catch (const exceptions::NotFoundException& e) {
        return errorResponse(404, "Not Found", e.what());
    } catch (const exceptions::ThrottledException& e) {
        crow::response resp = errorResponse(429, "Too Many Requests", e.what());
        resp.add_header("Retry-After", std::to_string(e.retryAfterSeconds()));
        return resp;
    } catch (const exceptions::TimeoutException& e) {
        return errorResponse(504, "Gateway Timeout", e.what());
    } catch (const exceptions::ExecutionException& e) {
        // Transform failures are already visible on the job record
        return errorResponse(500, "Transform Failed", e.what());
    } catch (const std::exception& e) {
        prism::Logger::log_structured(spdlog::level::err, "Request failed", {
            {"endpoint", endpoint},
            {"error", e.what()}
        });
        METRICS_COUNT("APIRequests", 1.0, "Count", {{"endpoint", endpoint}, {"status", "error"}});
        return errorResponse(500, "Internal Server Error",
                             "An error occurred while processing your request");
    }
}

} // namespace http
} // namespace prism

#endif // PRISM_HTTP_RESPONSES_H
