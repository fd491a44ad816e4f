#include "http_responses.h"

namespace prism {
namespace http {

void addCorsHeaders(crow::response& resp) {
    resp.add_header("Access-Control-Allow-Origin", "*");
    resp.add_header("Access-Control-Allow-Methods", "GET, POST, DELETE, OPTIONS");
    resp.add_header("Access-Control-Allow-Headers", "Content-Type, X-API-Key, X-Request-ID");
    resp.add_header("Access-Control-Expose-Headers", "Retry-After, Location, ETag, X-Request-ID, X-Cache");
    resp.add_header("Access-Control-Max-Age", "3600");
}

crow::response jsonResponse(int status_code, const nlohmann::json& body) {
    crow::response resp(status_code, body.dump());
    resp.add_header("Content-Type", "application/json");
    addCorsHeaders(resp);
    return resp;
}

crow::response errorResponse(int status_code, const std::string& error, const std::string& details) {
    nlohmann::json error_response = {
        {"error", error},
        {"details", details}
    };
    return jsonResponse(status_code, error_response);
}

crow::response artifactResponse(const Artifact& artifact, bool cache_hit) {
    crow::response resp(200);
    if (artifact.data) {
        resp.body.assign(artifact.data->begin(), artifact.data->end());
    }
    resp.add_header("Content-Type", artifact.mimeType());
    resp.add_header("ETag", "\"" + artifact.fingerprint + "\"");
    resp.add_header("Cache-Control", "private, max-age=31536000, immutable");
    resp.add_header("X-Cache", cache_hit ? "HIT" : "MISS");
    addCorsHeaders(resp);
    return resp;
}

crow::response pendingResponse(const JobHandle& handle) {
    std::string status_url = "/api/jobs/" + handle.job_id;
    nlohmann::json body = {
        {"jobId", handle.job_id},
        {"fingerprint", handle.fingerprint},
        {"attached", handle.attached},
        {"statusUrl", status_url},
        {"resultUrl", status_url + "/result"}
    };
    crow::response resp = jsonResponse(202, body);
    resp.add_header("Location", status_url);
    return resp;
}

crow::response preflightResponse() {
    crow::response resp(204);
    addCorsHeaders(resp);
    return resp;
}

} // namespace http
} // namespace prism
