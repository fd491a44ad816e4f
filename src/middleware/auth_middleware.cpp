#include "auth_middleware.h"
#include "../utils/logger.h"
#include "../utils/metrics.h"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace prism {
namespace middleware {

RequestIdentity AuthMiddleware::authenticate(const crow::request& req,
                                             ConfigServiceInterface& config_service) {
    std::string client_ip = extractClientIp(req);
    std::string provided_key = extractApiKey(req);

    if (provided_key.empty()) {
        prism::Logger::log_structured(spdlog::level::debug, "Request without API key", {
            {"reason", "missing_key"},
            {"endpoint", std::string(req.url)},
            {"client_ip", client_ip}
        });
        METRICS_COUNT("AuthAttempts", 1.0, "Count", {{"status", "missing_key"}});
        return RequestIdentity::anonymous(client_ip);
    }

    std::map<std::string, std::string> api_keys = config_service.getApiKeys();
    if (api_keys.empty()) {
        LOG_WARN("Authentication attempted but no API keys are configured");
        METRICS_COUNT("AuthAttempts", 1.0, "Count", {{"status", "unconfigured"}});
        return RequestIdentity::anonymous(client_ip);
    }

    std::string user_id = resolveUser(provided_key, api_keys);
    if (user_id.empty()) {
        // Security: Log failed auth without revealing the actual key
        prism::Logger::log_structured(spdlog::level::warn, "Authentication failed: invalid API key", {
            {"reason", "invalid_key"},
            {"endpoint", std::string(req.url)},
            {"client_ip", client_ip}
        });
        METRICS_COUNT("AuthAttempts", 1.0, "Count", {{"status", "invalid_key"}});
        return RequestIdentity::anonymous(client_ip);
    }

    METRICS_COUNT("AuthAttempts", 1.0, "Count", {{"status", "success"}});
    return RequestIdentity::user(user_id, client_ip);
}

std::string AuthMiddleware::resolveUser(const std::string& provided_key,
                                        const std::map<std::string, std::string>& api_keys) {
    std::string matched_user;

    // Visit every key so the timing does not depend on which one matches
    for (const auto& entry : api_keys) {
        if (constantTimeCompare(provided_key, entry.first)) {
            matched_user = entry.second;
        }
    }

    return matched_user;
}

std::string AuthMiddleware::extractApiKey(const crow::request& req) {
    // Check for X-API-Key header
    auto api_key_header = req.get_header_value("X-API-Key");

    if (api_key_header.empty()) {
        // Also check lowercase variant (HTTP headers are case-insensitive)
        api_key_header = req.get_header_value("x-api-key");
    }

    return api_key_header;
}

std::string AuthMiddleware::extractClientIp(const crow::request& req) {
    std::string forwarded = req.get_header_value("X-Forwarded-For");
    if (!forwarded.empty()) {
        size_t comma = forwarded.find(',');
        std::string first = forwarded.substr(0, comma);
        first.erase(0, first.find_first_not_of(' '));
        first.erase(first.find_last_not_of(' ') + 1);
        if (!first.empty()) {
            return first;
        }
    }
    return req.remote_ip_address;
}

bool AuthMiddleware::constantTimeCompare(const std::string& a, const std::string& b) {
    // If lengths differ, still compare to prevent timing attacks revealing length
    size_t len_a = a.length();
    size_t len_b = b.length();

    // Use the longer length for comparison
    size_t max_len = std::max(len_a, len_b);

    unsigned char result = 0;

    // Compare byte by byte
    for (size_t i = 0; i < max_len; ++i) {
        unsigned char byte_a = (i < len_a) ? static_cast<unsigned char>(a[i]) : 0;
        unsigned char byte_b = (i < len_b) ? static_cast<unsigned char>(b[i]) : 0;
        result |= byte_a ^ byte_b;
    }

    // Also account for different lengths
    if (len_a != len_b) {
        result |= 1;
    }

    return result == 0;
}

crow::response AuthMiddleware::unauthorizedResponse(const std::string& message) {
    json error_json = {
        {"error", "Unauthorized"},
        {"message", message}
    };

    crow::response res(401);
    res.set_header("Content-Type", "application/json");
    res.write(error_json.dump());
    return res;
}

} // namespace middleware
} // namespace prism
