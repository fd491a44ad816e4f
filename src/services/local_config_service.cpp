#include "local_config_service.h"
#include "../utils/logger.h"
#include <cstdlib>
#include <sstream>

namespace prism {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

LocalConfigService::LocalConfigService(const std::string& api_keys_env_var)
    : api_keys_env_var_(api_keys_env_var), initialized_(false) {

    // Try to read API keys on initialization
    cached_keys_ = readApiKeysFromEnv();
    initialized_ = !cached_keys_.empty();

    if (initialized_) {
        LOG_INFO("Local config service initialized with {} API keys from: {}",
                 cached_keys_.size(), api_keys_env_var_);
    } else {
        LOG_WARN("Local config service initialized but no API keys found in: {}", api_keys_env_var_);
    }
}

std::map<std::string, std::string> LocalConfigService::parseApiKeys(const std::string& value) {
    std::map<std::string, std::string> keys;
    std::stringstream stream(value);
    std::string entry;

    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (entry.empty()) {
            continue;
        }

        size_t colon = entry.find(':');
        std::string key = trim(entry.substr(0, colon));
        std::string user = colon == std::string::npos ? "default" : trim(entry.substr(colon + 1));

        if (key.empty() || user.empty()) {
            LOG_WARN("Skipping malformed API key entry");
            continue;
        }
        keys[key] = user;
    }

    return keys;
}

std::map<std::string, std::string> LocalConfigService::readApiKeysFromEnv() {
    const char* value = std::getenv(api_keys_env_var_.c_str());

    if (value == nullptr || std::string(value).empty()) {
        LOG_WARN("API keys not found in environment variable: {}", api_keys_env_var_);
        return {};
    }

    return parseApiKeys(value);
}

std::map<std::string, std::string> LocalConfigService::getApiKeys() {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    if (cached_keys_.empty()) {
        // Try to refresh if not cached
        cached_keys_ = readApiKeysFromEnv();
        initialized_ = !cached_keys_.empty();
    }

    return cached_keys_;
}

bool LocalConfigService::refreshApiKeys() {
    std::lock_guard<std::mutex> lock(cache_mutex_);

    cached_keys_ = readApiKeysFromEnv();
    initialized_ = !cached_keys_.empty();

    if (initialized_) {
        LOG_DEBUG("API keys refreshed from environment");
    } else {
        LOG_ERROR("Failed to refresh API keys - none found in environment");
    }

    return initialized_;
}

bool LocalConfigService::isInitialized() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return initialized_;
}

} // namespace prism
