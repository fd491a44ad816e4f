#ifndef PRISM_TESTS_MOCKS_FAKE_CONFIG_SERVICE_H
#define PRISM_TESTS_MOCKS_FAKE_CONFIG_SERVICE_H

#include "../../src/interfaces/config_service_interface.h"
#include <map>
#include <mutex>
#include <string>

namespace prism {
namespace testing {

/**
 * @brief In-memory API key source for testing
 */
class FakeConfigService : public ConfigServiceInterface {
public:
    explicit FakeConfigService(std::map<std::string, std::string> keys = {})
        : keys_(std::move(keys)) {}

    std::map<std::string, std::string> getApiKeys() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++lookups_;
        return keys_;
    }

    bool refreshApiKeys() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !keys_.empty();
    }

    bool isInitialized() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !keys_.empty();
    }

    const std::string& getSecretName() const override {
        return name_;
    }

    // Test helpers
    void setKeys(std::map<std::string, std::string> keys) {
        std::lock_guard<std::mutex> lock(mutex_);
        keys_ = std::move(keys);
    }

    int getLookupCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookups_;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> keys_;
    std::string name_ = "FAKE_API_KEYS";
    int lookups_ = 0;
};

} // namespace testing
} // namespace prism

#endif // PRISM_TESTS_MOCKS_FAKE_CONFIG_SERVICE_H
