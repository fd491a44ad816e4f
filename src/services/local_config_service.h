#ifndef PRISM_LOCAL_CONFIG_SERVICE_H
#define PRISM_LOCAL_CONFIG_SERVICE_H

#include "../interfaces/config_service_interface.h"
#include <string>
#include <mutex>

namespace prism {

/**
 * @brief Local configuration service for retrieving API keys
 *
 * Reads "key:user,key:user" from an environment variable. A single bare
 * key without a user maps to the "default" user.
 */
class LocalConfigService : public ConfigServiceInterface {
public:
    /**
     * @brief Constructor
     * @param api_keys_env_var Environment variable name for the key list (default: "API_KEYS")
     */
    explicit LocalConfigService(const std::string& api_keys_env_var = "API_KEYS");

    std::map<std::string, std::string> getApiKeys() override;

    /**
     * @brief Force refresh the API keys (re-reads from environment)
     * @return true if at least one API key is available, false otherwise
     */
    bool refreshApiKeys() override;

    bool isInitialized() const override;

    const std::string& getSecretName() const override { return api_keys_env_var_; }

    /**
     * @brief Parse "key:user,key:user"
     *
     * Whitespace around entries is ignored; empty entries and entries
     * with an empty key are skipped.
     */
    static std::map<std::string, std::string> parseApiKeys(const std::string& value);

private:
    std::string api_keys_env_var_;
    mutable std::mutex cache_mutex_;
    std::map<std::string, std::string> cached_keys_;
    bool initialized_;

    /**
     * @brief Read API keys from environment variable
     * @return Parsed keys, empty if the variable is unset
     */
    std::map<std::string, std::string> readApiKeysFromEnv();
};

} // namespace prism

#endif // PRISM_LOCAL_CONFIG_SERVICE_H
