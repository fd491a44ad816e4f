#ifndef PRISM_CONFIG_SERVICE_INTERFACE_H
#define PRISM_CONFIG_SERVICE_INTERFACE_H

#include <map>
#include <string>

namespace prism {

/**
 * @brief Abstract interface for configuration/secrets services
 *
 * Supplies the API keys accepted by the auth middleware and the user id
 * each key authenticates as.
 */
class ConfigServiceInterface {
public:
    virtual ~ConfigServiceInterface() = default;

    /**
     * @brief Get the configured API keys
     * @return Map of API key to user id, empty if none are configured
     */
    virtual std::map<std::string, std::string> getApiKeys() = 0;

    /**
     * @brief Force refresh the API keys
     * @return true if at least one key is available afterwards
     */
    virtual bool refreshApiKeys() = 0;

    /**
     * @brief Check if the service is initialized
     * @return true if initialized with at least one valid key
     */
    virtual bool isInitialized() const = 0;

    /**
     * @brief Get the secret/config name being used
     * @return secret or environment variable name
     */
    virtual const std::string& getSecretName() const = 0;
};

} // namespace prism

#endif // PRISM_CONFIG_SERVICE_INTERFACE_H
