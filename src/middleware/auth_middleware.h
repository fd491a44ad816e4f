#ifndef PRISM_AUTH_MIDDLEWARE_H
#define PRISM_AUTH_MIDDLEWARE_H

#include <string>
#include <map>
#include <crow.h>
#include "../interfaces/config_service_interface.h"
#include "../models/request_identity.h"

namespace prism {
namespace middleware {

/**
 * Authentication middleware mapping API keys to user identities
 */
class AuthMiddleware {
public:
    /**
     * Resolve the caller of a request
     * @param req Crow HTTP request
     * @param config_service Source of the accepted API keys
     * @return Authenticated identity when the X-API-Key header matches a
     *         configured key, an anonymous identity otherwise
     */
    static RequestIdentity authenticate(const crow::request& req,
                                        ConfigServiceInterface& config_service);

    /**
     * Look up the user a key belongs to, comparing against every key in
     * constant time
     * @return User id, or empty string if no key matches
     */
    static std::string resolveUser(const std::string& provided_key,
                                   const std::map<std::string, std::string>& api_keys);

    /**
     * Extract X-API-Key header from request
     * @param req Crow HTTP request
     * @return API key value, or empty string if not present
     */
    static std::string extractApiKey(const crow::request& req);

    /**
     * Client address, preferring the first X-Forwarded-For entry
     */
    static std::string extractClientIp(const crow::request& req);

    /**
     * Compare two strings in constant time to prevent timing attacks
     * @param a First string
     * @param b Second string
     * @return true if strings are equal
     */
    static bool constantTimeCompare(const std::string& a, const std::string& b);

    /**
     * Generate 401 Unauthorized JSON response
     * @param message Error message
     * @return Crow response with 401 status
     */
    static crow::response unauthorizedResponse(const std::string& message);
};

} // namespace middleware
} // namespace prism

#endif // PRISM_AUTH_MIDDLEWARE_H
