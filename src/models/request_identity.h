#ifndef PRISM_REQUEST_IDENTITY_H
#define PRISM_REQUEST_IDENTITY_H

#include <string>

namespace prism {

/**
 * @brief Caller identity as established by the auth middleware
 */
struct RequestIdentity {
    std::string user_id;
    std::string client_ip;
    bool authenticated = false;

    // Key the admission controller buckets this caller under
    std::string admissionKey() const {
        if (authenticated && !user_id.empty()) {
            return "user:" + user_id;
        }
        return "ip:" + client_ip;
    }

    static RequestIdentity user(const std::string& id, const std::string& ip = "") {
        RequestIdentity identity;
        identity.user_id = id;
        identity.client_ip = ip;
        identity.authenticated = true;
        return identity;
    }

    static RequestIdentity anonymous(const std::string& ip) {
        RequestIdentity identity;
        identity.client_ip = ip;
        return identity;
    }
};

} // namespace prism

#endif // PRISM_REQUEST_IDENTITY_H
