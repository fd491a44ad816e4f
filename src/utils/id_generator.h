#ifndef PRISM_UTILS_ID_GENERATOR_H
#define PRISM_UTILS_ID_GENERATOR_H

#include <string>

namespace prism {
namespace utils {

/**
 * @brief Utility class for generating unique identifiers
 */
class IdGenerator {
public:
    /**
     * @brief Generate a unique ID with a type prefix and timestamp
     *
     * Format: {prefix}_{timestamp}_{uuid}. The timestamp keeps IDs
     * roughly sortable by creation time.
     *
     * @param prefix Short type tag, e.g. "job" or "img"
     * @return Unique ID string, safe for use as a storage key
     */
    static std::string generateId(const std::string& prefix);

    static std::string generateJobId();

    static std::string generateImageId();

    /**
     * @brief Generate a bare UUID v4 string (request correlation IDs)
     */
    static std::string generateUuid();
};

} // namespace utils
} // namespace prism

#endif // PRISM_UTILS_ID_GENERATOR_H
