#ifndef PRISM_FILE_SERVICE_INTERFACE_H
#define PRISM_FILE_SERVICE_INTERFACE_H

#include <string>
#include <vector>

namespace prism {

/**
 * @brief Abstract interface for blob storage
 *
 * Holds original uploads (raw/...) and the persistent tier of the
 * artifact cache (transformed/...). Keys are relative, slash separated
 * paths.
 */
class FileServiceInterface {
public:
    virtual ~FileServiceInterface() = default;

    // Store binary data under key, replacing any previous content
    virtual bool uploadData(const std::vector<char>& data, const std::string& key,
                           const std::string& content_type = "application/octet-stream") = 0;

    // Read the object into memory; empty if missing or unreadable
    virtual std::vector<char> downloadData(const std::string& key) = 0;

    // Check if object exists
    virtual bool objectExists(const std::string& key) = 0;

    // Delete object
    virtual bool deleteObject(const std::string& key) = 0;

    // Root directory (or bucket) the keys are resolved against
    virtual const std::string& getStorageRoot() const = 0;
};

} // namespace prism

#endif // PRISM_FILE_SERVICE_INTERFACE_H
