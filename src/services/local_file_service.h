#ifndef PRISM_LOCAL_FILE_SERVICE_H
#define PRISM_LOCAL_FILE_SERVICE_H

#include "../interfaces/file_service_interface.h"
#include <filesystem>

namespace prism {

/**
 * @brief Local filesystem implementation of file storage service
 *
 * Keys map to paths below the storage root. Writes go to a temporary
 * sibling first and are renamed into place, so readers never observe a
 * partially written object.
 */
class LocalFileService : public FileServiceInterface {
public:
    /**
     * @brief Constructor
     * @param storage_path Root directory for file storage
     * @throws std::runtime_error if the directory cannot be created
     */
    explicit LocalFileService(const std::string& storage_path);

    virtual ~LocalFileService() = default;

    bool uploadData(const std::vector<char>& data, const std::string& key,
                   const std::string& content_type = "application/octet-stream") override;

    std::vector<char> downloadData(const std::string& key) override;

    bool objectExists(const std::string& key) override;

    bool deleteObject(const std::string& key) override;

    const std::string& getStorageRoot() const override { return storage_path_; }

private:
    std::string storage_path_;

    /**
     * @brief Get the full filesystem path for a key
     * @throws std::invalid_argument for absolute keys or keys escaping the root
     */
    std::filesystem::path getFilePath(const std::string& key) const;

    /**
     * @brief Ensure directory exists for a file path
     */
    bool ensureDirectoryExists(const std::filesystem::path& file_path);
};

} // namespace prism

#endif // PRISM_LOCAL_FILE_SERVICE_H
