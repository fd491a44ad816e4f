#include "local_file_service.h"
#include "../utils/logger.h"
#include "../utils/id_generator.h"
#include <fstream>
#include <stdexcept>

namespace prism {

LocalFileService::LocalFileService(const std::string& storage_path)
    : storage_path_(storage_path) {

    // Create storage directory if it doesn't exist
    try {
        std::filesystem::create_directories(storage_path);
        LOG_INFO("Local file storage initialized at: {}", storage_path);
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Failed to create storage directory: {}", e.what());
        throw std::runtime_error("Failed to initialize local file storage");
    }
}

std::filesystem::path LocalFileService::getFilePath(const std::string& key) const {
    std::filesystem::path relative(key);
    if (key.empty() || relative.is_absolute()) {
        throw std::invalid_argument("Invalid storage key: '" + key + "'");
    }
    for (const auto& part : relative) {
        if (part == "..") {
            throw std::invalid_argument("Storage key escapes root: '" + key + "'");
        }
    }
    return std::filesystem::path(storage_path_) / relative;
}

bool LocalFileService::ensureDirectoryExists(const std::filesystem::path& file_path) {
    try {
        auto parent = file_path.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_ERROR("Failed to create directory: {}", e.what());
        return false;
    }
}

bool LocalFileService::uploadData(const std::vector<char>& data, const std::string& key,
                                  const std::string& content_type) {
    try {
        auto dest_path = getFilePath(key);

        if (!ensureDirectoryExists(dest_path)) {
            return false;
        }

        auto temp_path = dest_path;
        temp_path += ".tmp-" + utils::IdGenerator::generateUuid();

        {
            std::ofstream file(temp_path, std::ios::binary);
            if (!file) {
                LOG_ERROR("Failed to open file for writing: {}", temp_path.string());
                return false;
            }

            file.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!file) {
                LOG_ERROR("Failed to write file: {}", temp_path.string());
                file.close();
                std::filesystem::remove(temp_path);
                return false;
            }
        }

        std::filesystem::rename(temp_path, dest_path);

        LOG_DEBUG("Data uploaded: {} ({} bytes, {})", dest_path.string(), data.size(), content_type);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to upload data: {}", e.what());
        return false;
    }
}

std::vector<char> LocalFileService::downloadData(const std::string& key) {
    try {
        auto src_path = getFilePath(key);

        if (!std::filesystem::exists(src_path)) {
            LOG_DEBUG("File not found: {}", src_path.string());
            return {};
        }

        std::ifstream file(src_path, std::ios::binary | std::ios::ate);
        if (!file) {
            LOG_ERROR("Failed to open file for reading: {}", src_path.string());
            return {};
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<char> buffer(static_cast<size_t>(size));
        if (!file.read(buffer.data(), size)) {
            LOG_ERROR("Failed to read file: {}", src_path.string());
            return {};
        }

        LOG_DEBUG("Data downloaded: {} ({} bytes)", src_path.string(), size);
        return buffer;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to download data: {}", e.what());
        return {};
    }
}

bool LocalFileService::objectExists(const std::string& key) {
    try {
        return std::filesystem::exists(getFilePath(key));
    } catch (const std::exception& e) {
        LOG_WARN("Existence check failed for '{}': {}", key, e.what());
        return false;
    }
}

bool LocalFileService::deleteObject(const std::string& key) {
    try {
        auto file_path = getFilePath(key);

        if (!std::filesystem::exists(file_path)) {
            LOG_WARN("File not found for deletion: {}", file_path.string());
            return false;
        }

        std::filesystem::remove(file_path);
        LOG_DEBUG("File deleted: {}", file_path.string());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to delete file: {}", e.what());
        return false;
    }
}

} // namespace prism
