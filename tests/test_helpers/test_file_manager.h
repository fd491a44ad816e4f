#ifndef PRISM_TEST_HELPERS_TEST_FILE_MANAGER_H
#define PRISM_TEST_HELPERS_TEST_FILE_MANAGER_H

#include <string>
#include <atomic>
#include <ctime>
#include <sstream>
#include <filesystem>
#include <system_error>

namespace prism {
namespace test_helpers {

/**
 * @brief Manages temporary paths for tests to avoid collisions
 *
 * Generates unique temp paths that are safe for parallel test execution.
 * Uses an atomic counter and timestamp to ensure uniqueness across threads.
 */
class TestFileManager {
public:
    /**
     * @brief Create a unique temporary path
     *
     * @param prefix Prefix for the name (e.g., "storage_")
     * @param extension Optional extension (e.g., ".db")
     * @return Unique path in the temp directory
     *
     * Example:
     *   auto path = TestFileManager::createUniquePath("test_", ".db");
     *   // Returns: "/tmp/prism_test_<timestamp>_<counter>.db"
     */
    static std::string createUniquePath(const std::string& prefix,
                                        const std::string& extension = "") {
        static std::atomic<int> counter{0};

        std::ostringstream oss;
        oss << getTempDir() << "/prism_"
            << prefix
            << std::time(nullptr) << "_"
            << counter++
            << extension;

        return oss.str();
    }

    static std::string createUniqueDirPath(const std::string& prefix) {
        return createUniquePath(prefix + "_dir", "");
    }

    static std::string getTempDir() {
        return std::filesystem::temp_directory_path().string();
    }

    // Remove a file or directory tree, ignoring paths that are already gone
    static void removePath(const std::string& path) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

} // namespace test_helpers
} // namespace prism

#endif // PRISM_TEST_HELPERS_TEST_FILE_MANAGER_H
