#ifndef PRISM_FILE_UTILS_H
#define PRISM_FILE_UTILS_H

#include <string>
#include <vector>

namespace prism {
namespace utils {

class FileUtils {
public:
    // SHA256 of binary data as lowercase hex, empty on digest failure
    static std::string calculateSHA256(const std::vector<char>& data);

    // SHA256 of a string as lowercase hex
    static std::string calculateSHA256(const std::string& text);

    // Get file extension from filename (lowercased, without dot)
    static std::string getFileExtension(const std::string& filename);

    // Validate image file format
    static bool isValidImageFormat(const std::string& extension);

    // Get MIME type from extension
    static std::string getMimeType(const std::string& extension);

    // Map a MIME type back to its canonical format name, empty if unknown
    static std::string getFormatFromMimeType(const std::string& mime_type);
};

} // namespace utils
} // namespace prism

#endif // PRISM_FILE_UTILS_H
