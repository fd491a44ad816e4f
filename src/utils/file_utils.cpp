#include "file_utils.h"
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <memory>

namespace prism {
namespace utils {

namespace {

std::string digestHex(const unsigned char* data, size_t length) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!mdctx) {
        return "";
    }

    if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
        return "";
    }

    if (EVP_DigestUpdate(mdctx.get(), data, length) != 1) {
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
        return "";
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < hash_len; i++) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return oss.str();
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), ::tolower);
    return value;
}

} // namespace

std::string FileUtils::calculateSHA256(const std::vector<char>& data) {
    return digestHex(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::string FileUtils::calculateSHA256(const std::string& text) {
    return digestHex(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}

std::string FileUtils::getFileExtension(const std::string& filename) {
    size_t pos = filename.find_last_of('.');
    if (pos == std::string::npos) {
        return "";
    }
    return toLower(filename.substr(pos + 1));
}

bool FileUtils::isValidImageFormat(const std::string& extension) {
    // Only accept formats that libvips can actually process
    static const std::vector<std::string> valid_formats = {
        "jpg", "jpeg", "png", "gif", "tiff", "tif", "webp"
    };

    std::string lower_ext = toLower(extension);
    return std::find(valid_formats.begin(), valid_formats.end(), lower_ext) != valid_formats.end();
}

std::string FileUtils::getMimeType(const std::string& extension) {
    std::string lower_ext = toLower(extension);

    if (lower_ext == "jpg" || lower_ext == "jpeg") return "image/jpeg";
    if (lower_ext == "png") return "image/png";
    if (lower_ext == "gif") return "image/gif";
    if (lower_ext == "tiff" || lower_ext == "tif") return "image/tiff";
    if (lower_ext == "webp") return "image/webp";

    return "application/octet-stream";
}

std::string FileUtils::getFormatFromMimeType(const std::string& mime_type) {
    std::string lower = toLower(mime_type);

    if (lower == "image/jpeg" || lower == "image/jpg") return "jpeg";
    if (lower == "image/png") return "png";
    if (lower == "image/gif") return "gif";
    if (lower == "image/tiff") return "tiff";
    if (lower == "image/webp") return "webp";

    return "";
}

} // namespace utils
} // namespace prism
