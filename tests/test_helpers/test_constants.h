#ifndef PRISM_TEST_HELPERS_TEST_CONSTANTS_H
#define PRISM_TEST_HELPERS_TEST_CONSTANTS_H

#include <string>
#include <cstddef>
#include <ctime>

namespace prism {
namespace test_constants {

// Hash and crypto constants
constexpr int SHA256_HEX_LENGTH = 64;

// Image dimension constants
constexpr int SMALL_IMAGE_SIZE = 10;
constexpr int MEDIUM_IMAGE_SIZE = 100;

// Source image used by the delivery scenarios
constexpr int SOURCE_WIDTH = 1000;
constexpr int SOURCE_HEIGHT = 800;

// Test content
const std::string TEST_CONTENT = "Hello, Prism!";
const std::string TEST_INVALID_IMAGE_CONTENT = "not an image";

// Image formats
const std::string FORMAT_JPEG = "jpeg";
const std::string FORMAT_JPG = "jpg";
const std::string FORMAT_PNG = "png";
const std::string FORMAT_WEBP = "webp";
const std::string FORMAT_GIF = "gif";
const std::string FORMAT_TIFF = "tiff";
const std::string FORMAT_BMP = "bmp";

// MIME types
const std::string MIME_JPEG = "image/jpeg";
const std::string MIME_PNG = "image/png";
const std::string MIME_WEBP = "image/webp";
const std::string MIME_GIF = "image/gif";
const std::string MIME_DEFAULT = "application/octet-stream";

// Test identifiers
const std::string TEST_IMAGE_ID = "img_test_1";
const std::string TEST_IMAGE_ID_2 = "img_test_2";
const std::string TEST_OVERLAY_ID = "img_overlay_1";
const std::string IMAGE_ID_NONEXISTENT = "img_nonexistent";
const std::string JOB_ID_NONEXISTENT = "job_nonexistent";
const std::string TEST_USER_ALICE = "alice";
const std::string TEST_USER_BOB = "bob";
const std::string TEST_CLIENT_IP = "203.0.113.7";
const std::string TEST_CLIENT_IP_2 = "198.51.100.23";

// Content hash of a source that never exists in storage
const std::string TEST_CONTENT_HASH =
    "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
const std::string TEST_CONTENT_HASH_2 =
    "60303ae22b998861bce3b28f33eec1be758a213c86c93c076dbe9f558c11c752";

// Storage key prefixes
const std::string RAW_PREFIX = "raw/";
const std::string TRANSFORMED_PREFIX = "transformed/";

// Test data sizes
constexpr size_t SMALL_DATA_SIZE = 256;
constexpr size_t MEDIUM_DATA_SIZE = 1024;

// Concurrency test constants
constexpr int CONCURRENT_THREADS_SMALL = 10;
constexpr int CONCURRENT_THREADS_LARGE = 50;
constexpr int UNIQUENESS_TEST_COUNT = 10000;

// Image processing constants
constexpr int RGB_BANDS = 3;
constexpr int RGBA_BANDS = 4;

// Quality constants
constexpr int DEFAULT_QUALITY = 85;
constexpr int LOW_QUALITY = 30;

// Timestamp constants
constexpr std::time_t TEST_TIMESTAMP_CREATED = 1234567890;

// HTTP Header constants
const std::string HTTP_HEADER_API_KEY = "X-API-Key";
const std::string HTTP_HEADER_API_KEY_LOWERCASE = "x-api-key";
const std::string HTTP_HEADER_FORWARDED_FOR = "X-Forwarded-For";
const std::string HTTP_HEADER_CONTENT_TYPE = "Content-Type";
const std::string HTTP_CONTENT_TYPE_JSON = "application/json";

// HTTP Status codes
constexpr int HTTP_STATUS_UNAUTHORIZED = 401;

// API Key test values
const std::string TEST_API_KEY_ALICE = "alice-key-123";
const std::string TEST_API_KEY_BOB = "bob-key-456";
const std::string TEST_API_KEY_WRONG = "wrong-key";
const std::string TEST_API_KEY_SPECIAL_CHARS = "api-key!@#$%^&*()";
const std::string TEST_API_KEY_SPECIAL_CHARS_DIFFERENT = "api-key!@#$%^&*(?)";

// Test string constants
const std::string EMPTY_STRING = "";
const std::string TEST_STRING_123 = "test123";
const std::string TEST_STRING_456 = "test456";
const std::string TEST_STRING_SHORT = "short";
const std::string TEST_STRING_LONG = "much-longer-string";
const std::string TEST_STRING_MIXED_CASE = "TestKey";
const std::string TEST_STRING_LOWER_CASE = "testkey";

// Error message constants
const std::string ERROR_MESSAGE_TEST = "Test error message";

} // namespace test_constants
} // namespace prism

#endif // PRISM_TEST_HELPERS_TEST_CONSTANTS_H
