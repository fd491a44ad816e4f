#include <gtest/gtest.h>
#include "utils/file_utils.h"
#include "test_helpers/test_constants.h"
#include "test_helpers/test_builders.h"
#include "test_helpers/custom_matchers.h"

using namespace prism::utils;
using namespace prism::test_constants;
using namespace prism::test_builders;
using namespace prism::test_matchers;

class FileUtilsTest : public ::testing::Test {
};

// ============================================================================
// SHA256 Tests
// ============================================================================

TEST_F(FileUtilsTest, CalculateSHA256_FromData_ReturnsValidHash) {
    // Arrange
    auto data = TestDataBuilder::createTextData(TEST_CONTENT);

    // Act
    std::string hash = FileUtils::calculateSHA256(data);

    // Assert
    EXPECT_THAT(hash, IsValidSHA256Hash());
}

TEST_F(FileUtilsTest, CalculateSHA256_KnownVector_MatchesReference) {
    // SHA256("test")
    EXPECT_EQ("9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08",
              FileUtils::calculateSHA256(std::string("test")));
}

TEST_F(FileUtilsTest, CalculateSHA256_EmptyInput_HashesEmptyString) {
    EXPECT_EQ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855",
              FileUtils::calculateSHA256(std::vector<char>()));
}

TEST_F(FileUtilsTest, CalculateSHA256_StringAndVectorOverloads_Agree) {
    auto data = TestDataBuilder::createTextData(TEST_CONTENT);

    EXPECT_EQ(FileUtils::calculateSHA256(data), FileUtils::calculateSHA256(TEST_CONTENT));
}

TEST_F(FileUtilsTest, CalculateSHA256_DifferentData_ProducesDifferentHashes) {
    auto data1 = TestDataBuilder::createTextData(TEST_STRING_123);
    auto data2 = TestDataBuilder::createTextData(TEST_STRING_456);

    EXPECT_NE(FileUtils::calculateSHA256(data1), FileUtils::calculateSHA256(data2))
        << "Different data should produce different hashes";
}

// ============================================================================
// Extension and MIME Tests
// ============================================================================

TEST_F(FileUtilsTest, GetFileExtension_WithJpgFile_ReturnsLowercaseJpg) {
    EXPECT_EQ(FORMAT_JPG, FileUtils::getFileExtension("photo.jpg"));
}

TEST_F(FileUtilsTest, GetFileExtension_WithUppercaseExtension_ReturnsLowercase) {
    EXPECT_EQ(FORMAT_PNG, FileUtils::getFileExtension("PHOTO.PNG"));
}

TEST_F(FileUtilsTest, GetFileExtension_WithMultipleDots_UsesLastSegment) {
    EXPECT_EQ(FORMAT_WEBP, FileUtils::getFileExtension("holiday.2024.webp"));
}

TEST_F(FileUtilsTest, GetFileExtension_WithoutExtension_ReturnsEmptyString) {
    EXPECT_EQ(EMPTY_STRING, FileUtils::getFileExtension("README"));
}

TEST_F(FileUtilsTest, IsValidImageFormat_AcceptsSupportedExtensions) {
    for (const auto& ext : {"jpg", "jpeg", "png", "gif", "tiff", "tif", "webp", "JPG"}) {
        EXPECT_TRUE(FileUtils::isValidImageFormat(ext)) << ext;
    }
}

TEST_F(FileUtilsTest, IsValidImageFormat_RejectsOtherExtensions) {
    for (const auto& ext : {"bmp", "svg", "exe", ""}) {
        EXPECT_FALSE(FileUtils::isValidImageFormat(ext)) << ext;
    }
}

TEST_F(FileUtilsTest, GetMimeType_MapsFormats) {
    EXPECT_EQ(MIME_JPEG, FileUtils::getMimeType(FORMAT_JPG));
    EXPECT_EQ(MIME_JPEG, FileUtils::getMimeType(FORMAT_JPEG));
    EXPECT_EQ(MIME_PNG, FileUtils::getMimeType(FORMAT_PNG));
    EXPECT_EQ(MIME_WEBP, FileUtils::getMimeType(FORMAT_WEBP));
    EXPECT_EQ(MIME_GIF, FileUtils::getMimeType(FORMAT_GIF));
    EXPECT_EQ(MIME_DEFAULT, FileUtils::getMimeType(FORMAT_BMP));
}

TEST_F(FileUtilsTest, GetFormatFromMimeType_InvertsGetMimeType) {
    for (const auto& format : {FORMAT_JPEG, FORMAT_PNG, FORMAT_WEBP, FORMAT_GIF, FORMAT_TIFF}) {
        EXPECT_EQ(format, FileUtils::getFormatFromMimeType(FileUtils::getMimeType(format)));
    }
    EXPECT_EQ(EMPTY_STRING, FileUtils::getFormatFromMimeType(MIME_DEFAULT));
}
