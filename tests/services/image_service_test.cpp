#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "services/image_service.h"
#include "exceptions/pipeline_exceptions.h"
#include "utils/file_utils.h"
#include "utils/logger.h"
#include "utils/metrics.h"
#include "test_helpers/test_constants.h"
#include "test_helpers/test_builders.h"
#include "test_helpers/custom_matchers.h"
#include "mocks/fake_database_client.h"
#include "mocks/fake_file_service.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace prism;
using namespace prism::test_constants;
using namespace prism::test_builders;
using namespace prism::test_matchers;

class ImageServiceTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        ImageProcessor::initialize();
    }

    void SetUp() override {
        prism::Logger::initialize("prism-test", "error", prism::Logger::Format::TEXT, "test");
        prism::Metrics::initialize("PrismTest", "prism-test", "test", false);

        file_service_ = std::make_shared<prism::testing::FakeFileService>();
        db_ = std::make_shared<prism::testing::FakeDatabaseClient>();
        service_ = std::make_unique<ImageService>(file_service_, db_,
                                                  std::make_shared<ImageProcessor>(), nullptr);

        alice_ = RequestIdentity::user(TEST_USER_ALICE, TEST_CLIENT_IP);
        bob_ = RequestIdentity::user(TEST_USER_BOB, TEST_CLIENT_IP_2);
        png_ = TestImageFactory::createSolid(64, 48, {10, 20, 30});
    }

    std::shared_ptr<prism::testing::FakeFileService> file_service_;
    std::shared_ptr<prism::testing::FakeDatabaseClient> db_;
    std::unique_ptr<ImageService> service_;
    RequestIdentity alice_;
    RequestIdentity bob_;
    std::vector<char> png_;
};

// ============================================================================
// Upload
// ============================================================================

TEST_F(ImageServiceTest, Upload_StoresOriginalAndMetadata) {
    // Act
    ImageMetadata metadata = service_->uploadImage(png_, "photo.png", alice_);

    // Assert
    EXPECT_THAT(metadata.image_id, IsValidPrefixedId("img"));
    EXPECT_EQ(TEST_USER_ALICE, metadata.owner_id);
    EXPECT_EQ(utils::FileUtils::calculateSHA256(png_), metadata.content_hash);
    EXPECT_EQ(FORMAT_PNG, metadata.format());
    EXPECT_EQ("photo", metadata.name);
    EXPECT_EQ(64, metadata.width);
    EXPECT_EQ(48, metadata.height);
    EXPECT_EQ(png_.size(), metadata.size_bytes);

    EXPECT_EQ(png_, file_service_->downloadData(metadata.storage_key));
    EXPECT_EQ(MIME_PNG, file_service_->getContentType(metadata.storage_key));
    ASSERT_TRUE(db_->getImageMetadata(metadata.image_id).has_value());
}

TEST_F(ImageServiceTest, Upload_DecodedFormatWinsOverExtension) {
    ImageMetadata metadata = service_->uploadImage(png_, "mislabelled.jpg", alice_);

    EXPECT_EQ(FORMAT_PNG, metadata.format());
}

TEST_F(ImageServiceTest, Upload_SameBytesTwice_SharesStoredOriginal) {
    ImageMetadata first = service_->uploadImage(png_, "a.png", alice_);
    ImageMetadata second = service_->uploadImage(png_, "b.png", bob_);

    EXPECT_NE(first.image_id, second.image_id);
    EXPECT_EQ(first.storage_key, second.storage_key);
    EXPECT_EQ(1u, file_service_->getObjectCount());
    EXPECT_EQ(2u, db_->getImageMetadataCount());
}

TEST_F(ImageServiceTest, Upload_Unauthenticated_Throws) {
    EXPECT_THROW(service_->uploadImage(png_, "a.png", RequestIdentity::anonymous(TEST_CLIENT_IP)),
                 exceptions::UnauthorizedException);
}

TEST_F(ImageServiceTest, Upload_UnsupportedExtension_ThrowsValidation) {
    EXPECT_THROW(service_->uploadImage(png_, "a.bmp", alice_), exceptions::ValidationException);
}

TEST_F(ImageServiceTest, Upload_EmptyFile_ThrowsValidation) {
    EXPECT_THROW(service_->uploadImage({}, "a.png", alice_), exceptions::ValidationException);
}

TEST_F(ImageServiceTest, Upload_UndecodableBytes_ThrowsValidation) {
    auto garbage = TestDataBuilder::createTextData(TEST_CONTENT);

    EXPECT_THROW(service_->uploadImage(garbage, "a.png", alice_), exceptions::ValidationException);
    EXPECT_EQ(0u, file_service_->getObjectCount());
}

TEST_F(ImageServiceTest, Upload_StorageFailure_StoresNoMetadata) {
    file_service_->setFailUploads(true);

    EXPECT_THROW(service_->uploadImage(png_, "a.png", alice_), std::runtime_error);
    EXPECT_EQ(0u, db_->getImageMetadataCount());
}

TEST_F(ImageServiceTest, Upload_MetadataFailure_RollsBackStoredOriginal) {
    db_->setFailWrites(true);

    EXPECT_THROW(service_->uploadImage(png_, "a.png", alice_), std::runtime_error);
    EXPECT_EQ(0u, file_service_->getObjectCount());
}

TEST_F(ImageServiceTest, Upload_OverRateLimit_ThrowsThrottled) {
    auto limiter = std::make_shared<RateLimiter>(RateLimitConfig(0.1, 1.0),
                                                 RateLimitConfig(), RateLimitConfig());
    ImageService limited(file_service_, db_, std::make_shared<ImageProcessor>(), limiter);

    limited.uploadImage(png_, "a.png", alice_);

    EXPECT_THROW(limited.uploadImage(png_, "b.png", alice_), exceptions::ThrottledException);
    EXPECT_NO_THROW(limited.uploadImage(png_, "c.png", bob_));
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(ImageServiceTest, GetImageRecord_OwnerOnly) {
    ImageMetadata stored = service_->uploadImage(png_, "a.png", alice_);

    EXPECT_EQ(stored.image_id, service_->getImageRecord(stored.image_id, alice_).image_id);
    EXPECT_THROW(service_->getImageRecord(stored.image_id, bob_), exceptions::ForbiddenException);
    EXPECT_THROW(service_->getImageRecord(IMAGE_ID_NONEXISTENT, alice_), exceptions::NotFoundException);
}

TEST_F(ImageServiceTest, FindImage_IgnoresOwnership) {
    ImageMetadata stored = service_->uploadImage(png_, "a.png", alice_);

    EXPECT_TRUE(service_->findImage(stored.image_id).has_value());
    EXPECT_FALSE(service_->findImage(IMAGE_ID_NONEXISTENT).has_value());
}

TEST_F(ImageServiceTest, LoadOriginal_MissingBlob_ThrowsNotFound) {
    ImageMetadata metadata = ImageMetadataBuilder().build();

    EXPECT_THROW(service_->loadOriginal(metadata), exceptions::NotFoundException);
}

TEST_F(ImageServiceTest, ListImages_ReturnsOnlyCallersImages) {
    service_->uploadImage(png_, "a.png", alice_);
    service_->uploadImage(TestImageFactory::createSolid(8, 8, {1, 2, 3}), "b.png", alice_);
    service_->uploadImage(png_, "c.png", bob_);

    auto images = service_->listImages(alice_, 10, 0);

    ASSERT_EQ(2u, images.size());
    for (const auto& image : images) {
        EXPECT_EQ(TEST_USER_ALICE, image.owner_id);
    }
    EXPECT_EQ(1u, service_->listImages(alice_, 1, 0).size());
    EXPECT_EQ(1u, service_->listImages(alice_, 10, 1).size());
}

TEST_F(ImageServiceTest, ListImages_InvalidPaging_ThrowsValidation) {
    EXPECT_THROW(service_->listImages(alice_, 0, 0), exceptions::ValidationException);
    EXPECT_THROW(service_->listImages(alice_, ImageUploadLimits::MAX_LIST_LIMIT + 1, 0),
                 exceptions::ValidationException);
    EXPECT_THROW(service_->listImages(alice_, 10, -1), exceptions::ValidationException);
}

// ============================================================================
// Delete
// ============================================================================

TEST_F(ImageServiceTest, Delete_LastReference_RemovesStoredOriginal) {
    ImageMetadata stored = service_->uploadImage(png_, "a.png", alice_);

    service_->deleteImage(stored.image_id, alice_);

    EXPECT_FALSE(db_->getImageMetadata(stored.image_id).has_value());
    EXPECT_FALSE(file_service_->objectExists(stored.storage_key));
}

TEST_F(ImageServiceTest, Delete_SharedOriginal_KeptUntilLastReference) {
    ImageMetadata mine = service_->uploadImage(png_, "a.png", alice_);
    ImageMetadata theirs = service_->uploadImage(png_, "a.png", bob_);

    service_->deleteImage(mine.image_id, alice_);
    EXPECT_TRUE(file_service_->objectExists(theirs.storage_key));

    service_->deleteImage(theirs.image_id, bob_);
    EXPECT_FALSE(file_service_->objectExists(theirs.storage_key));
}

TEST_F(ImageServiceTest, ConcurrentDeleteDuringDuplicateUpload_KeepsSharedOriginal) {
    ImageMetadata mine = service_->uploadImage(png_, "a.png", alice_);

    // Alice deletes her copy while bob's upload sits between the dedup check
    // and its metadata write
    std::thread deleter;
    std::atomic<bool> fired{false};
    file_service_->setAfterExistsCheck([&](const std::string&) {
        if (fired.exchange(true)) {
            return;
        }
        deleter = std::thread([&] { service_->deleteImage(mine.image_id, alice_); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    });

    ImageMetadata theirs = service_->uploadImage(png_, "b.png", bob_);
    deleter.join();
    file_service_->setAfterExistsCheck(nullptr);

    EXPECT_FALSE(db_->getImageMetadata(mine.image_id).has_value());
    EXPECT_TRUE(file_service_->objectExists(theirs.storage_key));
    EXPECT_EQ(png_, service_->loadOriginal(theirs));
}

TEST_F(ImageServiceTest, Delete_ForeignImage_ThrowsForbidden) {
    ImageMetadata stored = service_->uploadImage(png_, "a.png", alice_);

    EXPECT_THROW(service_->deleteImage(stored.image_id, bob_), exceptions::ForbiddenException);
    EXPECT_TRUE(db_->getImageMetadata(stored.image_id).has_value());
}
