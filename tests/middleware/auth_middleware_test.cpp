#include <gtest/gtest.h>
#include "middleware/auth_middleware.h"
#include "utils/logger.h"
#include "utils/metrics.h"
#include "test_helpers/test_constants.h"
#include "mocks/fake_config_service.h"
#include <crow.h>

using namespace prism;
using namespace prism::middleware;
using namespace prism::test_constants;

class AuthMiddlewareTest : public ::testing::Test {
protected:
    void SetUp() override {
        prism::Logger::initialize("prism-test", "error", prism::Logger::Format::TEXT, "test");
        prism::Metrics::initialize("PrismTest", "prism-test", "test", false);

        config_ = std::make_unique<prism::testing::FakeConfigService>(
            std::map<std::string, std::string>{
                {TEST_API_KEY_ALICE, TEST_USER_ALICE},
                {TEST_API_KEY_BOB, TEST_USER_BOB}
            });
    }

    // Helper to create a mock request with headers
    crow::request createMockRequest(const std::map<std::string, std::string>& headers) {
        crow::request req;
        req.remote_ip_address = TEST_CLIENT_IP;
        for (const auto& [key, value] : headers) {
            req.add_header(key, value);
        }
        return req;
    }

    std::unique_ptr<prism::testing::FakeConfigService> config_;
};

// ============================================================================
// Header extraction
// ============================================================================

TEST_F(AuthMiddlewareTest, ExtractApiKey_WithValidHeader_ReturnsKey) {
    // Arrange
    auto req = createMockRequest({{HTTP_HEADER_API_KEY, TEST_API_KEY_ALICE}});

    // Act
    std::string extracted = AuthMiddleware::extractApiKey(req);

    // Assert
    EXPECT_EQ(TEST_API_KEY_ALICE, extracted)
        << "Should extract API key from X-API-Key header";
}

TEST_F(AuthMiddlewareTest, ExtractApiKey_WithLowercaseHeader_ReturnsKey) {
    auto req = createMockRequest({{HTTP_HEADER_API_KEY_LOWERCASE, TEST_API_KEY_BOB}});

    EXPECT_EQ(TEST_API_KEY_BOB, AuthMiddleware::extractApiKey(req))
        << "Header names are case-insensitive";
}

TEST_F(AuthMiddlewareTest, ExtractApiKey_WithMissingHeader_ReturnsEmpty) {
    auto req = createMockRequest({});

    EXPECT_TRUE(AuthMiddleware::extractApiKey(req).empty());
}

TEST_F(AuthMiddlewareTest, ExtractClientIp_PrefersFirstForwardedAddress) {
    auto req = createMockRequest({{HTTP_HEADER_FORWARDED_FOR, " " + TEST_CLIENT_IP_2 + ", 10.0.0.1"}});

    EXPECT_EQ(TEST_CLIENT_IP_2, AuthMiddleware::extractClientIp(req));
}

TEST_F(AuthMiddlewareTest, ExtractClientIp_FallsBackToRemoteAddress) {
    auto req = createMockRequest({});

    EXPECT_EQ(TEST_CLIENT_IP, AuthMiddleware::extractClientIp(req));
}

// ============================================================================
// Key resolution
// ============================================================================

TEST_F(AuthMiddlewareTest, ResolveUser_MapsKeyToUser) {
    std::map<std::string, std::string> keys = config_->getApiKeys();

    EXPECT_EQ(TEST_USER_ALICE, AuthMiddleware::resolveUser(TEST_API_KEY_ALICE, keys));
    EXPECT_EQ(TEST_USER_BOB, AuthMiddleware::resolveUser(TEST_API_KEY_BOB, keys));
    EXPECT_TRUE(AuthMiddleware::resolveUser(TEST_API_KEY_WRONG, keys).empty());
    EXPECT_TRUE(AuthMiddleware::resolveUser(EMPTY_STRING, keys).empty());
}

TEST_F(AuthMiddlewareTest, ResolveUser_PrefixOfKey_DoesNotMatch) {
    std::map<std::string, std::string> keys = config_->getApiKeys();

    EXPECT_TRUE(AuthMiddleware::resolveUser(TEST_API_KEY_ALICE.substr(0, 5), keys).empty());
}

// ============================================================================
// Authenticate
// ============================================================================

TEST_F(AuthMiddlewareTest, Authenticate_WithValidKey_ReturnsUserIdentity) {
    auto req = createMockRequest({{HTTP_HEADER_API_KEY, TEST_API_KEY_ALICE}});

    RequestIdentity identity = AuthMiddleware::authenticate(req, *config_);

    EXPECT_TRUE(identity.authenticated);
    EXPECT_EQ(TEST_USER_ALICE, identity.user_id);
    EXPECT_EQ(TEST_CLIENT_IP, identity.client_ip);
    EXPECT_EQ("user:" + TEST_USER_ALICE, identity.admissionKey());
}

TEST_F(AuthMiddlewareTest, Authenticate_WithWrongKey_ReturnsAnonymous) {
    auto req = createMockRequest({{HTTP_HEADER_API_KEY, TEST_API_KEY_WRONG}});

    RequestIdentity identity = AuthMiddleware::authenticate(req, *config_);

    EXPECT_FALSE(identity.authenticated);
    EXPECT_TRUE(identity.user_id.empty());
    EXPECT_EQ("ip:" + TEST_CLIENT_IP, identity.admissionKey());
}

TEST_F(AuthMiddlewareTest, Authenticate_WithoutKey_SkipsKeyLookup) {
    auto req = createMockRequest({});

    RequestIdentity identity = AuthMiddleware::authenticate(req, *config_);

    EXPECT_FALSE(identity.authenticated);
    EXPECT_EQ(0, config_->getLookupCount());
}

TEST_F(AuthMiddlewareTest, Authenticate_WithNoConfiguredKeys_ReturnsAnonymous) {
    config_->setKeys({});
    auto req = createMockRequest({{HTTP_HEADER_API_KEY, TEST_API_KEY_ALICE}});

    EXPECT_FALSE(AuthMiddleware::authenticate(req, *config_).authenticated);
}

// ============================================================================
// Constant-time comparison
// ============================================================================

TEST_F(AuthMiddlewareTest, ConstantTimeCompare_WithEqualStrings_ReturnsTrue) {
    EXPECT_TRUE(AuthMiddleware::constantTimeCompare(TEST_STRING_123, TEST_STRING_123));
    EXPECT_TRUE(AuthMiddleware::constantTimeCompare(EMPTY_STRING, EMPTY_STRING));
}

TEST_F(AuthMiddlewareTest, ConstantTimeCompare_WithDifferentStrings_ReturnsFalse) {
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_STRING_123, TEST_STRING_456));
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_STRING_MIXED_CASE, TEST_STRING_LOWER_CASE))
        << "Comparison must be case-sensitive";
}

TEST_F(AuthMiddlewareTest, ConstantTimeCompare_WithDifferentLengths_ReturnsFalse) {
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_STRING_SHORT, TEST_STRING_LONG));
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_STRING_LONG, TEST_STRING_SHORT));
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_STRING_SHORT, EMPTY_STRING));
}

TEST_F(AuthMiddlewareTest, ConstantTimeCompare_WithSpecialChars_ComparesCorrectly) {
    EXPECT_TRUE(AuthMiddleware::constantTimeCompare(TEST_API_KEY_SPECIAL_CHARS, TEST_API_KEY_SPECIAL_CHARS));
    EXPECT_FALSE(AuthMiddleware::constantTimeCompare(TEST_API_KEY_SPECIAL_CHARS,
                                                     TEST_API_KEY_SPECIAL_CHARS_DIFFERENT));
}

// ============================================================================
// Responses
// ============================================================================

TEST_F(AuthMiddlewareTest, UnauthorizedResponse_ReturnsJsonBody) {
    crow::response response = AuthMiddleware::unauthorizedResponse(ERROR_MESSAGE_TEST);

    EXPECT_EQ(HTTP_STATUS_UNAUTHORIZED, response.code);
    EXPECT_EQ(HTTP_CONTENT_TYPE_JSON, response.get_header_value(HTTP_HEADER_CONTENT_TYPE));

    auto body = nlohmann::json::parse(response.body);
    EXPECT_EQ("Unauthorized", body["error"]);
    EXPECT_EQ(ERROR_MESSAGE_TEST, body["message"]);
}
