// ============================================================================
// Strongbox - Error Taxonomy and Secure Buffer Tests
// ============================================================================

#include <gtest/gtest.h>
#include "strongbox/types.hpp"

namespace strongbox::tests {

TEST(ErrorTaxonomyTest, KeyErrorsAreKeyIO) {
    EXPECT_EQ(classify(ErrorCode::KeyGenerationFailed), ErrorClass::KeyIO);
    EXPECT_EQ(classify(ErrorCode::KeyReadError), ErrorClass::KeyIO);
    EXPECT_EQ(classify(ErrorCode::KeyWriteError), ErrorClass::KeyIO);
    EXPECT_EQ(classify(ErrorCode::InvalidKeySize), ErrorClass::KeyIO);
}

TEST(ErrorTaxonomyTest, MalformedInputIsFormat) {
    EXPECT_EQ(classify(ErrorCode::InvalidEncoding), ErrorClass::Format);
    EXPECT_EQ(classify(ErrorCode::RecordTooShort), ErrorClass::Format);
    EXPECT_EQ(classify(ErrorCode::CorruptDataFile), ErrorClass::Format);
}

TEST(ErrorTaxonomyTest, AuthenticationIsDistinct) {
    EXPECT_EQ(classify(ErrorCode::AuthenticationFailed), ErrorClass::Authentication);
    EXPECT_NE(classify(ErrorCode::AuthenticationFailed), classify(ErrorCode::InvalidEncoding));
}

TEST(ErrorTaxonomyTest, MissingServiceIsNotFound) {
    EXPECT_EQ(classify(ErrorCode::ServiceNotFound), ErrorClass::NotFound);
    EXPECT_EQ(classify(ErrorCode::Success), ErrorClass::None);
}

TEST(ErrorTaxonomyTest, EveryCodeHasAMessage) {
    EXPECT_EQ(error_to_string(ErrorCode::ServiceNotFound), "Service not found");
    EXPECT_NE(error_to_string(ErrorCode::AuthenticationFailed), "Unknown error");
    EXPECT_NE(error_to_string(ErrorCode::FileLockFailed), "Unknown error");
}

TEST(SecureBufferTest, ClearZeroesAndEmpties) {
    ByteBuffer source = {1, 2, 3, 4};
    SecureBuffer buffer{ByteSpan{source}};
    ASSERT_EQ(buffer.size(), 4u);

    buffer.clear();
    EXPECT_TRUE(buffer.empty());
}

TEST(SecureBufferTest, MoveTransfersContents) {
    ByteBuffer source = {9, 8, 7};
    SecureBuffer first{ByteSpan{source}};
    SecureBuffer second = std::move(first);

    ASSERT_EQ(second.size(), 3u);
    EXPECT_EQ(second.data()[0], 9);
}

TEST(SecureZeroTest, WipesString) {
    std::string secret = "hunter2";
    secure_zero(secret);
    EXPECT_EQ(secret, std::string(7, '\0'));
}

} // namespace strongbox::tests
