/**
 * @file test_validator.cpp
 * @brief Unit tests for text validation
 */

#include <gtest/gtest.h>
#include <klip/validator.h>

#include <string>

using namespace klip;

// ============================================================================
// Size Limit
// ============================================================================

TEST(ValidatorTest, AcceptsEmptyText) {
  EXPECT_TRUE(validate_text("").is_ok());
}

TEST(ValidatorTest, AcceptsControlCharactersAndNewlines) {
  EXPECT_TRUE(validate_text("line one\nline two\r\n\ttabbed\x01").is_ok());
}

TEST(ValidatorTest, AcceptsExactlyMaximum) {
  std::string text(DEFAULT_MAX_TEXT_BYTES, 'a');
  EXPECT_TRUE(validate_text(text).is_ok());
}

TEST(ValidatorTest, RejectsOneByteOverMaximum) {
  std::string text(DEFAULT_MAX_TEXT_BYTES + 1, 'a');

  auto result = validate_text(text);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::TextTooLarge);
  EXPECT_NE(result.error().message.find("10485761"), std::string::npos);
  EXPECT_NE(result.error().message.find("10485760"), std::string::npos);
}

TEST(ValidatorTest, CustomLimit) {
  EXPECT_TRUE(validate_text("abcd", 4).is_ok());

  auto result = validate_text("abcde", 4);
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().message,
            "Text too large: 5 bytes exceeds the maximum of 4 bytes");
}

TEST(ValidatorTest, SizeIsMeasuredInBytes) {
  // Two scalar values, six bytes
  std::string text = "世界";
  EXPECT_TRUE(validate_text(text, 6).is_ok());
  EXPECT_TRUE(validate_text(text, 5).is_error());
}

// ============================================================================
// UTF-8
// ============================================================================

TEST(ValidatorTest, RejectsInvalidUtf8) {
  auto result = validate_text(std::string("abc\xff", 4));
  ASSERT_TRUE(result.is_error());
  EXPECT_EQ(result.error().code, ErrorCode::InvalidUtf8);
}

TEST(ValidatorTest, Utf8Acceptance) {
  EXPECT_TRUE(is_valid_utf8(""));
  EXPECT_TRUE(is_valid_utf8("plain ascii"));
  EXPECT_TRUE(is_valid_utf8("Hello 世界 🌍"));
  EXPECT_TRUE(is_valid_utf8("\xf4\x8f\xbf\xbf")); // U+10FFFF
}

TEST(ValidatorTest, Utf8Rejection) {
  EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));         // overlong '/'
  EXPECT_FALSE(is_valid_utf8("\xe0\x80\xaf"));     // overlong '/'
  EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));     // surrogate U+D800
  EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80")); // above U+10FFFF
  EXPECT_FALSE(is_valid_utf8("\xe4\xb8"));         // truncated
  EXPECT_FALSE(is_valid_utf8("\x80"));             // stray continuation
}

// ============================================================================
// Scalar Counting
// ============================================================================

TEST(ValidatorTest, CountsScalarValuesNotBytes) {
  EXPECT_EQ(count_scalar_values(""), 0u);
  EXPECT_EQ(count_scalar_values("Hello, World!"), 13u);
  EXPECT_EQ(count_scalar_values("Hello 世界 🌍"), 10u);
  EXPECT_EQ(std::string("Hello 世界 🌍").size(), 17u);
}
