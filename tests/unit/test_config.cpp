/**
 * @file test_config.cpp
 * @brief Unit tests for server configuration
 */

#include <gtest/gtest.h>
#include <klip/config.h>

#include <cstdlib>

using namespace klip;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear_env(); }
  void TearDown() override { clear_env(); }

  static void clear_env() {
    for (const char *name :
         {ENV_MAX_TEXT_BYTES, ENV_TIMEOUT_SECS, ENV_MAX_MESSAGE_BYTES,
          ENV_ENABLE_GET, ENV_CLIPBOARD_BACKEND, ENV_LOG}) {
      unsetenv(name);
    }
  }
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(ConfigTest, Defaults) {
  ServerConfig config;

  EXPECT_EQ(config.max_text_bytes, 10485760u);
  EXPECT_EQ(config.operation_timeout, std::chrono::seconds(5));
  EXPECT_EQ(config.max_message_bytes, DEFAULT_MAX_MESSAGE_BYTES);
  EXPECT_TRUE(config.enable_get_tool);
  EXPECT_EQ(config.backend, BackendPreference::Auto);
  EXPECT_EQ(config.log_level, LogLevel::Info);
  EXPECT_TRUE(config.validate().is_ok());
}

TEST_F(ConfigTest, LoadDefaultsResets) {
  ServerConfig config;
  config.max_text_bytes = 1;
  config.enable_get_tool = false;

  config.load_defaults();
  EXPECT_EQ(config.max_text_bytes, DEFAULT_MAX_TEXT_BYTES);
  EXPECT_TRUE(config.enable_get_tool);
}

TEST_F(ConfigTest, FromEmptyEnvironment) {
  auto config = ServerConfig::from_env();
  ASSERT_TRUE(config.is_ok());
  EXPECT_EQ(config.value().max_text_bytes, DEFAULT_MAX_TEXT_BYTES);
  EXPECT_EQ(config.value().operation_timeout, DEFAULT_OPERATION_TIMEOUT);
}

// ============================================================================
// Environment Overrides
// ============================================================================

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv(ENV_MAX_TEXT_BYTES, "1024", 1);
  setenv(ENV_TIMEOUT_SECS, "2", 1);
  setenv(ENV_ENABLE_GET, "off", 1);
  setenv(ENV_CLIPBOARD_BACKEND, "wayland", 1);
  setenv(ENV_LOG, "debug", 1);

  auto config = ServerConfig::from_env();
  ASSERT_TRUE(config.is_ok()) << config.error().to_string();
  EXPECT_EQ(config.value().max_text_bytes, 1024u);
  EXPECT_EQ(config.value().operation_timeout, std::chrono::seconds(2));
  EXPECT_FALSE(config.value().enable_get_tool);
  EXPECT_EQ(config.value().backend, BackendPreference::Wayland);
  EXPECT_EQ(config.value().log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, EmptyValueIsIgnored) {
  setenv(ENV_MAX_TEXT_BYTES, "", 1);

  auto config = ServerConfig::from_env();
  ASSERT_TRUE(config.is_ok());
  EXPECT_EQ(config.value().max_text_bytes, DEFAULT_MAX_TEXT_BYTES);
}

TEST_F(ConfigTest, RejectsNonNumericSize) {
  setenv(ENV_MAX_TEXT_BYTES, "ten", 1);

  auto config = ServerConfig::from_env();
  ASSERT_TRUE(config.is_error());
  EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
  EXPECT_NE(config.error().message.find(ENV_MAX_TEXT_BYTES), std::string::npos);
}

TEST_F(ConfigTest, RejectsNegativeTimeout) {
  setenv(ENV_TIMEOUT_SECS, "-1", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());
}

TEST_F(ConfigTest, RejectsZeroTimeout) {
  setenv(ENV_TIMEOUT_SECS, "0", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());
}

TEST_F(ConfigTest, TimeoutCap) {
  setenv(ENV_TIMEOUT_SECS, "3600", 1);
  auto at_cap = ServerConfig::from_env();
  ASSERT_TRUE(at_cap.is_ok());
  EXPECT_EQ(at_cap.value().operation_timeout, MAX_OPERATION_TIMEOUT);

  setenv(ENV_TIMEOUT_SECS, "3601", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());

  // Would overflow milliseconds if converted
  setenv(ENV_TIMEOUT_SECS, "18446744073709551615", 1);
  auto huge = ServerConfig::from_env();
  ASSERT_TRUE(huge.is_error());
  EXPECT_EQ(huge.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, RejectsUnknownBackend) {
  setenv(ENV_CLIPBOARD_BACKEND, "quartz", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());
}

TEST_F(ConfigTest, RejectsBadBoolean) {
  setenv(ENV_ENABLE_GET, "maybe", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());
}

TEST_F(ConfigTest, RejectsBadLogLevel) {
  setenv(ENV_LOG, "verbose", 1);
  EXPECT_TRUE(ServerConfig::from_env().is_error());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, ValidateRejectsZeroTextLimit) {
  ServerConfig config;
  config.max_text_bytes = 0;
  EXPECT_TRUE(config.validate().is_error());
}

TEST_F(ConfigTest, ValidateRejectsTimeoutAboveCap) {
  ServerConfig config;
  config.operation_timeout = MAX_OPERATION_TIMEOUT + std::chrono::seconds(1);
  EXPECT_TRUE(config.validate().is_error());
}

TEST_F(ConfigTest, ValidateRequiresRoomForEnvelope) {
  ServerConfig config;
  config.max_message_bytes = config.max_text_bytes;
  EXPECT_TRUE(config.validate().is_error());
}

TEST_F(ConfigTest, BackendPreferenceNames) {
  EXPECT_STREQ(backend_preference_name(BackendPreference::Auto), "auto");
  EXPECT_STREQ(backend_preference_name(BackendPreference::Wayland), "wayland");
  EXPECT_STREQ(backend_preference_name(BackendPreference::X11), "x11");
}

TEST_F(ConfigTest, ParseLogLevel) {
  EXPECT_EQ(parse_log_level("warn"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
  EXPECT_FALSE(parse_log_level("loud").has_value());
}
