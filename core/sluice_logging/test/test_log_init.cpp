// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for logging initialization, severity parsing and env overrides
 */

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>

#define SLUICE_LOG_COMPONENT "test_log_init"
#include "sluice_log_init.hpp"
#include "sluice_log_macros.hpp"

using namespace sluice::logging;

// ============================================================================
// Severity Level Tests
// ============================================================================

TEST(SeverityLevelTest, ParseValidLevels) {
  EXPECT_EQ(*parse_severity_level("debug"), severity_level::debug);
  EXPECT_EQ(*parse_severity_level("info"), severity_level::info);
  EXPECT_EQ(*parse_severity_level("warn"), severity_level::warn);
  EXPECT_EQ(*parse_severity_level("warning"), severity_level::warn);
  EXPECT_EQ(*parse_severity_level("error"), severity_level::error);
  EXPECT_EQ(*parse_severity_level("fatal"), severity_level::fatal);
}

TEST(SeverityLevelTest, ParseCaseInsensitive) {
  EXPECT_EQ(*parse_severity_level("DEBUG"), severity_level::debug);
  EXPECT_EQ(*parse_severity_level("Info"), severity_level::info);
  EXPECT_EQ(*parse_severity_level("WARNING"), severity_level::warn);
}

TEST(SeverityLevelTest, ParseInvalidLevels) {
  EXPECT_FALSE(parse_severity_level("verbose").has_value());
  EXPECT_FALSE(parse_severity_level("").has_value());
  EXPECT_FALSE(parse_severity_level("1").has_value());
  EXPECT_FALSE(parse_severity_level(" info").has_value());
}

TEST(SeverityLevelTest, OutputStream) {
  std::ostringstream oss;
  oss << severity_level::warn;
  EXPECT_EQ(oss.str(), "WARN");

  oss.str("");
  oss << static_cast<severity_level>(100);
  EXPECT_EQ(oss.str(), "100");
}

// ============================================================================
// Helpers
// ============================================================================

TEST(LogHelpersTest, KvQuotesStrings) {
  EXPECT_EQ(kv("part", 3), " part=3");
  EXPECT_EQ(kv("bucket", std::string("b1")), " bucket=\"b1\"");
  EXPECT_EQ(kv("object", "a.bin"), " object=\"a.bin\"");
}

TEST(LogHelpersTest, RedactUrlDropsQuery) {
  EXPECT_EQ(
    redact_url("https://s3.example.com/bucket/part1?X-Amz-Signature=abc&X-Amz-Credential=k"),
    "https://s3.example.com/bucket/part1?<redacted>"
  );
  EXPECT_EQ(redact_url("https://api.example.com/buckets"), "https://api.example.com/buckets");
}

// ============================================================================
// Environment Override Tests
// ============================================================================

class LoggingConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    clearEnv();
  }

  void TearDown() override {
    clearEnv();
  }

  static void clearEnv() {
    unsetenv("SLUICE_LOG_LEVEL");
    unsetenv("SLUICE_LOG_CONSOLE_LEVEL");
    unsetenv("SLUICE_LOG_CONSOLE_ENABLED");
    unsetenv("SLUICE_LOG_FILE_LEVEL");
    unsetenv("SLUICE_LOG_FILE_ENABLED");
    unsetenv("SLUICE_LOG_FILE_DIR");
    unsetenv("SLUICE_LOG_FORMAT");
    unsetenv("NO_COLOR");
  }
};

TEST_F(LoggingConfigTest, DefaultConfigValues) {
  LoggingConfig config;

  EXPECT_TRUE(config.console.enabled);
  EXPECT_TRUE(config.console.colors);
  EXPECT_EQ(config.console.level, severity_level::info);
  EXPECT_FALSE(config.file.enabled);
  EXPECT_EQ(config.file.level, severity_level::debug);
  EXPECT_FALSE(config.file.format_json);
}

TEST_F(LoggingConfigTest, GlobalLevelOverridesBothSinks) {
  setenv("SLUICE_LOG_LEVEL", "warn", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console.level, severity_level::warn);
  EXPECT_EQ(config.file.level, severity_level::warn);
}

TEST_F(LoggingConfigTest, SinkSpecificLevelWinsOverGlobal) {
  setenv("SLUICE_LOG_LEVEL", "warn", 1);
  setenv("SLUICE_LOG_CONSOLE_LEVEL", "debug", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console.level, severity_level::debug);
  EXPECT_EQ(config.file.level, severity_level::warn);
}

TEST_F(LoggingConfigTest, InvalidLevelIsIgnored) {
  setenv("SLUICE_LOG_LEVEL", "loud", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_EQ(config.console.level, severity_level::info);
}

TEST_F(LoggingConfigTest, FileSettings) {
  setenv("SLUICE_LOG_FILE_ENABLED", "yes", 1);
  setenv("SLUICE_LOG_FILE_DIR", "/tmp/sluice_env_logs", 1);
  setenv("SLUICE_LOG_FORMAT", "JSON", 1);
  setenv("SLUICE_LOG_CONSOLE_ENABLED", "off", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_TRUE(config.file.enabled);
  EXPECT_EQ(config.file.directory, "/tmp/sluice_env_logs");
  EXPECT_TRUE(config.file.format_json);
  EXPECT_FALSE(config.console.enabled);
}

TEST_F(LoggingConfigTest, UnparsableBoolKeepsSetting) {
  setenv("SLUICE_LOG_CONSOLE_ENABLED", "maybe", 1);
  setenv("SLUICE_LOG_FILE_ENABLED", "maybe", 1);

  LoggingConfig config;
  config.file.enabled = true;
  apply_env_overrides(config);

  EXPECT_TRUE(config.console.enabled);
  EXPECT_TRUE(config.file.enabled);
}

TEST_F(LoggingConfigTest, NoColorDisablesConsoleColors) {
  setenv("NO_COLOR", "1", 1);

  LoggingConfig config;
  apply_env_overrides(config);

  EXPECT_FALSE(config.console.colors);
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

class LoggingLifecycleTest : public ::testing::Test {
protected:
  void SetUp() override {
    shutdown_logging();
  }

  void TearDown() override {
    shutdown_logging();
  }

  LoggingConfig captureConfig(std::ostringstream& out) {
    LoggingConfig config;
    config.console.colors = false;
    config.console.stream = &out;
    return config;
  }
};

TEST_F(LoggingLifecycleTest, InitAndShutdown) {
  EXPECT_FALSE(is_logging_initialized());

  std::ostringstream out;
  init_logging(captureConfig(out));
  EXPECT_TRUE(is_logging_initialized());

  SLUICE_LOG_INFO("lifecycle test" << kv("step", 1));

  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
  EXPECT_NE(out.str().find("lifecycle test step=1"), std::string::npos);
}

TEST_F(LoggingLifecycleTest, ReinitReplacesSinks) {
  std::ostringstream first;
  std::ostringstream second;

  init_logging(captureConfig(first));
  SLUICE_LOG_INFO("before config file");

  init_logging(captureConfig(second));
  SLUICE_LOG_INFO("after config file");
  shutdown_logging();

  // Records logged before the switch are drained into the old sink
  EXPECT_NE(first.str().find("before config file"), std::string::npos);
  EXPECT_EQ(first.str().find("after config file"), std::string::npos);
  EXPECT_EQ(second.str().find("before config file"), std::string::npos);
  EXPECT_NE(second.str().find("after config file"), std::string::npos);
}

TEST_F(LoggingLifecycleTest, ShutdownWithoutInitIsSafe) {
  shutdown_logging();
  shutdown_logging();
  EXPECT_FALSE(is_logging_initialized());
}

TEST_F(LoggingLifecycleTest, ThrottleKeepsFirstRecordPerInterval) {
  std::ostringstream out;
  init_logging(captureConfig(out));
  for (int i = 0; i < 10; ++i) {
    SLUICE_LOG_INFO_THROTTLE(60.0, "throttled" << kv("i", i));
  }
  shutdown_logging();

  std::string text = out.str();
  EXPECT_NE(text.find("throttled i=0"), std::string::npos);
  EXPECT_EQ(text.find("throttled i=1"), std::string::npos);
}
