// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_console_sink.cpp
 * @brief Unit tests for the console sink line format
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>

#define SLUICE_LOG_COMPONENT "test_console_sink"
#include "sluice_console_sink.hpp"
#include "sluice_log_init.hpp"
#include "sluice_log_macros.hpp"

using namespace sluice::logging;

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    shutdown_logging();
  }

  void TearDown() override {
    shutdown_logging();
  }

  // Console only, captured in out_
  void initConsole(bool colors, bool clear_progress_line, severity_level level) {
    LoggingConfig config;
    config.console.colors = colors;
    config.console.clear_progress_line = clear_progress_line;
    config.console.level = level;
    config.console.stream = &out_;
    init_logging(config);
  }

  // Drains the async queue before reading
  std::string captured() {
    shutdown_logging();
    return out_.str();
  }

  std::ostringstream out_;
};

TEST(ConsoleSinkConfigTest, DefaultValues) {
  ConsoleSinkConfig config;
  EXPECT_TRUE(config.enabled);
  EXPECT_TRUE(config.colors);
  EXPECT_EQ(config.level, severity_level::info);
  EXPECT_FALSE(config.clear_progress_line);
  EXPECT_EQ(config.stream, nullptr);
}

TEST_F(ConsoleSinkTest, PlainLineCarriesLevelComponentAndContext) {
  initConsole(false, false, severity_level::info);
  {
    SLUICE_LOG_SCOPED_CONTEXT("bucket-1", "dir/object.bin");
    SLUICE_LOG_INFO("Part uploaded" << kv("part", 2));
  }

  EXPECT_EQ(
    captured(),
    "[INFO] [test_console_sink] Part uploaded part=2 | bucket=bucket-1 object=dir/object.bin\n"
  );
}

TEST_F(ConsoleSinkTest, ContextIsDroppedOutsideScope) {
  initConsole(false, false, severity_level::info);
  {
    SLUICE_LOG_SCOPED_CONTEXT("bucket-1", "obj");
  }
  SLUICE_LOG_WARN("after transfer");

  EXPECT_EQ(captured(), "[WARN] [test_console_sink] after transfer\n");
}

TEST_F(ConsoleSinkTest, ClearsProgressLineBeforeEachRecord) {
  initConsole(false, true, severity_level::info);
  SLUICE_LOG_WARN("Retrying part" << kv("part", 3));

  std::string text = captured();
  EXPECT_EQ(text.rfind("\r\033[K[WARN]", 0), 0u);
}

TEST_F(ConsoleSinkTest, ColorsWrapWarningsOnly) {
  initConsole(true, false, severity_level::info);
  SLUICE_LOG_INFO("plain");
  SLUICE_LOG_ERROR("failed");

  std::string text = captured();
  EXPECT_NE(text.find("[INFO] [test_console_sink] plain\n"), std::string::npos);
  EXPECT_NE(text.find("\033[1;31m[ERROR] [test_console_sink] failed\033[0m"), std::string::npos);
}

TEST_F(ConsoleSinkTest, LevelFilterDropsLowerSeverity) {
  initConsole(false, false, severity_level::warn);
  SLUICE_LOG_INFO("hidden");
  SLUICE_LOG_WARN("shown");

  std::string text = captured();
  EXPECT_EQ(text.find("hidden"), std::string::npos);
  EXPECT_NE(text.find("shown"), std::string::npos);
}

TEST_F(ConsoleSinkTest, DisabledConsoleWritesNothing) {
  LoggingConfig config;
  config.console.enabled = false;
  config.console.stream = &out_;
  init_logging(config);
  SLUICE_LOG_ERROR("nowhere");

  EXPECT_TRUE(captured().empty());
}
