// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_console_sink.cpp
 * @brief Unit tests for console sink creation and formatting
 */

#include <gtest/gtest.h>

#include <boost/log/core.hpp>

#include <cstring>
#include <string>

#include "dirpush_console_sink.hpp"
#include "dirpush_log_init.hpp"
#include "dirpush_log_macros.hpp"

using namespace dirpush::logging;

class ConsoleSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }
};

TEST_F(ConsoleSinkTest, CreateWithDefaultParams) {
  auto sink = create_console_sink();
  ASSERT_NE(sink, nullptr);
}

TEST_F(ConsoleSinkTest, CreateWithoutColors) {
  auto sink = create_console_sink(severity_level::warn, false);
  ASSERT_NE(sink, nullptr);
}

TEST_F(ConsoleSinkTest, ColorsDifferPerLevel) {
  EXPECT_STRNE(get_color(severity_level::info), get_color(severity_level::error));
  EXPECT_STRNE(get_color(severity_level::warn), get_color(severity_level::debug));
  EXPECT_EQ(std::strncmp(get_color(severity_level::error), "\033[", 2), 0);
}

TEST_F(ConsoleSinkTest, LogAllLevelsWithContext) {
  auto colored = create_console_sink(severity_level::debug, true);
  auto plain = create_console_sink(severity_level::debug, false);
  auto core = boost::log::core::get();
  core->add_sink(colored);
  core->add_sink(plain);

  {
    DIRPUSH_LOG_SCOPED_CONTEXT(2, std::string("data/report.csv"));
    DIRPUSH_LOG_DEBUG("debug with context");
    DIRPUSH_LOG_INFO("info with context" << kv("bytes", 1024));
  }
  DIRPUSH_LOG_WARN("warn without context");
  DIRPUSH_LOG_ERROR("error without context");

  EXPECT_NO_THROW(colored->flush());
  EXPECT_NO_THROW(plain->flush());

  core->remove_sink(colored);
  core->remove_sink(plain);
  colored->stop();
  plain->stop();
}
