// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_sink.cpp
 * @brief Unit tests for file sink creation, JSON escaping and record formatting
 */

#include <gtest/gtest.h>

#include <boost/log/core.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "dirpush_file_sink.hpp"
#include "dirpush_log_init.hpp"
#include "dirpush_log_macros.hpp"

using namespace dirpush::logging;
namespace fs = std::filesystem;

// ============================================================================
// FileSinkConfig / escape_json
// ============================================================================

TEST(FileSinkConfigTest, DefaultValues) {
  FileSinkConfig config;
  EXPECT_EQ(config.directory, "/var/log/dirpush");
  EXPECT_EQ(config.file_pattern, "dirpush_%Y%m%d_%H%M%S.log");
  EXPECT_EQ(config.rotation_size_mb, 50u);
  EXPECT_EQ(config.max_files, 10);
  EXPECT_FALSE(config.format_json);
}

TEST(EscapeJsonTest, PlainTextUnchanged) {
  EXPECT_EQ(escape_json("Uploading data/a.txt"), "Uploading data/a.txt");
}

TEST(EscapeJsonTest, QuotesAndBackslashes) {
  EXPECT_EQ(escape_json("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape_json("C:\\tmp"), "C:\\\\tmp");
}

TEST(EscapeJsonTest, ControlCharacters) {
  EXPECT_EQ(escape_json("a\nb\tc\r"), "a\\nb\\tc\\r");
  EXPECT_EQ(escape_json(std::string("x\x01y", 3)), "x\\u0001y");
}

// ============================================================================
// Sink pipeline
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("dirpush_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);

    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    if (is_logging_initialized()) {
      shutdown_logging();
    }

    std::error_code ec;
    fs::remove_all(test_dir_, ec);
  }

  // Concatenated contents of every log file written to the directory
  std::string readLogs(const fs::path& dir) const {
    std::string all;
    for (const auto& entry : fs::directory_iterator(dir)) {
      if (!entry.is_regular_file()) {
        continue;
      }
      std::ifstream in(entry.path());
      std::stringstream ss;
      ss << in.rdbuf();
      all += ss.str();
    }
    return all;
  }

  void attach(const boost::shared_ptr<async_file_sink_t>& sink) {
    boost::log::core::get()->add_sink(sink);
  }

  // Detach and drain a sink so its records are on disk
  void finish(const boost::shared_ptr<async_file_sink_t>& sink) {
    boost::log::core::get()->remove_sink(sink);
    sink->stop();
    sink->flush();
    sink->locked_backend()->flush();
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, TextFormatCarriesTransferContext) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "text_%N.log";

  auto sink = create_file_sink(config, severity_level::debug);
  ASSERT_NE(sink, nullptr);
  attach(sink);

  {
    DIRPUSH_LOG_SCOPED_CONTEXT(3, std::string("data/a.txt"));
    DIRPUSH_LOG_INFO("text record with context");
  }
  DIRPUSH_LOG_WARN("text record without context");

  finish(sink);
  std::string logs = readLogs(test_dir_);

  EXPECT_NE(logs.find("text record with context"), std::string::npos);
  EXPECT_NE(logs.find("worker=3"), std::string::npos);
  EXPECT_NE(logs.find("key=data/a.txt"), std::string::npos);
  EXPECT_NE(logs.find("text record without context"), std::string::npos);
  EXPECT_NE(logs.find("WARN"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatIsOneObjectPerLine) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "json_%N.log";
  config.format_json = true;

  auto sink = create_file_sink(config, severity_level::debug);
  attach(sink);

  {
    DIRPUSH_LOG_SCOPED_CONTEXT(1, std::string("dir/\"quoted\".bin"));
    DIRPUSH_LOG_ERROR("Part 2/3 failed");
  }

  finish(sink);
  std::string logs = readLogs(test_dir_);

  EXPECT_NE(logs.find("\"level\":\"ERROR\""), std::string::npos);
  EXPECT_NE(logs.find("Part 2/3 failed"), std::string::npos);
  EXPECT_NE(logs.find("\"worker\":1"), std::string::npos);
  EXPECT_NE(logs.find("\"object_key\":\"dir/\\\"quoted\\\".bin\""), std::string::npos);
}

TEST_F(FileSinkTest, LevelFilterDropsLowerRecords) {
  FileSinkConfig config;
  config.directory = test_dir_.string();
  config.file_pattern = "filtered_%N.log";

  auto sink = create_file_sink(config, severity_level::warn);
  attach(sink);

  DIRPUSH_LOG_INFO("should be filtered");
  DIRPUSH_LOG_ERROR("should be kept");

  finish(sink);
  std::string logs = readLogs(test_dir_);

  EXPECT_EQ(logs.find("should be filtered"), std::string::npos);
  EXPECT_NE(logs.find("should be kept"), std::string::npos);
}

TEST_F(FileSinkTest, CreatesMissingDirectory) {
  fs::path nested = test_dir_ / "a" / "b";
  FileSinkConfig config;
  config.directory = nested.string();

  auto sink = create_file_sink(config);
  ASSERT_NE(sink, nullptr);
  EXPECT_TRUE(fs::is_directory(nested));
}

TEST_F(FileSinkTest, InitLoggingWithFileSink) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "init_%N.log";

  init_logging(config);
  DIRPUSH_LOG_INFO("through init_logging");
  shutdown_logging();

  EXPECT_NE(readLogs(test_dir_).find("through init_logging"), std::string::npos);
}
