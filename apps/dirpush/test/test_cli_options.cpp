// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for command-line parsing and override merging
 */

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cli_options.hpp"

using namespace dirpush::app;

class CliOptionsTest : public ::testing::Test {
protected:
  bool parse(std::vector<const char*> args) {
    args.insert(args.begin(), "dirpush");
    options_ = CliOptions();
    error_.clear();
    return parse_command_line(static_cast<int>(args.size()), args.data(), options_, error_);
  }

  CliOptions options_;
  std::string error_;
};

TEST_F(CliOptionsTest, DirectoryAndBaseUrl) {
  ASSERT_TRUE(parse({"./data", "--base-url", "https://host/b/o/"}));
  EXPECT_EQ(options_.directory.value_or(""), "./data");
  EXPECT_EQ(options_.base_url.value_or(""), "https://host/b/o/");
  EXPECT_FALSE(options_.concurrency.has_value());
  EXPECT_FALSE(options_.dry_run);
}

TEST_F(CliOptionsTest, LeadingUploadWordIsIgnored) {
  ASSERT_TRUE(parse({"upload", "./data", "--base-url", "https://host/b"}));
  EXPECT_EQ(options_.directory.value_or(""), "./data");
}

TEST_F(CliOptionsTest, AllOptions) {
  ASSERT_TRUE(parse(
    {"./data", "--base-url", "https://host/b", "--prefix", "backups", "--dry-run",
     "--no-recursive", "--concurrency", "8", "--chunk-size", "1048576", "--verbose",
     "--url-style", "plain", "--config", "cfg.yaml", "--log-dir", "/tmp/logs"}
  ));
  EXPECT_EQ(options_.prefix.value_or(""), "backups");
  EXPECT_TRUE(options_.dry_run);
  EXPECT_TRUE(options_.no_recursive);
  EXPECT_EQ(options_.concurrency.value_or(0), 8);
  EXPECT_EQ(options_.chunk_size.value_or(0), 1048576u);
  EXPECT_TRUE(options_.verbose);
  EXPECT_EQ(options_.url_style.value_or(""), "plain");
  EXPECT_EQ(options_.config_file, "cfg.yaml");
  EXPECT_EQ(options_.log_dir.value_or(""), "/tmp/logs");
}

TEST_F(CliOptionsTest, Aliases) {
  ASSERT_TRUE(parse({"d", "--par-url", "https://host/b", "--max-workers", "3"}));
  EXPECT_EQ(options_.base_url.value_or(""), "https://host/b");
  EXPECT_EQ(options_.concurrency.value_or(0), 3);
}

TEST_F(CliOptionsTest, EqualsSyntax) {
  ASSERT_TRUE(parse({"d", "--base-url=https://host/b?sig=x", "--concurrency=2"}));
  EXPECT_EQ(options_.base_url.value_or(""), "https://host/b?sig=x");
  EXPECT_EQ(options_.concurrency.value_or(0), 2);
}

TEST_F(CliOptionsTest, OptionsMayPrecedeDirectory) {
  ASSERT_TRUE(parse({"--dry-run", "--base-url", "https://host/b", "./data"}));
  EXPECT_EQ(options_.directory.value_or(""), "./data");
  EXPECT_TRUE(options_.dry_run);
}

TEST_F(CliOptionsTest, Help) {
  ASSERT_TRUE(parse({"--help"}));
  EXPECT_TRUE(options_.show_help);
  ASSERT_TRUE(parse({"-h"}));
  EXPECT_TRUE(options_.show_help);
}

TEST_F(CliOptionsTest, MissingValue) {
  EXPECT_FALSE(parse({"d", "--base-url"}));
  EXPECT_EQ(error_, "--base-url requires a value");
}

TEST_F(CliOptionsTest, NonNumericConcurrency) {
  EXPECT_FALSE(parse({"d", "--concurrency", "many"}));
  EXPECT_NE(error_.find("expects an integer"), std::string::npos);
}

TEST_F(CliOptionsTest, NegativeChunkSize) {
  EXPECT_FALSE(parse({"d", "--chunk-size", "-5"}));
}

TEST_F(CliOptionsTest, UnknownOption) {
  EXPECT_FALSE(parse({"d", "--turbo"}));
  EXPECT_EQ(error_, "Unknown argument: --turbo");
}

TEST_F(CliOptionsTest, SecondPositionalIsRejected) {
  EXPECT_FALSE(parse({"a", "b"}));
}

TEST_F(CliOptionsTest, OverridesReplaceConfigValues) {
  UploaderConfig config;
  config.base_url = "https://from-file/b";
  config.prefix = "file-prefix";
  config.concurrency = 2;
  config.recursive = true;

  ASSERT_TRUE(parse({"./data", "--prefix", "cli-prefix", "--no-recursive", "--concurrency", "9"}));
  apply_cli_overrides(options_, config);

  EXPECT_EQ(config.directory, "./data");
  EXPECT_EQ(config.base_url, "https://from-file/b");
  EXPECT_EQ(config.prefix, "cli-prefix");
  EXPECT_EQ(config.concurrency, 9);
  EXPECT_FALSE(config.recursive);
  EXPECT_FALSE(config.dry_run);
}

TEST_F(CliOptionsTest, UsageMentionsEveryOption) {
  std::ostringstream os;
  print_usage(os, "dirpush");
  std::string usage = os.str();
  for (const char* option :
       {"--base-url", "--prefix", "--dry-run", "--no-recursive", "--concurrency", "--chunk-size",
        "--verbose", "--config", "--url-style", "--log-dir"}) {
    EXPECT_NE(usage.find(option), std::string::npos) << option;
  }
}
