// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_APP_CLI_OPTIONS_HPP
#define DIRPUSH_APP_CLI_OPTIONS_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "uploader_config.hpp"

namespace dirpush {
namespace app {

/**
 * Values given on the command line. Unset optionals fall back to the config
 * file or built-in defaults.
 */
struct CliOptions {
  bool show_help = false;
  std::string config_file;

  std::optional<std::string> directory;
  std::optional<std::string> base_url;
  std::optional<std::string> prefix;
  std::optional<std::string> url_style;
  std::optional<std::string> log_dir;
  std::optional<int> concurrency;
  std::optional<uint64_t> chunk_size;

  // Switches can only turn behavior on
  bool dry_run = false;
  bool no_recursive = false;
  bool verbose = false;
};

/**
 * Parse argv. A leading "upload" word is accepted and ignored.
 *
 * @param error Set when parsing fails
 * @return false on unknown options, missing or malformed values
 */
bool parse_command_line(
  int argc, const char* const argv[], CliOptions& options, std::string& error
);

/**
 * Overlay command-line values onto a config loaded from file
 */
void apply_cli_overrides(const CliOptions& options, UploaderConfig& config);

void print_usage(std::ostream& os, const char* program_name);

}  // namespace app
}  // namespace dirpush

#endif  // DIRPUSH_APP_CLI_OPTIONS_HPP
