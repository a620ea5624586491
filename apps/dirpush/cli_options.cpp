// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cli_options.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace dirpush {
namespace app {

namespace {

bool parse_int(const std::string& text, int& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  long parsed = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || parsed < INT32_MIN || parsed > INT32_MAX) {
    return false;
  }
  value = static_cast<int>(parsed);
  return true;
}

bool parse_uint64(const std::string& text, uint64_t& value) {
  if (text.empty() || text[0] == '-') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || *end != '\0') {
    return false;
  }
  value = static_cast<uint64_t>(parsed);
  return true;
}

// Matches "--name value" and "--name=value"
bool match_value_option(
  int argc, const char* const argv[], int& i, const char* name, std::string& value,
  std::string& error, bool& matched
) {
  const char* arg = argv[i];
  size_t name_len = std::strlen(name);
  matched = false;

  if (std::strcmp(arg, name) == 0) {
    matched = true;
    if (i + 1 >= argc) {
      error = std::string(name) + " requires a value";
      return false;
    }
    value = argv[++i];
    return true;
  }

  if (std::strncmp(arg, name, name_len) == 0 && arg[name_len] == '=') {
    matched = true;
    value = arg + name_len + 1;
    return true;
  }
  return true;
}

}  // namespace

bool parse_command_line(
  int argc, const char* const argv[], CliOptions& options, std::string& error
) {
  int first = 1;
  if (argc > 1 && std::strcmp(argv[1], "upload") == 0) {
    first = 2;
  }

  for (int i = first; i < argc; ++i) {
    const char* arg = argv[i];
    std::string value;
    bool matched = false;

    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      options.show_help = true;
      continue;
    }
    if (std::strcmp(arg, "--dry-run") == 0) {
      options.dry_run = true;
      continue;
    }
    if (std::strcmp(arg, "--no-recursive") == 0) {
      options.no_recursive = true;
      continue;
    }
    if (std::strcmp(arg, "--verbose") == 0 || std::strcmp(arg, "-v") == 0) {
      options.verbose = true;
      continue;
    }

    for (const char* name : {"--base-url", "--par-url"}) {
      if (!match_value_option(argc, argv, i, name, value, error, matched)) {
        return false;
      }
      if (matched) {
        options.base_url = value;
        break;
      }
    }
    if (matched) {
      continue;
    }

    for (const char* name : {"--concurrency", "--max-workers"}) {
      if (!match_value_option(argc, argv, i, name, value, error, matched)) {
        return false;
      }
      if (matched) {
        int concurrency = 0;
        if (!parse_int(value, concurrency)) {
          error = std::string(name) + " expects an integer, got '" + value + "'";
          return false;
        }
        options.concurrency = concurrency;
        break;
      }
    }
    if (matched) {
      continue;
    }

    if (!match_value_option(argc, argv, i, "--chunk-size", value, error, matched)) {
      return false;
    }
    if (matched) {
      uint64_t chunk_size = 0;
      if (!parse_uint64(value, chunk_size)) {
        error = "--chunk-size expects a byte count, got '" + value + "'";
        return false;
      }
      options.chunk_size = chunk_size;
      continue;
    }

    if (!match_value_option(argc, argv, i, "--prefix", value, error, matched)) {
      return false;
    }
    if (matched) {
      options.prefix = value;
      continue;
    }

    if (!match_value_option(argc, argv, i, "--url-style", value, error, matched)) {
      return false;
    }
    if (matched) {
      options.url_style = value;
      continue;
    }

    if (!match_value_option(argc, argv, i, "--config", value, error, matched)) {
      return false;
    }
    if (matched) {
      options.config_file = value;
      continue;
    }

    if (!match_value_option(argc, argv, i, "--log-dir", value, error, matched)) {
      return false;
    }
    if (matched) {
      options.log_dir = value;
      continue;
    }

    if (arg[0] == '-' && arg[1] != '\0') {
      error = std::string("Unknown argument: ") + arg;
      return false;
    }

    if (options.directory) {
      error = std::string("Unexpected extra argument: ") + arg;
      return false;
    }
    options.directory = arg;
  }

  return true;
}

void apply_cli_overrides(const CliOptions& options, UploaderConfig& config) {
  if (options.directory) {
    config.directory = *options.directory;
  }
  if (options.base_url) {
    config.base_url = *options.base_url;
  }
  if (options.prefix) {
    config.prefix = *options.prefix;
  }
  if (options.url_style) {
    config.url_style = *options.url_style;
  }
  if (options.log_dir) {
    config.log_directory = *options.log_dir;
  }
  if (options.concurrency) {
    config.concurrency = *options.concurrency;
  }
  if (options.chunk_size) {
    config.chunk_size = *options.chunk_size;
  }
  if (options.dry_run) {
    config.dry_run = true;
  }
  if (options.no_recursive) {
    config.recursive = false;
  }
  if (options.verbose) {
    config.verbose = true;
  }
}

void print_usage(std::ostream& os, const char* program_name) {
  os << "Usage: " << program_name << " [upload] <directory> --base-url URL [OPTIONS]\n"
     << "\n"
     << "dirpush - upload a local directory tree through a pre-authenticated URL\n"
     << "\n"
     << "Options:\n"
     << "  --base-url URL        Pre-authenticated bucket URL (alias: --par-url)\n"
     << "  --prefix PREFIX       Prefix prepended to every object key\n"
     << "  --dry-run             List what would be uploaded without transferring\n"
     << "  --no-recursive        Only upload files directly inside <directory>\n"
     << "  --concurrency N       Parallel file transfers (default: 5, alias: --max-workers)\n"
     << "  --chunk-size BYTES    Split files larger than this into parts (default: 10485760)\n"
     << "  --url-style STYLE     Object URL layout: marker (base/o/key) or plain (base/key)\n"
     << "  --config PATH         YAML configuration file\n"
     << "  --log-dir DIR         Also write log files to DIR\n"
     << "  --verbose, -v         Debug logging and per-part progress\n"
     << "  --help, -h            Show this help message\n"
     << "\n"
     << "Command-line options override config file values.\n"
     << "\n"
     << "Exit status:\n"
     << "  0  every file uploaded (or dry run, or nothing to upload)\n"
     << "  1  at least one file failed\n"
     << "  2  invalid arguments or configuration\n"
     << "\n"
     << "Examples:\n"
     << "  " << program_name << " ./data --base-url https://host/p/TOKEN/n/ns/b/bucket/o/\n"
     << "  " << program_name << " ./data --base-url URL --prefix backups --concurrency 8\n"
     << "  " << program_name << " --config dirpush.yaml ./data --dry-run\n";
}

}  // namespace app
}  // namespace dirpush
