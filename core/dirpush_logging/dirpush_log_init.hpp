// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_LOG_INIT_HPP
#define DIRPUSH_LOG_INIT_HPP

#include <optional>
#include <string>

#include "dirpush_console_sink.hpp"
#include "dirpush_file_sink.hpp"
#include "dirpush_log_severity.hpp"

namespace dirpush {
namespace logging {

/**
 * Sinks used by one upload run.
 */
struct LoggingConfig {
  // Console sink
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  // File sink (off unless a log directory is given)
  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;

  /**
   * Logging for an upload run: debug on the console when verbose, a file
   * sink when log_directory is non-empty. DIRPUSH_LOG_* environment
   * variables are applied last and win over the arguments.
   */
  static LoggingConfig for_run(bool verbose, const std::string& log_directory, bool json);
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal" (any case).
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply environment variable overrides to a LoggingConfig.
 *
 *   DIRPUSH_LOG_LEVEL           - Level for both sinks
 *   DIRPUSH_LOG_CONSOLE_LEVEL   - Console sink level
 *   DIRPUSH_LOG_FILE_LEVEL      - File sink level
 *   DIRPUSH_LOG_FILE_DIR        - Log file directory (also enables the file sink)
 *   DIRPUSH_LOG_FORMAT          - File format ("json" or "text")
 *   DIRPUSH_LOG_FILE_ENABLED    - Enable file logging ("true" or "false")
 *   DIRPUSH_LOG_CONSOLE_ENABLED - Enable console logging ("true" or "false")
 *
 * Unparseable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the configured sinks to the logging core.
 *
 * Records below the lowest enabled sink level are dropped in the core, before
 * any formatting. Calling it again before shutdown_logging() is a no-op.
 */
void init_logging(const LoggingConfig& config);

/**
 * Detach the sinks and drain their queues so no record is lost at exit.
 */
void shutdown_logging();

bool is_logging_initialized();

/**
 * Scoped init_logging() / shutdown_logging() pair for main().
 */
class LoggingSession {
public:
  explicit LoggingSession(const LoggingConfig& config) {
    init_logging(config);
  }

  ~LoggingSession() {
    shutdown_logging();
  }

  LoggingSession(const LoggingSession&) = delete;
  LoggingSession& operator=(const LoggingSession&) = delete;
};

}  // namespace logging
}  // namespace dirpush

#endif  // DIRPUSH_LOG_INIT_HPP
