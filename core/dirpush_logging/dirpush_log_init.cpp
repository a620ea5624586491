// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "dirpush_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

#include "dirpush_log_macros.hpp"

namespace dirpush {
namespace logging {

namespace {

struct LevelName {
  const char* name;
  severity_level level;
};

const LevelName kLevelNames[] = {
  {"debug", severity_level::debug}, {"info", severity_level::info},
  {"warn", severity_level::warn},   {"warning", severity_level::warn},
  {"error", severity_level::error}, {"fatal", severity_level::fatal},
};

// Sinks owned between init_logging() and shutdown_logging()
struct ActiveSinks {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool initialized = false;
};

ActiveSinks& active_sinks() {
  static ActiveSinks sinks;
  return sinks;
}

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// nullptr when unset or empty
const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

bool parse_switch(const char* value, bool fallback) {
  std::string lower = lowercase(value);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return fallback;
}

void override_level(const char* env_name, severity_level& target) {
  if (const char* value = env_value(env_name)) {
    if (auto level = parse_severity_level(value)) {
      target = *level;
    }
  }
}

void override_switch(const char* env_name, bool& target) {
  if (const char* value = env_value(env_name)) {
    target = parse_switch(value, target);
  }
}

severity_level lowest_enabled_level(const LoggingConfig& config) {
  if (config.console_enabled && config.file_enabled) {
    return std::min(config.console_level, config.file_level);
  }
  if (config.file_enabled) {
    return config.file_level;
  }
  return config.console_level;
}

// Stop accepting records, then drain what the async frontend still holds
template<typename Sink>
void detach_and_drain(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

LoggingConfig LoggingConfig::for_run(
  bool verbose, const std::string& log_directory, bool json
) {
  LoggingConfig config;
  config.console_level = verbose ? severity_level::debug : severity_level::info;
  if (!log_directory.empty()) {
    config.file_enabled = true;
    config.file_config.directory = log_directory;
  }
  config.file_config.format_json = json;

  apply_env_overrides(config);
  return config;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = lowercase(level_str);
  for (const auto& entry : kLevelNames) {
    if (lower == entry.name) {
      return entry.level;
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  if (const char* value = env_value("DIRPUSH_LOG_LEVEL")) {
    if (auto level = parse_severity_level(value)) {
      config.console_level = *level;
      config.file_level = *level;
    }
  }
  override_level("DIRPUSH_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("DIRPUSH_LOG_FILE_LEVEL", config.file_level);
  override_switch("DIRPUSH_LOG_CONSOLE_ENABLED", config.console_enabled);

  // A directory implies the file sink; an explicit FILE_ENABLED still wins
  if (const char* dir = env_value("DIRPUSH_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
    config.file_enabled = true;
  }
  override_switch("DIRPUSH_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* format = env_value("DIRPUSH_LOG_FORMAT")) {
    config.file_config.format_json = lowercase(format) == "json";
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

void init_logging(const LoggingConfig& config) {
  ActiveSinks& sinks = active_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.initialized) {
    return;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();
  core->set_filter(severity >= lowest_enabled_level(config));

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }

  sinks.initialized = true;
}

void shutdown_logging() {
  ActiveSinks& sinks = active_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (!sinks.initialized) {
    return;
  }

  detach_and_drain(sinks.console);
  detach_and_drain(sinks.file);
  boost::log::core::get()->reset_filter();

  sinks.initialized = false;
}

bool is_logging_initialized() {
  ActiveSinks& sinks = active_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  return sinks.initialized;
}

}  // namespace logging
}  // namespace dirpush
