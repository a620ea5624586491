// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_APP_CONFIG_LOADER_HPP
#define DIRPUSH_APP_CONFIG_LOADER_HPP

#include <yaml-cpp/yaml.h>

#include <string>

#include "uploader_config.hpp"

namespace dirpush {
namespace app {

/**
 * Reads the `upload:` and `logging:` sections of a YAML file into an
 * UploaderConfig. Keys that are absent leave the existing value untouched.
 */
class ConfigLoader {
public:
  ConfigLoader() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploaderConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, UploaderConfig& config);

  /**
   * Check a merged configuration before the run starts
   * @param error_msg Set to the first problem found
   */
  static bool validate(const UploaderConfig& config, std::string& error_msg);

  const std::string& get_last_error() const {
    return last_error_;
  }

private:
  void parse_upload(const YAML::Node& node, UploaderConfig& config);
  void parse_logging(const YAML::Node& node, UploaderConfig& config);

  std::string last_error_;
};

}  // namespace app
}  // namespace dirpush

#endif  // DIRPUSH_APP_CONFIG_LOADER_HPP
