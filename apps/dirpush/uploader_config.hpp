// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_APP_UPLOADER_CONFIG_HPP
#define DIRPUSH_APP_UPLOADER_CONFIG_HPP

#include <cstdint>
#include <string>

#include <transfer_strategy.hpp>
#include <upload_engine.hpp>

namespace dirpush {
namespace app {

/**
 * Effective settings of one dirpush run, merged from the YAML file and the
 * command line (command line wins)
 */
struct UploaderConfig {
  // Source
  std::string directory;
  bool recursive = true;

  // Destination
  std::string base_url;
  std::string prefix;
  std::string url_style = "marker";
  std::string object_marker = "o";

  // Transfer
  int concurrency = uploader::kDefaultConcurrency;
  uint64_t chunk_size = uploader::kDefaultChunkSize;
  bool dry_run = false;
  uint32_t connect_timeout_ms = 10000;
  uint32_t request_timeout_ms = 300000;

  // Logging
  bool verbose = false;
  std::string log_directory;  // Empty: no file sink
  bool log_json = false;
};

}  // namespace app
}  // namespace dirpush

#endif  // DIRPUSH_APP_UPLOADER_CONFIG_HPP
