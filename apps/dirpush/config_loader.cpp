// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_loader.hpp"

#include <fstream>
#include <stdexcept>

#include <upload_url_builder.hpp>

namespace dirpush {
namespace app {

bool ConfigLoader::load_from_file(const std::string& path, UploaderConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigLoader::load_from_string(const std::string& yaml_content, UploaderConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Config root must be a mapping";
      return false;
    }

    if (node["upload"]) {
      parse_upload(node["upload"], config);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config);
    }
    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML: " + std::string(e.what());
    return false;
  }
}

void ConfigLoader::parse_upload(const YAML::Node& node, UploaderConfig& config) {
  if (node["directory"]) {
    config.directory = node["directory"].as<std::string>();
  }
  if (node["base_url"]) {
    config.base_url = node["base_url"].as<std::string>();
  }
  if (node["prefix"]) {
    config.prefix = node["prefix"].as<std::string>();
  }
  if (node["url_style"]) {
    config.url_style = node["url_style"].as<std::string>();
  }
  if (node["object_marker"]) {
    config.object_marker = node["object_marker"].as<std::string>();
  }
  if (node["concurrency"]) {
    config.concurrency = node["concurrency"].as<int>();
  }
  if (node["chunk_size"]) {
    config.chunk_size = node["chunk_size"].as<uint64_t>();
  }
  if (node["recursive"]) {
    config.recursive = node["recursive"].as<bool>();
  }
  if (node["dry_run"]) {
    config.dry_run = node["dry_run"].as<bool>();
  }
  if (node["connect_timeout_ms"]) {
    config.connect_timeout_ms = node["connect_timeout_ms"].as<uint32_t>();
  }
  if (node["request_timeout_ms"]) {
    config.request_timeout_ms = node["request_timeout_ms"].as<uint32_t>();
  }
}

void ConfigLoader::parse_logging(const YAML::Node& node, UploaderConfig& config) {
  if (node["verbose"]) {
    config.verbose = node["verbose"].as<bool>();
  }
  if (node["directory"]) {
    config.log_directory = node["directory"].as<std::string>();
  }
  if (node["format"]) {
    config.log_json = node["format"].as<std::string>() == "json";
  }
}

bool ConfigLoader::validate(const UploaderConfig& config, std::string& error_msg) {
  if (config.directory.empty()) {
    error_msg = "a source directory is required";
    return false;
  }
  if (config.base_url.empty()) {
    error_msg = "--base-url (or upload.base_url in config file) is required";
    return false;
  }
  if (config.concurrency < 1) {
    error_msg = "concurrency must be at least 1, got " + std::to_string(config.concurrency);
    return false;
  }
  if (config.chunk_size == 0) {
    error_msg = "chunk_size must be greater than zero";
    return false;
  }

  // URL problems surface here, before any scan
  try {
    uploader::createUrlBuilder(config.url_style, config.base_url, config.object_marker);
  } catch (const std::invalid_argument& e) {
    error_msg = e.what();
    return false;
  }

  return true;
}

}  // namespace app
}  // namespace dirpush
