// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "directory_scanner.hpp"

#include <algorithm>
#include <cstdlib>
#include <system_error>

#include "object_key_mapper.hpp"

#define DIRPUSH_LOG_COMPONENT "scanner"
#include <dirpush_log_macros.hpp>

namespace fs = std::filesystem;

namespace dirpush {
namespace uploader {

fs::path resolveDirectory(const std::string& directory) {
  std::string expanded = directory;
  if (!expanded.empty() && expanded[0] == '~' && (expanded.size() == 1 || expanded[1] == '/')) {
    if (const char* home = std::getenv("HOME")) {
      expanded = std::string(home) + expanded.substr(1);
    }
  }

  std::error_code ec;
  fs::path resolved = fs::weakly_canonical(fs::absolute(expanded, ec), ec);
  if (ec) {
    return fs::absolute(expanded).lexically_normal();
  }
  return resolved;
}

ScanResult scanDirectory(
  const std::string& directory, bool recursive, const IFileSystem& filesystem
) {
  ScanResult result;
  result.root = resolveDirectory(directory);

  if (!filesystem.exists(result.root) || !filesystem.is_directory(result.root)) {
    result.error = "Directory does not exist or is not a directory: " + result.root.string();
    return result;
  }

  try {
    result.files = filesystem.list_files(result.root, recursive);
  } catch (const fs::filesystem_error& e) {
    result.error = "Failed to scan " + result.root.string() + ": " + e.what();
    result.files.clear();
    return result;
  }

  std::sort(result.files.begin(), result.files.end());
  DIRPUSH_LOG_INFO("Found " << result.files.size() << " files in " << result.root.string());
  return result;
}

std::vector<WorkItem> buildWorkItems(
  const ScanResult& scan, const std::string& prefix, const IFileSystem& filesystem
) {
  std::vector<WorkItem> items;
  items.reserve(scan.files.size());

  for (const auto& file : scan.files) {
    uint64_t size = 0;
    try {
      size = filesystem.file_size(file);
    } catch (const fs::filesystem_error& e) {
      DIRPUSH_LOG_WARN("Skipping " << file.string() << ": " << e.what());
      continue;
    }
    items.emplace_back(file, mapObjectKey(file, scan.root, prefix), size);
  }
  return items;
}

uint64_t totalSize(const std::vector<WorkItem>& items) {
  uint64_t total = 0;
  for (const auto& item : items) {
    total += item.size_bytes;
  }
  return total;
}

}  // namespace uploader
}  // namespace dirpush
