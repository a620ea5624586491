// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_DIRECTORY_SCANNER_HPP
#define DIRPUSH_DIRECTORY_SCANNER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "transfer_types.hpp"
#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

/**
 * Files found under a source directory
 */
struct ScanResult {
  std::filesystem::path root;               // Resolved source directory
  std::vector<std::filesystem::path> files; // Sorted regular-file paths
  std::optional<std::string> error;         // Set when the directory could not be scanned

  bool ok() const {
    return !error.has_value();
  }
};

/**
 * Expand a leading "~" from $HOME and make the path absolute
 */
std::filesystem::path resolveDirectory(const std::string& directory);

/**
 * List the regular files under a directory
 *
 * A missing or non-directory path is not fatal: the result carries an error
 * and an empty file list.
 *
 * @param directory Directory to scan ("~" is expanded)
 * @param recursive Descend into subdirectories when true
 * @param filesystem File system interface
 */
ScanResult scanDirectory(
  const std::string& directory, bool recursive, const IFileSystem& filesystem
);

/**
 * Map scanned files to work items: remote key from mapObjectKey(), size from
 * the filesystem. Files whose size cannot be read are skipped with a warning.
 */
std::vector<WorkItem> buildWorkItems(
  const ScanResult& scan, const std::string& prefix, const IFileSystem& filesystem
);

/**
 * Sum of size_bytes over all items
 */
uint64_t totalSize(const std::vector<WorkItem>& items);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_DIRECTORY_SCANNER_HPP
