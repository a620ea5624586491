// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_OBJECT_KEY_MAPPER_HPP
#define DIRPUSH_OBJECT_KEY_MAPPER_HPP

#include <filesystem>
#include <string>

namespace dirpush {
namespace uploader {

/**
 * Map a local file to its remote object key
 *
 * The key is the path of local_path relative to source_root, prefixed with
 * "prefix/" when prefix is non-empty (trailing separators on prefix are
 * dropped). Every backslash in the result becomes a forward slash.
 *
 * Example: mapObjectKey("/data/run1/a.bin", "/data", "backup/") == "backup/run1/a.bin"
 *
 * @throws std::invalid_argument if local_path is not below source_root
 */
std::string mapObjectKey(
  const std::filesystem::path& local_path, const std::filesystem::path& source_root,
  const std::string& prefix
);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_OBJECT_KEY_MAPPER_HPP
