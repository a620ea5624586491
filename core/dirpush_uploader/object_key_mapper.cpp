// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "object_key_mapper.hpp"

#include <algorithm>
#include <stdexcept>

namespace fs = std::filesystem;

namespace dirpush {
namespace uploader {

std::string mapObjectKey(
  const fs::path& local_path, const fs::path& source_root, const std::string& prefix
) {
  fs::path rel = local_path.lexically_normal().lexically_relative(source_root.lexically_normal());

  if (rel.empty() || rel == "." || *rel.begin() == "..") {
    throw std::invalid_argument(
      "'" + local_path.string() + "' is not inside source root '" + source_root.string() + "'"
    );
  }

  std::string trimmed_prefix = prefix;
  while (!trimmed_prefix.empty() &&
         (trimmed_prefix.back() == '/' || trimmed_prefix.back() == '\\')) {
    trimmed_prefix.pop_back();
  }

  std::string key = trimmed_prefix.empty() ? rel.generic_string()
                                           : trimmed_prefix + "/" + rel.generic_string();
  std::replace(key.begin(), key.end(), '\\', '/');
  return key;
}

}  // namespace uploader
}  // namespace dirpush
