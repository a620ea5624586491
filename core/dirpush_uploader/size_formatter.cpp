// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "size_formatter.hpp"

#include <iomanip>
#include <sstream>

namespace dirpush {
namespace uploader {

std::string formatSize(uint64_t size_bytes) {
  static const char* units[] = {"B", "KB", "MB", "GB", "TB"};

  double value = static_cast<double>(size_bytes);
  const char* unit = "PB";
  for (const char* candidate : units) {
    if (value < 1024.0) {
      unit = candidate;
      break;
    }
    value /= 1024.0;
  }

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << value << " " << unit;
  return ss.str();
}

}  // namespace uploader
}  // namespace dirpush
