// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_SIZE_FORMATTER_HPP
#define DIRPUSH_SIZE_FORMATTER_HPP

#include <cstdint>
#include <string>

namespace dirpush {
namespace uploader {

/**
 * Format a byte count with binary units and two decimals ("1.50 KB", "10.00 MB")
 */
std::string formatSize(uint64_t size_bytes);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_SIZE_FORMATTER_HPP
