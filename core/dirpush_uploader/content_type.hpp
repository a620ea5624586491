// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_CONTENT_TYPE_HPP
#define DIRPUSH_CONTENT_TYPE_HPP

#include <string>

namespace dirpush {
namespace uploader {

constexpr const char* kDefaultContentType = "application/octet-stream";

/**
 * Guess a MIME type from a file name's extension (case-insensitive)
 *
 * @return Known MIME type, or kDefaultContentType
 */
std::string guessContentType(const std::string& file_name);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_CONTENT_TYPE_HPP
