// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_UPLOAD_URL_BUILDER_HPP
#define DIRPUSH_UPLOAD_URL_BUILDER_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace dirpush {
namespace uploader {

/**
 * Percent-encode an object key. RFC 3986 unreserved characters and '/' are kept.
 */
std::string encodeObjectKey(const std::string& key);

/**
 * Reverse %XX escapes in a URL path. '+' and malformed escapes are kept as is.
 */
std::string decodePercentEscapes(const std::string& path);

/**
 * Derives upload URLs from a pre-authenticated base URL
 *
 * Providers disagree on how object names attach to a PAR/presigned base URL,
 * so the rule is a strategy object chosen at configuration time.
 */
class IUploadUrlBuilder {
public:
  virtual ~IUploadUrlBuilder() = default;

  /**
   * URL that a single PUT of the whole object goes to
   */
  virtual std::string objectUrl(const std::string& remote_key) const = 0;

  /**
   * URL for one chunk of a chunked transfer: the object URL with a
   * partNum=<n> query parameter appended
   */
  virtual std::string partUrl(const std::string& object_url, uint64_t part_num) const;
};

/**
 * Inserts an object-container marker segment ("/o/" for OCI PARs) between the
 * base URL and the key, unless the base URL path already ends with it.
 *
 *   https://host/p/TOKEN/n/ns/b/bkt/o/ + "a b.txt" -> https://host/p/TOKEN/n/ns/b/bkt/o/a%20b.txt
 *   https://host/p/TOKEN/n/ns/b/bkt    + "x/y"     -> https://host/p/TOKEN/n/ns/b/bkt/o/x/y
 */
class ObjectMarkerUrlBuilder : public IUploadUrlBuilder {
public:
  /**
   * @throws std::invalid_argument for an empty/non-HTTP base URL or an empty marker
   */
  explicit ObjectMarkerUrlBuilder(const std::string& base_url, const std::string& marker = "o");

  std::string objectUrl(const std::string& remote_key) const override;

  bool baseEndsWithMarker() const {
    return ends_with_marker_;
  }

private:
  std::string base_;   // Base URL without query
  std::string query_;  // Query string without '?', may be empty
  std::string marker_;
  bool ends_with_marker_ = false;
};

/**
 * Appends the key to the base URL with exactly one '/' between them.
 * For presigned prefixes that already point at the object namespace.
 */
class PlainPrefixUrlBuilder : public IUploadUrlBuilder {
public:
  /**
   * @throws std::invalid_argument for an empty/non-HTTP base URL
   */
  explicit PlainPrefixUrlBuilder(const std::string& base_url);

  std::string objectUrl(const std::string& remote_key) const override;

private:
  std::string base_;
  std::string query_;
};

/**
 * Create the builder for a url style name: "marker" (default) or "plain"
 *
 * @throws std::invalid_argument for an unknown style or invalid base URL
 */
std::unique_ptr<IUploadUrlBuilder> createUrlBuilder(
  const std::string& style, const std::string& base_url, const std::string& marker = "o"
);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_UPLOAD_URL_BUILDER_HPP
