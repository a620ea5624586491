// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_url_builder.hpp"

#include <cctype>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace dirpush {
namespace uploader {

namespace {

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Split "scheme://host/path?query" into ("scheme://host/path", "query")
std::pair<std::string, std::string> splitBaseUrl(const std::string& base_url) {
  if (base_url.empty()) {
    throw std::invalid_argument("base URL is empty");
  }
  if (!startsWith(base_url, "https://") && !startsWith(base_url, "http://")) {
    throw std::invalid_argument("base URL must start with http:// or https://: " + base_url);
  }

  auto query_pos = base_url.find('?');
  if (query_pos == std::string::npos) {
    return {base_url, ""};
  }
  return {base_url.substr(0, query_pos), base_url.substr(query_pos + 1)};
}

std::string stripTrailingSlashes(std::string s) {
  while (!s.empty() && s.back() == '/') {
    s.pop_back();
  }
  return s;
}

std::string withQuery(const std::string& url, const std::string& query) {
  return query.empty() ? url : url + "?" + query;
}

int hexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

}  // namespace

std::string encodeObjectKey(const std::string& key) {
  static const char hex[] = "0123456789ABCDEF";

  std::string encoded;
  encoded.reserve(key.size() * 3);
  for (unsigned char c : key) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
      encoded += static_cast<char>(c);
    } else {
      encoded += '%';
      encoded += hex[c >> 4];
      encoded += hex[c & 0x0F];
    }
  }
  return encoded;
}

std::string decodePercentEscapes(const std::string& path) {
  std::string decoded;
  decoded.reserve(path.size());
  for (size_t i = 0; i < path.size(); ++i) {
    if (path[i] == '%' && i + 2 < path.size()) {
      int high = hexValue(path[i + 1]);
      int low = hexValue(path[i + 2]);
      if (high >= 0 && low >= 0) {
        decoded += static_cast<char>((high << 4) | low);
        i += 2;
        continue;
      }
    }
    decoded += path[i];
  }
  return decoded;
}

std::string IUploadUrlBuilder::partUrl(const std::string& object_url, uint64_t part_num) const {
  char separator = object_url.find('?') == std::string::npos ? '?' : '&';
  return object_url + separator + "partNum=" + std::to_string(part_num);
}

ObjectMarkerUrlBuilder::ObjectMarkerUrlBuilder(
  const std::string& base_url, const std::string& marker
)
    : marker_(marker) {
  if (marker_.empty() || marker_.find('/') != std::string::npos) {
    throw std::invalid_argument("object marker must be a single non-empty path segment");
  }

  std::tie(base_, query_) = splitBaseUrl(base_url);
  ends_with_marker_ = endsWith(base_, "/" + marker_ + "/");
}

std::string ObjectMarkerUrlBuilder::objectUrl(const std::string& remote_key) const {
  std::string encoded = encodeObjectKey(remote_key);
  if (ends_with_marker_) {
    return withQuery(base_ + encoded, query_);
  }
  return withQuery(stripTrailingSlashes(base_) + "/" + marker_ + "/" + encoded, query_);
}

PlainPrefixUrlBuilder::PlainPrefixUrlBuilder(const std::string& base_url) {
  std::tie(base_, query_) = splitBaseUrl(base_url);
}

std::string PlainPrefixUrlBuilder::objectUrl(const std::string& remote_key) const {
  return withQuery(stripTrailingSlashes(base_) + "/" + encodeObjectKey(remote_key), query_);
}

std::unique_ptr<IUploadUrlBuilder> createUrlBuilder(
  const std::string& style, const std::string& base_url, const std::string& marker
) {
  if (style.empty() || style == "marker") {
    return std::make_unique<ObjectMarkerUrlBuilder>(base_url, marker);
  }
  if (style == "plain") {
    return std::make_unique<PlainPrefixUrlBuilder>(base_url);
  }
  throw std::invalid_argument("unknown url style '" + style + "' (expected marker or plain)");
}

}  // namespace uploader
}  // namespace dirpush
