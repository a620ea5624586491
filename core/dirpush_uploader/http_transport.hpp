// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_HTTP_TRANSPORT_HPP
#define DIRPUSH_HTTP_TRANSPORT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

/**
 * HTTP client settings
 */
struct HttpTransportConfig {
  uint32_t connect_timeout_ms = 10000;   // 10 seconds
  uint32_t request_timeout_ms = 300000;  // 5 minutes, large parts on slow links
  bool verify_ssl = true;
};

/**
 * HTTP PUT transport over the AWS SDK core HTTP client
 *
 * The pre-authenticated URL carries the authorization, so requests are sent
 * unsigned. One underlying client is shared by all threads; every put()
 * builds its own request.
 */
class HttpTransport : public ITransport {
public:
  explicit HttpTransport(const HttpTransportConfig& config = HttpTransportConfig());
  ~HttpTransport() override;

  // Non-copyable
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  /**
   * PUT payload to url
   * @return Status and body; status 0 with error_message when no response arrived
   */
  TransportResponse put(
    const std::string& url, const std::string& payload, const std::string& content_type
  ) override;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_HTTP_TRANSPORT_HPP
