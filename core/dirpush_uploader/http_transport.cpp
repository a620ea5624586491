// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_transport.hpp"

#include <aws/core/Aws.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/http/HttpClient.h>
#include <aws/core/http/HttpClientFactory.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/http/URI.h>
#include <aws/core/utils/StringUtils.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>

#include <iterator>
#include <mutex>
#include <sstream>
#include <string>

#include "upload_url_builder.hpp"

#define DIRPUSH_LOG_COMPONENT "http_transport"
#include <dirpush_log_macros.hpp>

namespace dirpush {
namespace uploader {

namespace {

const char* const kAllocationTag = "DirpushHttpTransport";

}  // namespace

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// InitAPI/ShutdownAPI must bracket every use of the SDK. Transports share one
// reference-counted initialization.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// HttpTransport Implementation
// =============================================================================

class HttpTransport::Impl {
public:
  HttpTransportConfig config;
  std::shared_ptr<Aws::Http::HttpClient> client;

  explicit Impl(const HttpTransportConfig& cfg)
      : config(cfg) {
    AwsSdkManager::instance().addRef();

    Aws::Client::ClientConfiguration client_config;
    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;
    client_config.verifySSL = config.verify_ssl;
    client = Aws::Http::CreateHttpClient(client_config);
  }

  ~Impl() {
    // The client must go before release(), which may shut the SDK down
    client.reset();
    AwsSdkManager::instance().release();
  }

  /**
   * Aws::Http::URI percent-encodes path segments when serializing, so hand it
   * the decoded path to keep already-encoded keys from being encoded twice.
   * StringUtils::URLDecode would also turn '+' into a space, which corrupts
   * tokens in the base path; only %XX escapes are reversed here.
   */
  static Aws::Http::URI toUri(const std::string& url) {
    Aws::Http::URI uri(Aws::String(url.c_str(), url.size()));
    std::string path(uri.GetPath().c_str());
    std::string decoded = decodePercentEscapes(path);
    uri.SetPath(Aws::String(decoded.c_str(), decoded.size()));
    return uri;
  }
};

HttpTransport::HttpTransport(const HttpTransportConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
  DIRPUSH_LOG_DEBUG(
    "HTTP transport ready (connect_timeout=" << config.connect_timeout_ms
                                             << "ms, request_timeout="
                                             << config.request_timeout_ms << "ms)"
  );
}

HttpTransport::~HttpTransport() = default;

TransportResponse HttpTransport::put(
  const std::string& url, const std::string& payload, const std::string& content_type
) {
  TransportResponse result;

  auto request = Aws::Http::CreateHttpRequest(
    Impl::toUri(url), Aws::Http::HttpMethod::HTTP_PUT,
    Aws::Utils::Stream::DefaultResponseStreamFactoryMethod
  );

  auto body = Aws::MakeShared<Aws::StringStream>(kAllocationTag);
  body->write(payload.data(), static_cast<std::streamsize>(payload.size()));
  request->AddContentBody(body);
  request->SetContentType(Aws::String(content_type.c_str(), content_type.size()));
  request->SetContentLength(Aws::Utils::StringUtils::to_string(payload.size()));

  auto response = impl_->client->MakeRequest(request);
  if (!response) {
    result.error_message = "no response from HTTP client";
    return result;
  }

  if (response->HasClientError()) {
    result.error_message = std::string(response->GetClientErrorMessage().c_str());
    DIRPUSH_LOG_DEBUG("PUT " << url << " failed: " << result.error_message);
    return result;
  }

  result.status_code = static_cast<int>(response->GetResponseCode());
  if (!result.isSuccess()) {
    auto& stream = response->GetResponseBody();
    result.body.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    DIRPUSH_LOG_DEBUG("PUT " << url << " returned HTTP " << result.status_code);
  }
  return result;
}

}  // namespace uploader
}  // namespace dirpush
