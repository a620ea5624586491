// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <directory_scanner.hpp>
#include <dirpush_log_init.hpp>
#include <http_transport.hpp>
#include <logging_observer.hpp>
#include <size_formatter.hpp>
#include <upload_engine.hpp>
#include <upload_url_builder.hpp>
#include <uploader_impl.hpp>

#include "cli_options.hpp"
#include "config_loader.hpp"

#define DIRPUSH_LOG_COMPONENT "dirpush"
#include <dirpush_log_macros.hpp>

namespace dirpush {
namespace app {

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailures = 1;
constexpr int kExitUsage = 2;

// Engine of the current run, for signal handling
std::atomic<uploader::UploadEngine*> g_engine{nullptr};

void signal_handler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* engine = g_engine.load()) {
      engine->cancel();
    }
  }
}

void log_configuration(const UploaderConfig& config) {
  DIRPUSH_LOG_INFO("Starting upload with configuration:");
  DIRPUSH_LOG_INFO("  Directory: " << config.directory);
  DIRPUSH_LOG_INFO("  Base URL: " << config.base_url);
  DIRPUSH_LOG_INFO("  Prefix: " << (config.prefix.empty() ? "(none)" : config.prefix));
  DIRPUSH_LOG_INFO("  URL style: " << config.url_style);
  DIRPUSH_LOG_INFO("  Dry run: " << std::boolalpha << config.dry_run);
  DIRPUSH_LOG_INFO("  Recursive: " << std::boolalpha << config.recursive);
  DIRPUSH_LOG_INFO("  Concurrency: " << config.concurrency);
  DIRPUSH_LOG_INFO(
    "  Chunk size: " << uploader::formatSize(config.chunk_size) << " (" << config.chunk_size
                     << " bytes)"
  );
}

void log_summary(const uploader::AggregateReport& report) {
  std::ostringstream elapsed;
  elapsed << std::fixed << std::setprecision(2) << report.elapsedSeconds();

  DIRPUSH_LOG_INFO("Upload complete!");
  DIRPUSH_LOG_INFO(
    (report.dry_run ? "Would have uploaded: " : "Successfully uploaded: ")
    << report.succeeded_count << " files"
  );
  if (!report.dry_run) {
    DIRPUSH_LOG_INFO("Transferred: " << uploader::formatSize(report.bytes_transferred));
  }
  DIRPUSH_LOG_INFO("Failed uploads: " << report.failed_count << " files");
  if (report.cancelled_count > 0) {
    DIRPUSH_LOG_WARN("Cancelled before completion: " << report.cancelled_count << " files");
  }
  DIRPUSH_LOG_INFO("Total time: " << elapsed.str() << " seconds");

  if (report.dry_run) {
    DIRPUSH_LOG_INFO("This was a dry run. No files were actually uploaded.");
  }
}

int run(const UploaderConfig& config) {
  log_configuration(config);

  uploader::FileSystemImpl filesystem;
  uploader::ScanResult scan =
    uploader::scanDirectory(config.directory, config.recursive, filesystem);
  if (!scan.ok()) {
    DIRPUSH_LOG_WARN(*scan.error);
  }

  std::vector<uploader::WorkItem> items =
    uploader::buildWorkItems(scan, config.prefix, filesystem);
  DIRPUSH_LOG_INFO("Found " << items.size() << " files to upload");
  DIRPUSH_LOG_INFO("Total upload size: " << uploader::formatSize(uploader::totalSize(items)));

  auto url_builder =
    uploader::createUrlBuilder(config.url_style, config.base_url, config.object_marker);

  uploader::HttpTransportConfig http_config;
  http_config.connect_timeout_ms = config.connect_timeout_ms;
  http_config.request_timeout_ms = config.request_timeout_ms;
  uploader::HttpTransport transport(http_config);

  uploader::FileStreamFactoryImpl streams;
  uploader::LoggingObserver observer(config.verbose);

  uploader::TransferConfig transfer_config;
  transfer_config.chunk_size = config.chunk_size;

  uploader::UploadEngine engine(transfer_config, transport, *url_builder, streams, observer);
  g_engine.store(&engine);
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  uploader::AggregateReport report =
    engine.run(std::move(items), config.concurrency, config.dry_run);

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_engine.store(nullptr);

  if (engine.isCancelled()) {
    DIRPUSH_LOG_WARN("Upload interrupted; remaining files were not sent");
  }
  log_summary(report);

  if (report.dry_run || report.allSucceeded()) {
    return kExitSuccess;
  }
  return kExitFailures;
}

}  // namespace

}  // namespace app
}  // namespace dirpush

int main(int argc, char* argv[]) {
  using namespace dirpush::app;

  CliOptions options;
  std::string error;
  if (!parse_command_line(argc, argv, options, error)) {
    std::cerr << "Error: " << error << std::endl;
    print_usage(std::cerr, argv[0]);
    return kExitUsage;
  }
  if (options.show_help) {
    print_usage(std::cout, argv[0]);
    return kExitSuccess;
  }

  UploaderConfig config;
  if (!options.config_file.empty()) {
    ConfigLoader loader;
    if (!loader.load_from_file(options.config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << options.config_file
                << "': " << loader.get_last_error() << std::endl;
      return kExitUsage;
    }
  }
  apply_cli_overrides(options, config);

  if (!ConfigLoader::validate(config, error)) {
    std::cerr << "Error: " << error << std::endl;
    print_usage(std::cerr, argv[0]);
    return kExitUsage;
  }

  // Sinks are drained when the session goes out of scope at the end of main
  std::optional<dirpush::logging::LoggingSession> logging_session;
  try {
    logging_session.emplace(
      dirpush::logging::LoggingConfig::for_run(config.verbose, config.log_directory, config.log_json)
    );
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to initialize logging: " << e.what() << std::endl;
    return kExitUsage;
  }

  int exit_code = kExitFailures;
  try {
    exit_code = run(config);
  } catch (const std::exception& e) {
    DIRPUSH_LOG_FATAL("Upload aborted: " << e.what());
    exit_code = kExitFailures;
  }

  return exit_code;
}
