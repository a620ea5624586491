// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_UPLOADER_INTERFACES_HPP
#define DIRPUSH_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <filesystem>
#include <ios>
#include <memory>
#include <string>
#include <vector>

#include "transfer_types.hpp"

namespace dirpush {
namespace uploader {

/**
 * Interface for filesystem queries
 * Allows mocking directory scans for testing
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::filesystem::path& path) const = 0;

  virtual bool is_directory(const std::filesystem::path& path) const = 0;

  /**
   * Get the size of a file in bytes
   * @throws std::filesystem::filesystem_error if the size cannot be read
   */
  virtual uint64_t file_size(const std::filesystem::path& path) const = 0;

  /**
   * List the regular files under a directory
   * @param dir Directory to list
   * @param recursive Descend into subdirectories when true, direct children only otherwise
   * @return Regular-file paths in directory iteration order
   */
  virtual std::vector<std::filesystem::path> list_files(
    const std::filesystem::path& dir, bool recursive
  ) const = 0;
};

/**
 * Interface for sequential file reads
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  /**
   * Read up to size bytes into buffer
   * @return Reference to this stream for chaining
   */
  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  /**
   * Number of characters read by the last read()
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool bad() const = 0;
};

/**
 * Factory interface for opening file streams
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * Open a file for binary reading
   * @return Stream, or nullptr if the file cannot be opened
   */
  virtual std::unique_ptr<IFileStream> open_for_read(const std::filesystem::path& path) = 0;
};

/**
 * Response of a single PUT
 */
struct TransportResponse {
  int status_code = 0;        // HTTP status, 0 when no response was received
  std::string body;           // Response body (kept for error reporting)
  std::string error_message;  // Connection-level failure description

  bool isSuccess() const {
    return status_code >= 200 && status_code < 300;
  }

  /**
   * Human-readable failure description, empty on success
   */
  std::string describeFailure() const {
    if (isSuccess()) {
      return "";
    }
    if (status_code == 0) {
      return "Connection failed: " + (error_message.empty() ? "no response" : error_message);
    }
    std::string detail = "HTTP " + std::to_string(status_code);
    if (!body.empty()) {
      detail += ": " + body;
    } else if (!error_message.empty()) {
      detail += ": " + error_message;
    }
    return detail;
  }
};

/**
 * "PUT bytes to URL, get status" capability
 *
 * Implementations must allow concurrent put() calls from different threads;
 * each call carries its own request state.
 */
class ITransport {
public:
  virtual ~ITransport() = default;

  virtual TransportResponse put(
    const std::string& url, const std::string& payload, const std::string& content_type
  ) = 0;
};

/**
 * Observer for transfer progress
 *
 * Called from worker threads; implementations must be thread-safe.
 */
class ITransferObserver {
public:
  virtual ~ITransferObserver() = default;

  virtual void onFileStarted(const WorkItem& item, bool dry_run) = 0;

  /**
   * A chunk part was accepted by the remote side
   * @param bytes_sent Bytes of this file transferred so far, including this part
   */
  virtual void onPartCompleted(
    const WorkItem& item, uint64_t part_num, uint64_t part_count, uint64_t bytes_sent
  ) = 0;

  virtual void onFileFinished(const TransferOutcome& outcome) = 0;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_UPLOADER_INTERFACES_HPP
