// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_TRANSFER_STRATEGY_HPP
#define DIRPUSH_TRANSFER_STRATEGY_HPP

#include <atomic>
#include <cstdint>
#include <string>

#include "transfer_types.hpp"
#include "upload_url_builder.hpp"
#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

constexpr uint64_t kDefaultChunkSize = 10ULL * 1024 * 1024;  // 10 MiB

// error_detail of outcomes for files stopped by cancellation
constexpr const char* kCancelledDetail = "Cancelled";

/**
 * Transfer configuration
 */
struct TransferConfig {
  // Files up to and including this size go out as one PUT; larger files are
  // split into parts of at most this size
  uint64_t chunk_size = kDefaultChunkSize;
};

/**
 * Sends one file, either as a single PUT or as sequential chunk PUTs
 *
 * Single transfer (size <= chunk_size):
 *   one PUT of the whole file to objectUrl(key) with a guessed content type.
 *
 * Chunked transfer (size > chunk_size):
 *   parts 1..n in ascending order, each PUT to partUrl(objectUrl(key), n) as
 *   application/octet-stream. The first failed part fails the file; later
 *   parts are never sent and nothing is retried.
 *
 * The strategy holds no per-file state, so one instance is shared by all
 * workers. Collaborators must outlive it.
 */
class TransferStrategy {
public:
  /**
   * @throws std::invalid_argument if config.chunk_size is zero
   */
  TransferStrategy(
    const TransferConfig& config, ITransport& transport, const IUploadUrlBuilder& url_builder,
    IFileStreamFactory& stream_factory, ITransferObserver& observer
  );

  /**
   * Transfer one file
   *
   * Transport errors and non-2xx responses come back as a failed outcome.
   *
   * @param item File to send
   * @param dry_run Skip all I/O and report success
   * @param cancelled Optional flag checked before the file and between parts
   */
  TransferOutcome transfer(
    const WorkItem& item, bool dry_run, const std::atomic<bool>* cancelled = nullptr
  );

  /**
   * True when a file of this size is split into parts
   */
  bool isChunked(uint64_t size_bytes) const {
    return size_bytes > config_.chunk_size;
  }

  const TransferConfig& config() const {
    return config_;
  }

private:
  TransferOutcome transferSingle(const WorkItem& item);
  TransferOutcome transferChunked(const WorkItem& item, const std::atomic<bool>* cancelled);

  TransferConfig config_;
  ITransport& transport_;
  const IUploadUrlBuilder& url_builder_;
  IFileStreamFactory& stream_factory_;
  ITransferObserver& observer_;
};

/**
 * Read up to length bytes from stream into buffer (resized to the bytes read)
 *
 * @return Number of bytes read; less than length at end of file
 */
uint64_t readChunk(IFileStream& stream, uint64_t length, std::string& buffer);

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_TRANSFER_STRATEGY_HPP
