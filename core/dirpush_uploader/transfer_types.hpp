// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_TRANSFER_TYPES_HPP
#define DIRPUSH_TRANSFER_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dirpush {
namespace uploader {

/**
 * One local file mapped to one remote object key
 */
struct WorkItem {
  std::filesystem::path local_path;  // Regular file, readable at dispatch time
  std::string remote_key;            // Forward-slash separated, non-empty
  uint64_t size_bytes = 0;

  WorkItem() = default;

  WorkItem(std::filesystem::path path, std::string key, uint64_t size)
      : local_path(std::move(path))
      , remote_key(std::move(key))
      , size_bytes(size) {}
};

/**
 * Result of transferring one WorkItem. Produced exactly once per item.
 */
struct TransferOutcome {
  WorkItem item;
  bool succeeded = false;
  std::optional<std::string> error_detail;
  uint64_t bytes_transferred = 0;
  int transport_calls = 0;  // PUT requests issued for this item

  static TransferOutcome ok(const WorkItem& item, uint64_t bytes = 0, int calls = 0) {
    TransferOutcome outcome;
    outcome.item = item;
    outcome.succeeded = true;
    outcome.bytes_transferred = bytes;
    outcome.transport_calls = calls;
    return outcome;
  }

  static TransferOutcome fail(
    const WorkItem& item, const std::string& detail, uint64_t bytes = 0, int calls = 0
  ) {
    TransferOutcome outcome;
    outcome.item = item;
    outcome.succeeded = false;
    outcome.error_detail = detail;
    outcome.bytes_transferred = bytes;
    outcome.transport_calls = calls;
    return outcome;
  }
};

/**
 * Split of one file into sequential parts of at most chunk_size bytes.
 * A zero-byte file is a single empty part.
 */
struct ChunkPlan {
  uint64_t total_size = 0;
  uint64_t chunk_size = 0;
  uint64_t part_count = 0;

  /**
   * @param total_size File size in bytes
   * @param chunk_size Maximum part size, must be > 0
   * @throws std::invalid_argument if chunk_size is zero
   */
  static ChunkPlan create(uint64_t total_size, uint64_t chunk_size);

  /**
   * Byte length of a 1-indexed part; the last part carries the remainder.
   */
  uint64_t partLength(uint64_t part_num) const;

  /**
   * Byte offset where a 1-indexed part starts.
   */
  uint64_t partOffset(uint64_t part_num) const;
};

/**
 * Aggregate result of one engine run
 */
struct AggregateReport {
  uint64_t attempted_count = 0;
  uint64_t succeeded_count = 0;
  uint64_t failed_count = 0;
  uint64_t cancelled_count = 0;  // Subset of failed_count
  uint64_t bytes_transferred = 0;
  std::chrono::steady_clock::duration elapsed{0};
  bool dry_run = false;
  std::vector<TransferOutcome> failures;

  double elapsedSeconds() const {
    return std::chrono::duration<double>(elapsed).count();
  }

  bool allSucceeded() const {
    return failed_count == 0;
  }
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_TRANSFER_TYPES_HPP
