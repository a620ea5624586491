// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_UPLOAD_ENGINE_HPP
#define DIRPUSH_UPLOAD_ENGINE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include "transfer_strategy.hpp"
#include "transfer_types.hpp"
#include "upload_url_builder.hpp"
#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

constexpr int kDefaultConcurrency = 5;

/**
 * Live counters, readable while a run is in progress
 */
struct EngineStats {
  std::atomic<uint64_t> files_queued{0};
  std::atomic<uint64_t> files_in_flight{0};
  std::atomic<uint64_t> peak_in_flight{0};
  std::atomic<uint64_t> files_completed{0};
  std::atomic<uint64_t> bytes_transferred{0};
};

/**
 * Upload Engine - fans work items out over a bounded worker pool
 *
 * Features:
 * - At most concurrency_limit transfers in flight; the rest wait in the queue
 * - Every item yields exactly one outcome, even when its transfer throws
 * - Outcomes are aggregated on the calling thread as they arrive
 * - Cooperative cancellation between files and between chunk parts
 *
 * Usage:
 *   UploadEngine engine(transfer_config, transport, url_builder, streams, observer);
 *   AggregateReport report = engine.run(std::move(items), 5, false);
 *
 * Collaborators must outlive the engine.
 */
class UploadEngine {
public:
  /**
   * @throws std::invalid_argument if config.chunk_size is zero
   */
  UploadEngine(
    const TransferConfig& config, ITransport& transport, const IUploadUrlBuilder& url_builder,
    IFileStreamFactory& stream_factory, ITransferObserver& observer
  );
  ~UploadEngine();

  // Non-copyable, non-movable
  UploadEngine(const UploadEngine&) = delete;
  UploadEngine& operator=(const UploadEngine&) = delete;
  UploadEngine(UploadEngine&&) = delete;
  UploadEngine& operator=(UploadEngine&&) = delete;

  /**
   * Transfer all items and wait for every outcome
   *
   * @param items Work items, consumed by the run
   * @param concurrency_limit Maximum simultaneous transfers, at least 1
   * @param dry_run Report success without any I/O
   * @return Aggregate counts, bytes and elapsed wall-clock time
   * @throws std::invalid_argument if concurrency_limit < 1
   */
  AggregateReport run(std::vector<WorkItem> items, int concurrency_limit, bool dry_run);

  /**
   * Request cancellation. Files not yet finished fail with kCancelledDetail.
   * Safe to call from a signal handler. Stays in effect for later runs.
   */
  void cancel();

  bool isCancelled() const;

  const EngineStats& stats() const;

private:
  // Worker-side: run the strategy and contain any fault
  TransferOutcome processItem(int worker_id, const WorkItem& item, bool dry_run);

  // Engine-side: fold one outcome into the report
  void recordOutcome(AggregateReport& report, TransferOutcome outcome);

  std::unique_ptr<TransferStrategy> strategy_;
  ITransferObserver& observer_;

  std::atomic<bool> cancelled_{false};
  EngineStats stats_;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_UPLOAD_ENGINE_HPP
