// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_engine.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>

#include "outcome_channel.hpp"
#include "upload_queue.hpp"
#include "worker_pool.hpp"

#define DIRPUSH_LOG_COMPONENT "upload_engine"
#include <dirpush_log_macros.hpp>

namespace dirpush {
namespace uploader {

namespace {

void updatePeak(std::atomic<uint64_t>& peak, uint64_t value) {
  uint64_t current = peak.load();
  while (value > current && !peak.compare_exchange_weak(current, value)) {
  }
}

}  // namespace

UploadEngine::UploadEngine(
  const TransferConfig& config, ITransport& transport, const IUploadUrlBuilder& url_builder,
  IFileStreamFactory& stream_factory, ITransferObserver& observer
)
    : strategy_(std::make_unique<TransferStrategy>(
        config, transport, url_builder, stream_factory, observer
      ))
    , observer_(observer) {}

UploadEngine::~UploadEngine() = default;

AggregateReport UploadEngine::run(
  std::vector<WorkItem> items, int concurrency_limit, bool dry_run
) {
  if (concurrency_limit < 1) {
    throw std::invalid_argument("concurrency limit must be at least 1");
  }

  AggregateReport report;
  report.dry_run = dry_run;
  report.attempted_count = items.size();

  auto start = std::chrono::steady_clock::now();

  if (items.empty()) {
    report.elapsed = std::chrono::steady_clock::now() - start;
    return report;
  }

  const size_t total = items.size();
  const int num_workers = static_cast<int>(std::min<size_t>(concurrency_limit, total));

  UploadQueue queue;
  OutcomeChannel outcomes;

  for (auto& item : items) {
    queue.enqueue(std::move(item));
  }
  queue.close();
  items.clear();
  stats_.files_queued += total;

  DIRPUSH_LOG_DEBUG(
    "Dispatching" << logging::kv("files", total) << logging::kv("workers", num_workers)
                  << logging::kv("dry_run", dry_run)
  );

  WorkerPool pool(queue, num_workers, [this, &outcomes, dry_run](int id, const WorkItem& item) {
    outcomes.send(processItem(id, item, dry_run));
  });
  pool.start();

  // Block only on draining results; arrival order is unconstrained
  for (size_t received = 0; received < total; ++received) {
    recordOutcome(report, outcomes.receive());
  }
  pool.join();

  report.elapsed = std::chrono::steady_clock::now() - start;
  return report;
}

TransferOutcome UploadEngine::processItem(int worker_id, const WorkItem& item, bool dry_run) {
  stats_.files_queued--;
  updatePeak(stats_.peak_in_flight, ++stats_.files_in_flight);

  TransferOutcome outcome;
  try {
    DIRPUSH_LOG_SCOPED_CONTEXT(worker_id, item.remote_key);
    outcome = strategy_->transfer(item, dry_run, &cancelled_);
  } catch (const std::exception& e) {
    outcome = TransferOutcome::fail(item, std::string("Unexpected fault: ") + e.what());
  } catch (...) {
    outcome = TransferOutcome::fail(item, "Unexpected fault: unknown exception");
  }

  stats_.files_in_flight--;
  return outcome;
}

void UploadEngine::recordOutcome(AggregateReport& report, TransferOutcome outcome) {
  // Runs on the engine thread; a failing observer must not lose the tally
  try {
    observer_.onFileFinished(outcome);
  } catch (const std::exception& e) {
    DIRPUSH_LOG_ERROR(
      "Progress observer failed for " << outcome.item.local_path.string() << ": " << e.what()
    );
  }

  stats_.files_completed++;
  stats_.bytes_transferred += outcome.bytes_transferred;
  report.bytes_transferred += outcome.bytes_transferred;

  if (outcome.succeeded) {
    report.succeeded_count++;
    return;
  }

  report.failed_count++;
  if (outcome.error_detail && *outcome.error_detail == kCancelledDetail) {
    report.cancelled_count++;
  }
  report.failures.push_back(std::move(outcome));
}

void UploadEngine::cancel() {
  cancelled_.store(true);
}

bool UploadEngine::isCancelled() const {
  return cancelled_.load();
}

const EngineStats& UploadEngine::stats() const {
  return stats_;
}

}  // namespace uploader
}  // namespace dirpush
