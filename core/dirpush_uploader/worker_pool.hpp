// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_WORKER_POOL_HPP
#define DIRPUSH_WORKER_POOL_HPP

#include <functional>
#include <thread>
#include <vector>

#include "upload_queue.hpp"

namespace dirpush {
namespace uploader {

/**
 * Fixed set of worker threads draining an UploadQueue
 *
 * Each worker takes one item, runs the handler on it to completion, then
 * takes the next. Workers exit once the queue is closed and empty, so at
 * most num_workers handlers run at any moment.
 */
class WorkerPool {
public:
  /**
   * Handler run for every dequeued item. Must not throw.
   */
  using Handler = std::function<void(int worker_id, const WorkItem& item)>;

  /**
   * @param queue Queue to drain (must outlive the pool)
   * @param num_workers Number of threads, at least 1
   * @param handler Per-item handler
   * @throws std::invalid_argument if num_workers < 1
   */
  WorkerPool(UploadQueue& queue, int num_workers, Handler handler);

  /**
   * Closes the queue and joins all workers
   */
  ~WorkerPool();

  // Non-copyable, non-movable
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

  /**
   * Start the worker threads (no-op if already started)
   */
  void start();

  /**
   * Wait for all workers to exit. The queue must be closed first.
   */
  void join();

private:
  void workerLoop(int worker_id);

  UploadQueue& queue_;
  int num_workers_;
  Handler handler_;
  std::vector<std::thread> workers_;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_WORKER_POOL_HPP
