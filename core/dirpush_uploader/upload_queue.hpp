// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_UPLOAD_QUEUE_HPP
#define DIRPUSH_UPLOAD_QUEUE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "transfer_types.hpp"

namespace dirpush {
namespace uploader {

/**
 * Thread-safe FIFO of work items feeding the worker pool
 *
 * - One producer (the engine) enqueues every item of a run, then close()s the queue
 * - Multiple consumers (workers) dequeue until the queue is closed and drained
 */
class UploadQueue {
public:
  UploadQueue() = default;
  ~UploadQueue();

  // Non-copyable, non-movable
  UploadQueue(const UploadQueue&) = delete;
  UploadQueue& operator=(const UploadQueue&) = delete;
  UploadQueue(UploadQueue&&) = delete;
  UploadQueue& operator=(UploadQueue&&) = delete;

  /**
   * Add an item to the back of the queue
   *
   * @throws std::logic_error if the queue was already closed
   */
  void enqueue(WorkItem item);

  /**
   * Remove and return the oldest item
   *
   * Blocks until an item is available or the queue is closed and empty.
   *
   * @return Item, or std::nullopt once the queue is closed and drained
   */
  std::optional<WorkItem> dequeue();

  /**
   * Reject further enqueues; consumers drain what is left, then get nullopt
   */
  void close();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<WorkItem> queue_;
  bool closed_ = false;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_UPLOAD_QUEUE_HPP
