// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_queue.hpp"

#include <stdexcept>

namespace dirpush {
namespace uploader {

UploadQueue::~UploadQueue() {
  close();
}

void UploadQueue::enqueue(WorkItem item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      throw std::logic_error("enqueue on closed upload queue: " + item.remote_key);
    }
    queue_.push(std::move(item));
  }
  cv_.notify_one();
}

std::optional<WorkItem> UploadQueue::dequeue() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !queue_.empty() || closed_; });

  if (queue_.empty()) {
    return std::nullopt;  // Closed and drained
  }

  WorkItem item = std::move(queue_.front());
  queue_.pop();
  return item;
}

void UploadQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

}  // namespace uploader
}  // namespace dirpush
