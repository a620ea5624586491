// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "worker_pool.hpp"

#include <stdexcept>

namespace dirpush {
namespace uploader {

WorkerPool::WorkerPool(UploadQueue& queue, int num_workers, Handler handler)
    : queue_(queue)
    , num_workers_(num_workers)
    , handler_(std::move(handler)) {
  if (num_workers_ < 1) {
    throw std::invalid_argument("worker pool needs at least one worker");
  }
}

WorkerPool::~WorkerPool() {
  queue_.close();
  join();
}

void WorkerPool::start() {
  if (!workers_.empty()) {
    return;
  }

  workers_.reserve(num_workers_);
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&WorkerPool::workerLoop, this, i);
  }
}

void WorkerPool::join() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void WorkerPool::workerLoop(int worker_id) {
  while (auto item = queue_.dequeue()) {
    handler_(worker_id, *item);
  }
}

}  // namespace uploader
}  // namespace dirpush
