// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "outcome_channel.hpp"

namespace dirpush {
namespace uploader {

void OutcomeChannel::send(TransferOutcome outcome) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    outcomes_.push_back(std::move(outcome));
  }
  cv_.notify_one();
}

TransferOutcome OutcomeChannel::receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !outcomes_.empty(); });

  TransferOutcome outcome = std::move(outcomes_.front());
  outcomes_.pop_front();
  return outcome;
}

}  // namespace uploader
}  // namespace dirpush
