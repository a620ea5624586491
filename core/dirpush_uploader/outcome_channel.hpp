// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_OUTCOME_CHANNEL_HPP
#define DIRPUSH_OUTCOME_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>

#include "transfer_types.hpp"

namespace dirpush {
namespace uploader {

/**
 * Many-writer, single-reader channel carrying outcomes from workers to the engine
 */
class OutcomeChannel {
public:
  OutcomeChannel() = default;

  OutcomeChannel(const OutcomeChannel&) = delete;
  OutcomeChannel& operator=(const OutcomeChannel&) = delete;

  void send(TransferOutcome outcome);

  /**
   * Block until an outcome is available
   */
  TransferOutcome receive();

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<TransferOutcome> outcomes_;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_OUTCOME_CHANNEL_HPP
