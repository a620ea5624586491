// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef DIRPUSH_LOGGING_OBSERVER_HPP
#define DIRPUSH_LOGGING_OBSERVER_HPP

#include "uploader_interfaces.hpp"

namespace dirpush {
namespace uploader {

/**
 * Transfer observer that reports progress through the dirpush logging macros
 *
 * - file start: INFO, with the human-readable size
 * - chunk progress: INFO for every part when verbose, otherwise throttled
 * - success: INFO when verbose, otherwise DEBUG
 * - failure: ERROR with local path, remote key and detail
 */
class LoggingObserver : public ITransferObserver {
public:
  explicit LoggingObserver(bool verbose = false)
      : verbose_(verbose) {}

  void onFileStarted(const WorkItem& item, bool dry_run) override;

  void onPartCompleted(
    const WorkItem& item, uint64_t part_num, uint64_t part_count, uint64_t bytes_sent
  ) override;

  void onFileFinished(const TransferOutcome& outcome) override;

private:
  bool verbose_;
};

}  // namespace uploader
}  // namespace dirpush

#endif  // DIRPUSH_LOGGING_OBSERVER_HPP
