// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "logging_observer.hpp"

#include "size_formatter.hpp"

#define DIRPUSH_LOG_COMPONENT "upload"
#include <dirpush_log_macros.hpp>

namespace dirpush {
namespace uploader {

void LoggingObserver::onFileStarted(const WorkItem& item, bool dry_run) {
  DIRPUSH_LOG_INFO(
    (dry_run ? "[DRY RUN] Would upload " : "Uploading ")
    << item.local_path.string() << " to " << item.remote_key << " ("
    << formatSize(item.size_bytes) << ")"
  );
}

void LoggingObserver::onPartCompleted(
  const WorkItem& item, uint64_t part_num, uint64_t part_count, uint64_t bytes_sent
) {
  if (verbose_ || part_num == part_count) {
    DIRPUSH_LOG_INFO(
      "Uploaded part " << part_num << "/" << part_count << " of "
                       << item.local_path.filename().string() << " ("
                       << formatSize(bytes_sent) << " / " << formatSize(item.size_bytes) << ")"
    );
  } else {
    DIRPUSH_LOG_INFO_THROTTLE(
      2.0, "Uploading " << item.local_path.filename().string() << ": part " << part_num << "/"
                        << part_count << " (" << formatSize(bytes_sent) << " / "
                        << formatSize(item.size_bytes) << ")"
    );
  }
}

void LoggingObserver::onFileFinished(const TransferOutcome& outcome) {
  if (!outcome.succeeded) {
    DIRPUSH_LOG_ERROR(
      "Failed to upload " << outcome.item.local_path.string() << " to "
                          << outcome.item.remote_key << ": "
                          << outcome.error_detail.value_or("unknown error")
    );
    return;
  }

  if (verbose_) {
    DIRPUSH_LOG_INFO(
      "Successfully uploaded " << outcome.item.local_path.string() << " to "
                               << outcome.item.remote_key << " (" << outcome.transport_calls
                               << " requests)"
    );
  } else {
    DIRPUSH_LOG_DEBUG(
      "Successfully uploaded " << outcome.item.local_path.string() << " to "
                               << outcome.item.remote_key
    );
  }
}

}  // namespace uploader
}  // namespace dirpush
