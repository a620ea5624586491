// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_strategy.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "content_type.hpp"

#define DIRPUSH_LOG_COMPONENT "transfer_strategy"
#include <dirpush_log_macros.hpp>

namespace dirpush {
namespace uploader {

namespace {

constexpr uint64_t kReadBlockSize = 1024 * 1024;

bool isCancelled(const std::atomic<bool>* cancelled) {
  return cancelled != nullptr && cancelled->load();
}

}  // namespace

uint64_t readChunk(IFileStream& stream, uint64_t length, std::string& buffer) {
  buffer.resize(length);
  uint64_t total = 0;
  while (total < length) {
    stream.read(&buffer[total], static_cast<std::streamsize>(length - total));
    auto got = stream.gcount();
    if (got <= 0) {
      break;
    }
    total += static_cast<uint64_t>(got);
  }
  buffer.resize(total);
  return total;
}

TransferStrategy::TransferStrategy(
  const TransferConfig& config, ITransport& transport, const IUploadUrlBuilder& url_builder,
  IFileStreamFactory& stream_factory, ITransferObserver& observer
)
    : config_(config)
    , transport_(transport)
    , url_builder_(url_builder)
    , stream_factory_(stream_factory)
    , observer_(observer) {
  if (config_.chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }
}

TransferOutcome TransferStrategy::transfer(
  const WorkItem& item, bool dry_run, const std::atomic<bool>* cancelled
) {
  if (dry_run) {
    observer_.onFileStarted(item, true);
    return TransferOutcome::ok(item);
  }

  if (isCancelled(cancelled)) {
    return TransferOutcome::fail(item, kCancelledDetail);
  }

  observer_.onFileStarted(item, false);

  try {
    if (isChunked(item.size_bytes)) {
      return transferChunked(item, cancelled);
    }
    return transferSingle(item);
  } catch (const std::exception& e) {
    return TransferOutcome::fail(item, std::string("Transfer error: ") + e.what());
  }
}

TransferOutcome TransferStrategy::transferSingle(const WorkItem& item) {
  auto stream = stream_factory_.open_for_read(item.local_path);
  if (!stream) {
    return TransferOutcome::fail(item, "Cannot open file: " + item.local_path.string());
  }

  // Read to end of file; anything shorter than the scanned size was truncated meanwhile
  std::string payload;
  std::string block;
  while (readChunk(*stream, kReadBlockSize, block) > 0) {
    payload += block;
  }
  if (stream->bad()) {
    return TransferOutcome::fail(item, "Read error: " + item.local_path.string());
  }
  if (payload.size() < item.size_bytes) {
    return TransferOutcome::fail(
      item, "Short read: expected " + std::to_string(item.size_bytes) + " bytes, got " +
              std::to_string(payload.size())
    );
  }

  std::string url = url_builder_.objectUrl(item.remote_key);
  std::string content_type = guessContentType(item.local_path.filename().string());

  DIRPUSH_LOG_DEBUG(
    "Single PUT" << logging::kv("key", item.remote_key) << logging::kv("bytes", payload.size())
                 << logging::kv("content_type", content_type)
  );

  TransportResponse response = transport_.put(url, payload, content_type);
  if (!response.isSuccess()) {
    return TransferOutcome::fail(item, response.describeFailure(), 0, 1);
  }
  return TransferOutcome::ok(item, payload.size(), 1);
}

TransferOutcome TransferStrategy::transferChunked(
  const WorkItem& item, const std::atomic<bool>* cancelled
) {
  ChunkPlan plan = ChunkPlan::create(item.size_bytes, config_.chunk_size);

  auto stream = stream_factory_.open_for_read(item.local_path);
  if (!stream) {
    return TransferOutcome::fail(item, "Cannot open file: " + item.local_path.string());
  }

  std::string object_url = url_builder_.objectUrl(item.remote_key);
  std::string chunk;
  uint64_t bytes_sent = 0;
  int calls = 0;

  for (uint64_t part = 1; part <= plan.part_count; ++part) {
    if (isCancelled(cancelled)) {
      return TransferOutcome::fail(item, kCancelledDetail, bytes_sent, calls);
    }

    uint64_t expected = plan.partLength(part);
    uint64_t got = readChunk(*stream, expected, chunk);
    if (got != expected) {
      return TransferOutcome::fail(
        item,
        "Short read on part " + std::to_string(part) + "/" + std::to_string(plan.part_count) +
          ": expected " + std::to_string(expected) + " bytes, got " + std::to_string(got),
        bytes_sent, calls
      );
    }

    DIRPUSH_LOG_DEBUG(
      "PUT part" << logging::kv("key", item.remote_key) << logging::kv("part", part)
                 << logging::kv("offset", plan.partOffset(part)) << logging::kv("bytes", got)
    );
    TransportResponse response =
      transport_.put(url_builder_.partUrl(object_url, part), chunk, kDefaultContentType);
    ++calls;

    if (!response.isSuccess()) {
      DIRPUSH_LOG_ERROR(
        "Error uploading part " << part << " for " << item.local_path.string() << ": "
                                << response.describeFailure()
      );
      return TransferOutcome::fail(
        item,
        "Part " + std::to_string(part) + "/" + std::to_string(plan.part_count) +
          " failed: " + response.describeFailure(),
        bytes_sent, calls
      );
    }

    bytes_sent += got;
    observer_.onPartCompleted(item, part, plan.part_count, bytes_sent);
  }

  return TransferOutcome::ok(item, bytes_sent, calls);
}

}  // namespace uploader
}  // namespace dirpush
