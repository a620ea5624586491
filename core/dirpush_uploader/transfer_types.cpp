// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "transfer_types.hpp"

#include <stdexcept>

namespace dirpush {
namespace uploader {

ChunkPlan ChunkPlan::create(uint64_t total_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than zero");
  }

  ChunkPlan plan;
  plan.total_size = total_size;
  plan.chunk_size = chunk_size;
  plan.part_count = total_size == 0 ? 1 : (total_size + chunk_size - 1) / chunk_size;
  return plan;
}

uint64_t ChunkPlan::partOffset(uint64_t part_num) const {
  if (part_num < 1 || part_num > part_count) {
    throw std::out_of_range("part number " + std::to_string(part_num) + " outside 1.." +
                            std::to_string(part_count));
  }
  return (part_num - 1) * chunk_size;
}

uint64_t ChunkPlan::partLength(uint64_t part_num) const {
  uint64_t offset = partOffset(part_num);
  uint64_t remaining = total_size - offset;
  return remaining < chunk_size ? remaining : chunk_size;
}

}  // namespace uploader
}  // namespace dirpush
