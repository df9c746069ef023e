#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "crcz/autotune.hpp"

namespace crcz {

// Which GPUs to use and how to launch on each.
struct MgpuTune {
  std::vector<int> gpu_ids;   // e.g., {0,1}
  AutoTune         per_device;
};

// Build MgpuTune from the base tuning and the visible GPUs.
MgpuTune pick_mgpu_tuning(const AutoTune& base, const std::vector<int>& gpu_ids_override);

struct BlockRange {
  size_t begin = 0;
  size_t count = 0;
};

// Contiguous, near-equal ranges covering [0, blocks); never more ranges than
// blocks, and empty when blocks == 0.
std::vector<BlockRange> partition_blocks(size_t blocks, size_t parts);

// Runs fn(part, range) on one std::thread per range and waits for all of
// them. The first failure (in part order) is rethrown on the caller's thread.
void run_per_device(const std::vector<BlockRange>& ranges,
                    const std::function<void(size_t part, const BlockRange& range)>& fn);

} // namespace crcz
