#pragma once
#include <cstdint>
#include <vector>

namespace crcz {

enum class Backend : uint8_t { HOST = 0, CUDA = 1 };

// Launch geometry for the brute-force grid.
struct AutoTune {
  uint64_t gid_span              = 1ull << 24; // candidates per launch (x extent)
  uint32_t max_blocks_per_launch = 65535;      // y extent, CUDA gridDim.y limit
  unsigned threads_per_block     = 256;        // CUDA only
  unsigned host_threads          = 0;          // host only, 0 = hardware_concurrency
};

// Launch geometry sized to 'threads' workers (0 = hardware_concurrency).
AutoTune pick_host_tuning(bool verbose, unsigned threads = 0);

// Queries device 'device' (SM count, max threads, grid limits).
// Only available when built with CUDA.
AutoTune pick_cuda_tuning(int device, bool verbose);

// Dispatches on backend; throws BackendUnavailable for CUDA in a host-only build.
AutoTune pick_tuning(Backend backend, bool verbose);

} // namespace crcz
