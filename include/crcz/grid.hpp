#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "crcz/autotune.hpp"
#include "crcz/digest.hpp"

namespace crcz {

// Largest block the brute-force worker can hold in registers.
static constexpr unsigned MAX_GRID_BLOCK_SIZE = 4;

// 256^n, the candidate count (and the "no match" sentinel) for n-byte blocks.
CRCZ_HD inline uint64_t candidate_count(unsigned n) { return 1ull << (8 * n); }

// gid -> n big-endian bytes.
CRCZ_HD inline void decode_candidate(uint64_t gid, unsigned n, uint8_t* out) {
  for (int i = static_cast<int>(n) - 1; i >= 0; --i) {
    out[i] = static_cast<uint8_t>(gid & 0xff);
    gid >>= 8;
  }
}

// One grid worker: decode candidate gid, digest it, and offer gid to the
// block's best-index cell on a match. 'offer' is the only way a worker
// touches shared state; it must be an atomic minimum.
#if defined(__CUDACC__)
#pragma nv_exec_check_disable
#endif
template <class Offer>
CRCZ_HD inline void brute_worker(uint64_t gid, uint32_t blockid, unsigned n,
                                 const uint16_t* crc_targets, const uint16_t* sum_targets,
                                 Offer offer)
{
  uint8_t seq[MAX_GRID_BLOCK_SIZE];
  decode_candidate(gid, n, seq);
  if (crc16(seq, n) == crc_targets[blockid] && sum16(seq, n) == sum_targets[blockid])
    offer(blockid, gid);
}

// One grid launch: x axis over [gid_begin, gid_begin+gid_count),
// y axis over [block_begin, block_begin+block_count).
struct BruteLaunch {
  unsigned block_size  = 0;
  uint64_t gid_begin   = 0;
  uint64_t gid_count   = 0;
  uint32_t block_begin = 0;
  uint32_t block_count = 0;
};

// Host-side per-block result cells. Writes go through offer() only.
class BestIndexCells {
public:
  void reset(size_t count, uint64_t sentinel) {
    cells_ = std::make_unique<std::atomic<uint64_t>[]>(count);
    count_ = count;
    for (size_t i = 0; i < count; ++i) cells_[i].store(sentinel, std::memory_order_relaxed);
  }

  // Atomic minimum.
  void offer(size_t cell, uint64_t gid) {
    std::atomic<uint64_t>& c = cells_[cell];
    uint64_t cur = c.load(std::memory_order_relaxed);
    while (gid < cur && !c.compare_exchange_weak(cur, gid, std::memory_order_relaxed)) {}
  }

  uint64_t value(size_t cell) const { return cells_[cell].load(std::memory_order_acquire); }
  size_t   size() const { return count_; }

private:
  std::unique_ptr<std::atomic<uint64_t>[]> cells_;
  size_t count_ = 0;
};

// Execution context: launches the brute-force grid and waits for it.
struct GridLauncher {
  virtual ~GridLauncher() = default;

  virtual const char* name() const = 0;

  // Stage 'count' target digests and reset every best-index cell to 'sentinel'.
  virtual void prepare(const DigestRecord* targets, size_t count, uint64_t sentinel) = 0;

  // Run one grid and block until every worker has retired.
  virtual void launch(const BruteLaunch& job) = 0;

  // Reduced best index per staged target, in target order.
  virtual std::vector<uint64_t> collect() = 0;
};

std::unique_ptr<GridLauncher> make_host_launcher(unsigned threads);

// Implemented in src/grid_cuda.cu; only linked into CUDA builds.
std::unique_ptr<GridLauncher> make_cuda_launcher(int device, unsigned threads_per_block);

// True when the library was built with the CUDA backend.
bool cuda_built();

// Device ids visible to the CUDA runtime (honours CUDA_VISIBLE_DEVICES);
// empty in host-only builds or without a device.
std::vector<int> discover_gpus_ids();

// One launcher per device id for CUDA, a single launcher for HOST.
std::vector<std::unique_ptr<GridLauncher>> make_launchers(Backend backend, const AutoTune& t,
                                                          const std::vector<int>& gpu_ids);

} // namespace crcz
