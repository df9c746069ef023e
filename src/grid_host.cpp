// src/grid_host.cpp
#include "crcz/grid.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

namespace crcz {

// Host execution context: std::thread workers pull gid chunks from a shared
// counter; every (gid, blockid) pair runs the same worker as the CUDA kernel.
struct HostGrid : GridLauncher {
  static constexpr uint64_t CHUNK = 4096;

  const unsigned threads;
  std::vector<uint16_t> crc_targets;
  std::vector<uint16_t> sum_targets;
  BestIndexCells        cells;

  explicit HostGrid(unsigned t) : threads(t) {}

  const char* name() const override { return "host"; }

  void prepare(const DigestRecord* targets, size_t count, uint64_t sentinel) override {
    crc_targets.resize(count);
    sum_targets.resize(count);
    for (size_t i = 0; i < count; ++i) {
      crc_targets[i] = targets[i].crc16;
      sum_targets[i] = targets[i].sum16;
    }
    cells.reset(count, sentinel);
  }

  void launch(const BruteLaunch& job) override {
    if (job.gid_count == 0 || job.block_count == 0) return;
    if (size_t(job.block_begin) + job.block_count > cells.size())
      throw std::out_of_range("host grid: block range outside staged targets");

    std::atomic<uint64_t> next{0};
    auto offer = [this](uint32_t blockid, uint64_t gid) { cells.offer(blockid, gid); };

    auto run = [&]() {
      for (;;) {
        const uint64_t lo = next.fetch_add(CHUNK, std::memory_order_relaxed);
        if (lo >= job.gid_count) break;
        const uint64_t hi = std::min(job.gid_count, lo + CHUNK);
        for (uint64_t x = lo; x < hi; ++x) {
          const uint64_t gid = job.gid_begin + x;
          for (uint32_t y = 0; y < job.block_count; ++y)
            brute_worker(gid, job.block_begin + y, job.block_size,
                         crc_targets.data(), sum_targets.data(), offer);
        }
      }
    };

    const uint64_t chunks = (job.gid_count + CHUNK - 1) / CHUNK;
    const unsigned n = static_cast<unsigned>(std::min<uint64_t>(threads, chunks));
    std::vector<std::thread> pool;
    pool.reserve(n > 0 ? n - 1 : 0);
    try {
      for (unsigned i = 1; i < n; ++i) pool.emplace_back(run);
    } catch (const std::system_error&) {
      // fewer workers: the ones already running drain the remaining chunks
    }
    run();  // caller thread is worker 0
    for (auto& th : pool) th.join();
  }

  std::vector<uint64_t> collect() override {
    std::vector<uint64_t> out(cells.size());
    for (size_t i = 0; i < out.size(); ++i) out[i] = cells.value(i);
    return out;
  }
};

std::unique_ptr<GridLauncher> make_host_launcher(unsigned threads) {
  if (threads == 0) {
    threads = std::thread::hardware_concurrency();
    if (threads == 0) threads = 1;
  }
  return std::make_unique<HostGrid>(threads);
}

} // namespace crcz
