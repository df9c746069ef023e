// src/parallel_search.cpp
#include "crcz/search.hpp"
#include "crcz/errors.hpp"
#include "crcz/mgpu.hpp"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <stdexcept>

namespace crcz {

ParallelSearch::ParallelSearch(std::vector<std::unique_ptr<GridLauncher>> launchers,
                               const AutoTune& tune, const CancelToken* cancel, bool verbose)
  : launchers_(std::move(launchers)), tune_(tune), cancel_(cancel), verbose_(verbose)
{
  if (launchers_.empty()) throw std::invalid_argument("parallel search needs at least one launcher");
  for (auto& l : launchers_)
    if (!l) throw std::invalid_argument("parallel search: null launcher");
  if (tune_.gid_span == 0) throw std::invalid_argument("parallel search: gid_span must be > 0");
  if (tune_.max_blocks_per_launch == 0) throw std::invalid_argument("parallel search: max_blocks_per_launch must be > 0");
}

SearchResult ParallelSearch::search_one(const DigestRecord& target, unsigned block_size,
                                        size_t block_index)
{
  std::vector<SearchResult> r = search(std::vector<DigestRecord>{target}, block_size);
  r[0].block_index = block_index;
  return std::move(r[0]);
}

std::vector<SearchResult> ParallelSearch::search(const std::vector<DigestRecord>& targets,
                                                 unsigned block_size)
{
  check_block_size(block_size);
  if (targets.empty()) return {};

  const uint64_t sentinel   = candidate_count(block_size);
  const uint64_t total_work = sentinel * targets.size();
  const auto ranges = partition_blocks(targets.size(), launchers_.size());

  if (verbose_) {
    std::fprintf(stderr, "[parallel] %zu blocks x %llu candidates on %zu %s launcher(s)\n",
                 targets.size(), (unsigned long long)sentinel, ranges.size(), launchers_[0]->name());
  }

  std::mutex progress_mu;
  uint64_t   progress_done = 0;
  auto advance = [&](uint64_t units) {
    if (!progress_) return;
    std::lock_guard<std::mutex> lk(progress_mu);
    progress_done = std::min(total_work, progress_done + units);
    progress_(progress_done, total_work);
  };

  std::vector<uint64_t> best(targets.size(), sentinel);
  run_per_device(ranges, [&](size_t part, const BlockRange& r) {
    auto cells = run_on(*launchers_[part], targets.data() + r.begin, r.count, block_size, advance);
    std::copy(cells.begin(), cells.end(), best.begin() + r.begin);
  });

  std::vector<SearchResult> out(targets.size());
  for (size_t i = 0; i < targets.size(); ++i) {
    out[i].block_index = i;
    if (best[i] >= sentinel) continue;  // never offered: no preimage
    Block b(block_size);
    decode_candidate(best[i], block_size, b.data());
    out[i].winner = std::move(b);
  }
  return out;
}

std::vector<uint64_t> ParallelSearch::run_on(GridLauncher& launcher, const DigestRecord* targets,
                                             size_t count, unsigned block_size,
                                             const std::function<void(uint64_t)>& advance)
{
  const uint64_t space = candidate_count(block_size);
  launcher.prepare(targets, count, space);

  for (size_t b0 = 0; b0 < count; b0 += tune_.max_blocks_per_launch) {
    const uint32_t nb = static_cast<uint32_t>(std::min<size_t>(tune_.max_blocks_per_launch, count - b0));
    for (uint64_t g0 = 0; g0 < space; g0 += tune_.gid_span) {
      BruteLaunch job;
      job.block_size  = block_size;
      job.gid_begin   = g0;
      job.gid_count   = std::min(tune_.gid_span, space - g0);
      job.block_begin = static_cast<uint32_t>(b0);
      job.block_count = nb;
      launcher.launch(job);

      // whole launches only: work already dispatched always retires first
      if (cancel_ && cancel_->cancelled()) throw Cancelled();

      advance(job.gid_count * nb);
    }
  }
  return launcher.collect();
}

} // namespace crcz
