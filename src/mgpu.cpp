// src/mgpu.cpp
#include "crcz/mgpu.hpp"
#include "crcz/grid.hpp"   // discover_gpus_ids

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <vector>

namespace crcz {

MgpuTune pick_mgpu_tuning(const AutoTune& base, const std::vector<int>& gpu_ids_override)
{
  MgpuTune t{};
  t.per_device = base;
  t.gpu_ids    = gpu_ids_override.empty() ? discover_gpus_ids() : gpu_ids_override;
  return t;
}

std::vector<BlockRange> partition_blocks(size_t blocks, size_t parts)
{
  std::vector<BlockRange> out;
  if (blocks == 0 || parts == 0) return out;
  parts = std::min(parts, blocks);

  const size_t base  = blocks / parts;
  const size_t extra = blocks % parts;  // first 'extra' ranges get one more
  size_t at = 0;
  for (size_t i = 0; i < parts; ++i) {
    BlockRange r;
    r.begin = at;
    r.count = base + (i < extra ? 1 : 0);
    out.push_back(r);
    at += r.count;
  }
  return out;
}

void run_per_device(const std::vector<BlockRange>& ranges,
                    const std::function<void(size_t, const BlockRange&)>& fn)
{
  if (ranges.size() == 1) { fn(0, ranges[0]); return; }

  std::vector<std::exception_ptr> errors(ranges.size());
  std::vector<std::thread> workers;
  workers.reserve(ranges.size());
  auto body = [&](size_t i) {
    try {
      fn(i, ranges[i]);
    } catch (...) {
      errors[i] = std::current_exception();
    }
  };
  // parts whose thread could not be started run on the caller
  size_t started = 0;
  try {
    for (; started < ranges.size(); ++started) workers.emplace_back(body, started);
  } catch (const std::system_error&) {
    for (size_t i = started; i < ranges.size(); ++i) body(i);
  }
  for (auto& th : workers) th.join();

  for (auto& e : errors)
    if (e) std::rethrow_exception(e);
}

} // namespace crcz
