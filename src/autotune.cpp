#include "crcz/autotune.hpp"
#include "crcz/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <thread>

namespace crcz {

AutoTune pick_host_tuning(bool verbose, unsigned threads) {
  AutoTune t{};
  unsigned hw = std::thread::hardware_concurrency();
  t.host_threads = threads > 0 ? threads : (hw > 0 ? hw : 1);

  // each worker checks at most 2^16 x 8 candidates per launch, so a launch
  // retires in tens of milliseconds and cancellation stays responsive
  t.gid_span = uint64_t(t.host_threads) << 16;
  t.max_blocks_per_launch = 8;

  if (verbose) {
    std::fprintf(stderr, "[auto] host: hw threads=%u -> threads=%u, span=%llu, blocks/launch=%u\n",
      hw, t.host_threads, (unsigned long long)t.gid_span, t.max_blocks_per_launch);
  }
  return t;
}

AutoTune pick_tuning(Backend backend, bool verbose) {
  switch (backend) {
    case Backend::HOST: return pick_host_tuning(verbose);
    case Backend::CUDA:
#if CRCZ_WITH_CUDA
      return pick_cuda_tuning(0, verbose);
#else
      throw BackendUnavailable("crcz was built without CUDA support");
#endif
  }
  return AutoTune{};
}

} // namespace crcz
