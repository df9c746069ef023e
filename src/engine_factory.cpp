#include "crcz/search.hpp"
#include "crcz/errors.hpp"
#include "crcz/grid.hpp"
#include "crcz/mgpu.hpp"

#include <string>

namespace crcz {

bool cuda_built() {
#if CRCZ_WITH_CUDA
  return true;
#else
  return false;
#endif
}

#if !CRCZ_WITH_CUDA
std::vector<int> discover_gpus_ids() { return {}; }
#endif

std::vector<std::unique_ptr<GridLauncher>> make_launchers(Backend backend, const AutoTune& t,
                                                          const std::vector<int>& gpu_ids)
{
  std::vector<std::unique_ptr<GridLauncher>> out;
  switch (backend) {
    case Backend::HOST:
      out.push_back(make_host_launcher(t.host_threads));
      break;
    case Backend::CUDA: {
#if CRCZ_WITH_CUDA
      MgpuTune mt = pick_mgpu_tuning(t, gpu_ids);
      if (mt.gpu_ids.empty()) throw BackendUnavailable("no CUDA device found");
      for (int id : mt.gpu_ids) out.push_back(make_cuda_launcher(id, mt.per_device.threads_per_block));
#else
      (void)gpu_ids;
      throw BackendUnavailable("crcz was built without CUDA support");
#endif
      break;
    }
  }
  return out;
}

std::unique_ptr<SearchEngine> make_engine(const EngineOptions& opts) {
  switch (opts.kind) {
    case EngineKind::BOUNDED:
      return std::make_unique<BoundedSearch>(opts.alphabet, opts.cancel, opts.verbose);
    case EngineKind::PARALLEL:
      return std::make_unique<ParallelSearch>(make_launchers(opts.backend, opts.tune, opts.gpu_ids),
                                              opts.tune, opts.cancel, opts.verbose);
    default: return {};
  }
}

} // namespace crcz
