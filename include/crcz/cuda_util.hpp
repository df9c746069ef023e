#pragma once
#include <cuda_runtime.h>
#include <cstddef>
#include <cstdio>
#include <cstdlib>

namespace crcz {

// CUDA runtime failures are not recoverable here: report and leave.
inline void cuda_ck(cudaError_t st, const char* what) {
  if (st != cudaSuccess) {
    std::fprintf(stderr, "CUDA error: %s: %s\n", what, cudaGetErrorString(st));
    std::quick_exit(3);
  }
}

// Owning device array; grows on demand, never shrinks.
template <typename T>
struct DeviceBuffer {
  T*     p   = nullptr;
  size_t cap = 0;

  DeviceBuffer() = default;
  DeviceBuffer(const DeviceBuffer&) = delete;
  DeviceBuffer& operator=(const DeviceBuffer&) = delete;
  DeviceBuffer(DeviceBuffer&& o) noexcept { p = o.p; cap = o.cap; o.p = nullptr; o.cap = 0; }
  DeviceBuffer& operator=(DeviceBuffer&& o) noexcept {
    if (this != &o) { release(); p = o.p; cap = o.cap; o.p = nullptr; o.cap = 0; }
    return *this;
  }
  ~DeviceBuffer() { release(); }

  void alloc(size_t count) {
    if (p && cap >= count) return;
    release();
    if (count == 0) return;
    cuda_ck(cudaMalloc(reinterpret_cast<void**>(&p), sizeof(T) * count), "cudaMalloc DeviceBuffer");
    cap = count;
  }

  void release() {
    if (p) { cudaFree(p); p = nullptr; cap = 0; }
  }
};

} // namespace crcz
