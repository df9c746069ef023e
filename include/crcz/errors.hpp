#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace crcz {

// Base of every recoverable crcz failure. CUDA runtime faults are not
// reported through here (see cuda_ck).
struct Error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Malformed digest stream header or length.
struct FormatError : Error {
  using Error::Error;
};

// A block's digest has no preimage inside the engine's candidate space.
class NoCandidateFound : public Error {
public:
  NoCandidateFound(size_t block_index, const std::string& engine)
    : Error("no candidate found for block " + std::to_string(block_index) + " (" + engine + ")"),
      block_index_(block_index) {}

  size_t block_index() const { return block_index_; }

private:
  size_t block_index_;
};

class UnsupportedBlockSize : public Error {
public:
  UnsupportedBlockSize(unsigned block_size, unsigned max_supported, const std::string& engine)
    : Error("unsupported block size " + std::to_string(block_size) + " for " + engine +
            " (supported 1-" + std::to_string(max_supported) + ")"),
      block_size_(block_size), max_supported_(max_supported) {}

  unsigned block_size() const { return block_size_; }
  unsigned max_supported() const { return max_supported_; }

private:
  unsigned block_size_;
  unsigned max_supported_;
};

// Cooperative abort of a long-running search.
struct Cancelled : Error {
  Cancelled() : Error("search cancelled") {}
};

// Requested execution backend is not compiled in or has no device.
struct BackendUnavailable : Error {
  using Error::Error;
};

} // namespace crcz
