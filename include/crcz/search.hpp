#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "crcz/alphabet.hpp"
#include "crcz/autotune.hpp"
#include "crcz/digest.hpp"
#include "crcz/grid.hpp"

namespace crcz {

// Progress in engine-defined work units (candidates for the bounded engine,
// candidate x block cells for the grid).
using ProgressCallback = std::function<void(uint64_t done, uint64_t total)>;

// Cooperative cancellation: an explicit flag and an optional deadline.
class CancelToken {
public:
  CancelToken() = default;
  explicit CancelToken(std::chrono::milliseconds timeout)
    : has_deadline_(true), deadline_(std::chrono::steady_clock::now() + timeout) {}

  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void cancel() { flag_.store(true, std::memory_order_relaxed); }

  bool cancelled() const {
    if (flag_.load(std::memory_order_relaxed)) return true;
    return has_deadline_ && std::chrono::steady_clock::now() >= deadline_;
  }

private:
  std::atomic<bool> flag_{false};
  bool has_deadline_ = false;
  std::chrono::steady_clock::time_point deadline_{};
};

struct SearchResult {
  size_t               block_index = 0;
  std::optional<Block> winner;      // empty: no candidate in the engine's space
};

struct SearchEngine {
  virtual ~SearchEngine() = default;

  virtual const char* name() const { return "search"; }

  // Largest block size the engine accepts.
  virtual unsigned max_block_size() const = 0;

  // Lowest-valued preimage of one target inside the engine's space.
  virtual SearchResult search_one(const DigestRecord& target, unsigned block_size,
                                  size_t block_index) = 0;

  // Results in target order. The default walks the targets one by one and
  // stops after the first miss, so the last result may be the only empty one.
  // Batch engines return one result per target.
  virtual std::vector<SearchResult> search(const std::vector<DigestRecord>& targets,
                                           unsigned block_size);

  // search_one that throws NoCandidateFound instead of returning a miss.
  Block solve(const DigestRecord& target, unsigned block_size);

  void set_progress(ProgressCallback cb) { progress_ = std::move(cb); }

protected:
  // Throws UnsupportedBlockSize outside [1, max_block_size()].
  void check_block_size(unsigned block_size) const;

  ProgressCallback progress_;
};

// Sequential enumeration of alphabet^N in lexicographic order.
// Cost is |alphabet|^N digest evaluations in the worst case; practical only for
// small N or small alphabets (95^2 = 9025 candidates for printable ASCII, N=2;
// 95^4 is already ~81M).
class BoundedSearch : public SearchEngine {
public:
  explicit BoundedSearch(Alphabet alphabet, const CancelToken* cancel = nullptr, bool verbose = false);

  const char* name() const override { return "bounded"; }
  unsigned max_block_size() const override;

  SearchResult search_one(const DigestRecord& target, unsigned block_size,
                          size_t block_index) override;

  // |alphabet|^block_size as a double (overflows 64 bits quickly).
  double candidate_space(unsigned block_size) const;

  const Alphabet& alphabet() const { return alphabet_; }

private:
  Alphabet           alphabet_;
  const CancelToken* cancel_  = nullptr;
  bool               verbose_ = false;
};

// Full byte-space brute force over a gid x blockid grid with an atomic
// lowest-index reduction per block. Supports N <= 4.
class ParallelSearch : public SearchEngine {
public:
  ParallelSearch(std::vector<std::unique_ptr<GridLauncher>> launchers, const AutoTune& tune,
                 const CancelToken* cancel = nullptr, bool verbose = false);

  const char* name() const override { return "parallel"; }
  unsigned max_block_size() const override { return MAX_GRID_BLOCK_SIZE; }

  SearchResult search_one(const DigestRecord& target, unsigned block_size,
                          size_t block_index) override;

  std::vector<SearchResult> search(const std::vector<DigestRecord>& targets,
                                   unsigned block_size) override;

  size_t device_count() const { return launchers_.size(); }

private:
  std::vector<uint64_t> run_on(GridLauncher& launcher, const DigestRecord* targets, size_t count,
                               unsigned block_size, const std::function<void(uint64_t)>& advance);

  std::vector<std::unique_ptr<GridLauncher>> launchers_;
  AutoTune           tune_;
  const CancelToken* cancel_  = nullptr;
  bool               verbose_ = false;
};

enum class EngineKind : uint8_t { BOUNDED = 0, PARALLEL = 1 };

struct EngineOptions {
  EngineKind         kind     = EngineKind::PARALLEL;
  Alphabet           alphabet = Alphabet::printable(); // bounded only
  Backend            backend  = Backend::HOST;         // parallel only
  std::vector<int>   gpu_ids;                          // parallel + CUDA, empty = all
  AutoTune           tune;
  const CancelToken* cancel   = nullptr;
  bool               verbose  = false;
};

// Central factory (implemented in src/engine_factory.cpp)
std::unique_ptr<SearchEngine> make_engine(const EngineOptions& opts);

} // namespace crcz
