// src/bounded_search.cpp
#include "crcz/search.hpp"
#include "crcz/errors.hpp"
#include "crcz/framing.hpp"

#include <cmath>
#include <cstdio>
#include <limits>
#include <stdexcept>

namespace crcz {

// Poll the cancel token / report progress once per this many candidates.
static constexpr uint64_t POLL_MASK     = 0xFFF;
static constexpr uint64_t PROGRESS_MASK = 0xFFFF;

BoundedSearch::BoundedSearch(Alphabet alphabet, const CancelToken* cancel, bool verbose)
  : alphabet_(Alphabet::from_bytes(std::move(alphabet.symbols))), cancel_(cancel), verbose_(verbose)
{
  if (alphabet_.empty()) throw std::invalid_argument("bounded search needs a non-empty alphabet");
}

unsigned BoundedSearch::max_block_size() const { return MAX_WIRE_BLOCK_SIZE; }

double BoundedSearch::candidate_space(unsigned block_size) const {
  return std::pow(static_cast<double>(alphabet_.size()), static_cast<double>(block_size));
}

SearchResult BoundedSearch::search_one(const DigestRecord& target, unsigned block_size,
                                       size_t block_index)
{
  check_block_size(block_size);

  const double space = candidate_space(block_size);
  if (verbose_ && space > 4294967296.0) {
    std::fprintf(stderr,
      "[bounded] warning: block %zu: %u^%u = %.3g candidates, this may not finish\n",
      block_index, (unsigned)alphabet_.size(), block_size, space);
  }
  const uint64_t total = space >= 1.8e19 ? std::numeric_limits<uint64_t>::max()
                                         : static_cast<uint64_t>(space);

  const auto& sym = alphabet_.symbols;
  const unsigned n = block_size;
  const size_t   k = sym.size();

  // digit[i] indexes sym; crc_at[i+1] / sum_at[i+1] cover bytes [0, i].
  std::vector<size_t>   digit(n, 0);
  std::vector<uint8_t>  cand(n, sym[0]);
  std::vector<uint16_t> crc_at(n + 1, CRC16_INIT);
  std::vector<uint16_t> sum_at(n + 1, 0);

  auto refresh_from = [&](unsigned p) {
    for (unsigned i = p; i < n; ++i) {
      crc_at[i + 1] = crc16_update(crc_at[i], cand[i]);
      sum_at[i + 1] = static_cast<uint16_t>(sum_at[i] + cand[i]);
    }
  };
  refresh_from(0);

  SearchResult res;
  res.block_index = block_index;

  uint64_t evaluated = 0;
  for (;;) {
    if (crc_at[n] == target.crc16 && sum_at[n] == target.sum16) {
      res.winner = cand;
      break;
    }

    ++evaluated;
    if ((evaluated & POLL_MASK) == 0 && cancel_ && cancel_->cancelled()) throw Cancelled();
    if ((evaluated & PROGRESS_MASK) == 0 && progress_) progress_(evaluated, total);

    // odometer: rightmost position varies fastest
    int p = static_cast<int>(n) - 1;
    while (p >= 0 && digit[p] + 1 == k) {
      digit[p] = 0;
      cand[p]  = sym[0];
      --p;
    }
    if (p < 0) break;  // space exhausted
    ++digit[p];
    cand[p] = sym[digit[p]];
    refresh_from(static_cast<unsigned>(p));
  }

  if (progress_) progress_(total, total);
  if (verbose_ && !res.winner) {
    std::fprintf(stderr, "[bounded] block %zu: %s exhausted after %llu candidates\n",
                 block_index, format_record(target).c_str(), (unsigned long long)evaluated);
  }
  return res;
}

} // namespace crcz
