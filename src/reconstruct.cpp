// src/reconstruct.cpp
#include "crcz/reconstruct.hpp"
#include "crcz/errors.hpp"

namespace crcz {

void strip_trailing_zeros(std::vector<uint8_t>& payload) {
  while (!payload.empty() && payload.back() == 0) payload.pop_back();
}

std::vector<uint8_t> reconstruct(const DigestStream& s, SearchEngine& engine)
{
  const unsigned n = s.block_size;
  if (n == 0 || n > engine.max_block_size())
    throw UnsupportedBlockSize(n, engine.max_block_size(), engine.name());

  std::vector<SearchResult> results = engine.search(s.records, n);

  std::vector<uint8_t> out;
  out.reserve(s.records.size() * n);
  for (size_t i = 0; i < s.records.size(); ++i) {
    // the default search stops at its first miss, so it can come back short
    if (i >= results.size() || !results[i].winner) throw NoCandidateFound(i, engine.name());
    const Block& b = *results[i].winner;
    out.insert(out.end(), b.begin(), b.end());
  }
  strip_trailing_zeros(out);
  return out;
}

} // namespace crcz
