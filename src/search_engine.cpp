// src/search_engine.cpp
#include "crcz/search.hpp"
#include "crcz/errors.hpp"

namespace crcz {

std::vector<SearchResult> SearchEngine::search(const std::vector<DigestRecord>& targets,
                                               unsigned block_size)
{
  check_block_size(block_size);
  std::vector<SearchResult> out;
  out.reserve(targets.size());
  for (size_t i = 0; i < targets.size(); ++i) {
    out.push_back(search_one(targets[i], block_size, i));
    if (!out.back().winner) break;  // fail fast, later blocks are not attempted
  }
  return out;
}

Block SearchEngine::solve(const DigestRecord& target, unsigned block_size)
{
  check_block_size(block_size);
  SearchResult r = search_one(target, block_size, 0);
  if (!r.winner) throw NoCandidateFound(r.block_index, name());
  return std::move(*r.winner);
}

void SearchEngine::check_block_size(unsigned block_size) const {
  if (block_size == 0 || block_size > max_block_size())
    throw UnsupportedBlockSize(block_size, max_block_size(), name());
}

} // namespace crcz
