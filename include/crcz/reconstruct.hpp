#pragma once
#include <cstdint>
#include <vector>

#include "crcz/framing.hpp"
#include "crcz/search.hpp"

namespace crcz {

// Solve every record of 's' with 'engine' in stream order, concatenate the
// winners and strip trailing zero bytes (the encoder's padding).
//
// Fail fast: the first unsolved block raises NoCandidateFound and nothing is
// returned. A payload whose own tail was zero bytes comes back shorter; that
// loss is inherent to the format.
std::vector<uint8_t> reconstruct(const DigestStream& s, SearchEngine& engine);

void strip_trailing_zeros(std::vector<uint8_t>& payload);

} // namespace crcz
