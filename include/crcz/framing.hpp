#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "crcz/digest.hpp"

namespace crcz {

// Digest stream framing:
// [u8 block_size] then repeated records of [u16 BE crc16][u16 BE sum16].
// Record size is fixed, so no markers or trailer are needed.

static constexpr size_t   HEADER_BYTES        = 1;
static constexpr size_t   RECORD_BYTES        = 4;
static constexpr unsigned MAX_WIRE_BLOCK_SIZE = 255;

struct DigestStream {
  uint8_t                   block_size = 0;
  std::vector<DigestRecord> records;
};

inline bool operator==(const DigestStream& a, const DigestStream& b) {
  return a.block_size == b.block_size && a.records == b.records;
}
inline bool operator!=(const DigestStream& a, const DigestStream& b) { return !(a == b); }

// Split into block_size chunks (last one zero padded) and digest each.
// Throws UnsupportedBlockSize for 0 or > MAX_WIRE_BLOCK_SIZE.
DigestStream encode(const uint8_t* payload, size_t n, unsigned block_size);
DigestStream encode(const std::vector<uint8_t>& payload, unsigned block_size);

std::vector<uint8_t> serialize(const DigestStream& s);

// Throws FormatError on an empty buffer, a body that is not a whole number of
// records, or a block size of 0 / above max_block_size.
DigestStream deserialize(const uint8_t* p, size_t n, unsigned max_block_size = MAX_WIRE_BLOCK_SIZE);
DigestStream deserialize(const std::vector<uint8_t>& bytes, unsigned max_block_size = MAX_WIRE_BLOCK_SIZE);

// Serialized size of a payload of payload_len bytes.
size_t expected_stream_size(size_t payload_len, unsigned block_size);

// "crc:sum" as two 4-digit hex fields, e.g. "4b74:0083".
std::string format_record(const DigestRecord& r);

} // namespace crcz
