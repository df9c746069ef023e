// src/framing.cpp
#include "crcz/framing.hpp"
#include "crcz/errors.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace crcz {

static void put_be16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xff));
}

static uint16_t get_be16(const uint8_t* p) {
  return static_cast<uint16_t>((uint16_t(p[0]) << 8) | p[1]);
}

DigestStream encode(const uint8_t* payload, size_t n, unsigned block_size)
{
  if (block_size == 0 || block_size > MAX_WIRE_BLOCK_SIZE)
    throw UnsupportedBlockSize(block_size, MAX_WIRE_BLOCK_SIZE, "digest stream");

  DigestStream s;
  s.block_size = static_cast<uint8_t>(block_size);
  s.records.reserve((n + block_size - 1) / block_size);

  std::vector<uint8_t> block(block_size);
  for (size_t off = 0; off < n; off += block_size) {
    const size_t take = std::min<size_t>(block_size, n - off);
    std::memcpy(block.data(), payload + off, take);
    std::fill(block.begin() + take, block.end(), uint8_t(0));  // pad the tail block
    s.records.push_back(digest(block.data(), block.size()));
  }
  return s;
}

DigestStream encode(const std::vector<uint8_t>& payload, unsigned block_size) {
  return encode(payload.data(), payload.size(), block_size);
}

std::vector<uint8_t> serialize(const DigestStream& s)
{
  std::vector<uint8_t> out;
  out.reserve(HEADER_BYTES + RECORD_BYTES * s.records.size());
  out.push_back(s.block_size);
  for (const auto& r : s.records) {
    put_be16(out, r.crc16);
    put_be16(out, r.sum16);
  }
  return out;
}

DigestStream deserialize(const uint8_t* p, size_t n, unsigned max_block_size)
{
  if (n < HEADER_BYTES) throw FormatError("digest stream: missing header");

  const unsigned block_size = p[0];
  if (block_size == 0 || block_size > max_block_size)
    throw FormatError("digest stream: block size " + std::to_string(block_size) +
                      " outside 1-" + std::to_string(max_block_size));

  const size_t body = n - HEADER_BYTES;
  if (body % RECORD_BYTES != 0)
    throw FormatError("digest stream: body of " + std::to_string(body) +
                      " bytes is not a multiple of " + std::to_string(RECORD_BYTES));

  DigestStream s;
  s.block_size = static_cast<uint8_t>(block_size);
  s.records.resize(body / RECORD_BYTES);
  const uint8_t* rec = p + HEADER_BYTES;
  for (auto& r : s.records) {
    r.crc16 = get_be16(rec);
    r.sum16 = get_be16(rec + 2);
    rec += RECORD_BYTES;
  }
  return s;
}

DigestStream deserialize(const std::vector<uint8_t>& bytes, unsigned max_block_size) {
  return deserialize(bytes.data(), bytes.size(), max_block_size);
}

size_t expected_stream_size(size_t payload_len, unsigned block_size) {
  if (block_size == 0) return HEADER_BYTES;
  return HEADER_BYTES + RECORD_BYTES * ((payload_len + block_size - 1) / block_size);
}

std::string format_record(const DigestRecord& r) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04x:%04x", r.crc16, r.sum16);
  return buf;
}

} // namespace crcz
