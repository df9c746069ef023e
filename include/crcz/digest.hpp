#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

// Digest functions are shared by host code and the CUDA brute-force kernel.
#if defined(__CUDACC__)
#define CRCZ_HD __host__ __device__
#else
#define CRCZ_HD
#endif

namespace crcz {

// CRC-16-CCITT: poly 0x1021, init 0xFFFF, MSB first, no final xor.
static constexpr uint16_t CRC16_POLY = 0x1021;
static constexpr uint16_t CRC16_INIT = 0xFFFF;

using Block = std::vector<uint8_t>;

struct DigestRecord {
  uint16_t crc16 = 0;
  uint16_t sum16 = 0;
};

CRCZ_HD inline bool operator==(const DigestRecord& a, const DigestRecord& b) {
  return a.crc16 == b.crc16 && a.sum16 == b.sum16;
}
CRCZ_HD inline bool operator!=(const DigestRecord& a, const DigestRecord& b) { return !(a == b); }

// Shift one byte through the CRC register.
CRCZ_HD inline uint16_t crc16_update(uint16_t crc, uint8_t byte) {
  crc ^= static_cast<uint16_t>(byte) << 8;
  for (int j = 0; j < 8; ++j)
    crc = (crc & 0x8000) ? static_cast<uint16_t>((crc << 1) ^ CRC16_POLY)
                         : static_cast<uint16_t>(crc << 1);
  return crc;
}

CRCZ_HD inline uint16_t crc16(const uint8_t* p, size_t n, uint16_t crc = CRC16_INIT) {
  for (size_t i = 0; i < n; ++i) crc = crc16_update(crc, p[i]);
  return crc;
}

CRCZ_HD inline uint16_t sum16(const uint8_t* p, size_t n) {
  uint16_t s = 0;
  for (size_t i = 0; i < n; ++i) s = static_cast<uint16_t>(s + p[i]);
  return s;
}

CRCZ_HD inline DigestRecord digest(const uint8_t* p, size_t n) {
  DigestRecord r;
  r.crc16 = crc16(p, n);
  r.sum16 = sum16(p, n);
  return r;
}

inline uint16_t crc16(const Block& b) { return crc16(b.data(), b.size()); }
inline uint16_t sum16(const Block& b) { return sum16(b.data(), b.size()); }
inline DigestRecord digest(const Block& b) { return digest(b.data(), b.size()); }

} // namespace crcz
