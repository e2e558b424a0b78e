#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace chronicle::internal {

/**
 * Byte-at-a-time lookup table for the reflected CRC-32 polynomial 0xedb88320 (IEEE 802.3,
 * as used by zlib). Entry `i` holds the CRC register after shifting the byte `i` through
 * eight rounds of polynomial division.
 */
constexpr std::array<uint32_t, 256> MakeCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t r = i;
    for (int bit = 0; bit < 8; ++bit) {
      r = (r & 1) ? (0xedb88320u ^ (r >> 1)) : (r >> 1);
    }
    table[i] = r;
  }
  return table;
}

constexpr std::array<uint32_t, 256> CRC32_TABLE = MakeCrc32Table();

/** Initial value for a CRC32 computation. */
constexpr uint32_t CRC32_INIT = 0xffffffff;

/** Feed `length` bytes into a running CRC32. Start from CRC32_INIT. */
inline uint32_t crc32Update(uint32_t crc, const std::byte* data, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    crc = CRC32_TABLE[(crc ^ uint32_t(data[i])) & 0xff] ^ (crc >> 8);
  }
  return crc;
}

/** Finalize a CRC32 by inverting the register. */
inline uint32_t crc32Final(uint32_t crc) {
  return crc ^ 0xffffffff;
}

inline uint32_t crc32(const std::byte* data, size_t length) {
  return crc32Final(crc32Update(CRC32_INIT, data, length));
}

}  // namespace chronicle::internal
