#pragma once

#include <cstddef>
#include <cstdint>

namespace matrixclock {

/** IEEE 802.3 CRC-32 (reflected, polynomial 0xEDB88320). */
inline uint32_t crc32(const void *data, size_t length, uint32_t seed = 0) {
  const uint8_t *bytes = static_cast<const uint8_t *>(data);
  uint32_t crc = ~seed;
  for (size_t i = 0; i < length; ++i) {
    crc ^= bytes[i];
    for (uint8_t bit = 0; bit < 8; ++bit) {
      crc = (crc >> 1) ^ (0xEDB88320u & (0u - (crc & 1u)));
    }
  }
  return ~crc;
}

}  // namespace matrixclock
