#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace matrixclock {

constexpr size_t kNtpPacketSize = 48;
/** Seconds between the NTP epoch (1900) and the Unix epoch (1970). */
constexpr uint32_t kNtpUnixOffset = 2208988800UL;
/** Length of one NTP era in seconds. */
constexpr uint64_t kNtpEraSeconds = 4294967296ULL;

/** Fills `packet` with an SNTPv4 client request. */
inline void buildNtpRequest(uint8_t (&packet)[kNtpPacketSize]) {
  std::memset(packet, 0, kNtpPacketSize);
  packet[0] = 0xE3;  // LI unsynchronized, version 4, mode client
  packet[1] = 0;     // stratum
  packet[2] = 6;     // poll interval
  packet[3] = 0xEC;  // precision
}

inline uint32_t readNtpWord(const uint8_t *p) {
  return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

/**
 * Validates a server reply and extracts its transmit timestamp as Unix
 * milliseconds. Rejects short packets, non-server modes, unsynchronized
 * servers (leap indicator 3 or stratum outside 1..15) and a zero timestamp.
 * Timestamps before 1970 in era 0 are read as era 1 (after 2036).
 */
inline bool parseNtpResponse(const uint8_t *packet, size_t length, uint64_t &epochMs) {
  if (!packet || length < kNtpPacketSize) {
    return false;
  }
  uint8_t leap = packet[0] >> 6;
  uint8_t mode = packet[0] & 0x07;
  uint8_t stratum = packet[1];
  if (leap == 3 || (mode != 4 && mode != 5) || stratum < 1 || stratum > 15) {
    return false;
  }
  uint32_t seconds = readNtpWord(packet + 40);
  uint32_t fraction = readNtpWord(packet + 44);
  if (seconds == 0 && fraction == 0) {
    return false;
  }
  uint64_t ntpSeconds = seconds;
  if (seconds < kNtpUnixOffset) {
    ntpSeconds += kNtpEraSeconds;
  }
  uint64_t unixSeconds = ntpSeconds - kNtpUnixOffset;
  uint64_t millis = (static_cast<uint64_t>(fraction) * 1000ULL) >> 32;
  epochMs = unixSeconds * 1000ULL + millis;
  return true;
}

}  // namespace matrixclock
