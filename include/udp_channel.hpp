#pragma once

#include <cstddef>
#include <cstdint>

namespace matrixclock {

/** Datagram socket used for the NTP exchange. */
class UdpChannel {
 public:
  virtual ~UdpChannel() = default;

  /** True while the station has a network to send on. */
  virtual bool networkUp() = 0;

  /** Binds a local port. False when no socket is available. */
  virtual bool open() = 0;

  /** Resolves `host` and sends one datagram. Both steps are time-bounded. */
  virtual bool send(const char *host, uint16_t port, const uint8_t *data, size_t length) = 0;

  /**
   * Copies one pending datagram into `buffer`. Returns its length, 0 when
   * nothing has arrived, or -1 when the socket failed.
   */
  virtual int receive(uint8_t *buffer, size_t capacity) = 0;

  virtual void close() = 0;
};

}  // namespace matrixclock
