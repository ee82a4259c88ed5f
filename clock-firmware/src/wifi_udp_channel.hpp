#pragma once

#include <Arduino.h>
#include <ESP8266WiFi.h>
#include <WiFiUdp.h>

#include <cstring>

#include "clock_log.hpp"
#include "clock_settings.hpp"
#include "udp_channel.hpp"

/**
 * UdpChannel over the ESP8266 WiFiUDP socket. The server address is resolved
 * with a short DNS timeout and reused until the next resync is due.
 */
class WifiUdpChannel : public matrixclock::UdpChannel {
 public:
  bool networkUp() override { return WiFi.status() == WL_CONNECTED; }

  bool open() override {
    if (open_) {
      return true;
    }
    open_ = udp_.begin(kLocalPort) == 1;
    return open_;
  }

  bool send(const char *host, uint16_t port, const uint8_t *data, size_t length) override {
    if (!networkUp()) {
      return false;
    }
    IPAddress address;
    if (!resolve(host, address)) {
      return false;
    }
    if (!udp_.beginPacket(address, port)) {
      forget();
      return false;
    }
    udp_.write(data, length);
    if (udp_.endPacket() != 1) {
      forget();
      return false;
    }
    return true;
  }

  int receive(uint8_t *buffer, size_t capacity) override {
    if (!open_) {
      return -1;
    }
    int size = udp_.parsePacket();
    if (size <= 0) {
      return 0;
    }
    int read = udp_.read(buffer, capacity);
    udp_.flush();
    return read;
  }

  void close() override {
    udp_.stop();
    open_ = false;
  }

 private:
  static constexpr uint16_t kLocalPort = 2390;
  static constexpr size_t kHostMax = 64;

  bool resolve(const char *host, IPAddress &out) {
    uint32_t now = millis();
    bool sameHost = std::strncmp(cachedHost_, host, sizeof(cachedHost_)) == 0;
    if (cached_ && sameHost && now - resolvedMs_ < matrixclock::kNtpResyncIntervalMs) {
      out = cachedAddress_;
      return true;
    }
    if (!out.fromString(host) &&
        WiFi.hostByName(host, out, matrixclock::kDnsTimeoutMs) != 1) {
      matrixclock::logf("udp", "could not resolve %s", host);
      forget();
      return false;
    }
    std::strncpy(cachedHost_, host, sizeof(cachedHost_) - 1);
    cachedHost_[sizeof(cachedHost_) - 1] = '\0';
    cachedAddress_ = out;
    resolvedMs_ = now;
    cached_ = true;
    return true;
  }

  void forget() { cached_ = false; }

  WiFiUDP udp_;
  IPAddress cachedAddress_;
  char cachedHost_[kHostMax + 1] = {};
  uint32_t resolvedMs_ = 0;
  bool cached_ = false;
  bool open_ = false;
};
