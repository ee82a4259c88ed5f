#pragma once

#include <cstddef>
#include <cstdint>

namespace matrixclock {

struct MqttConnectOptions {
  const char *host;
  uint16_t port;
  const char *clientId;
  const char *user;
  const char *password;
  const char *willTopic;
  const char *willPayload;
  uint8_t willQos;
  bool willRetain;
  uint16_t keepAliveSec;
  uint16_t socketTimeoutSec;
};

/** Receives one inbound publish. `payload` is not NUL-terminated. */
typedef void (*MqttMessageHandler)(void *context, const char *topic, const uint8_t *payload,
                                   size_t length);

/**
 * Broker session over whatever MQTT library the device uses. Every call is
 * bounded by the socket timeout.
 */
class MqttClient {
 public:
  virtual ~MqttClient() = default;

  /** True while the station has a network to reach the broker on. */
  virtual bool networkUp() = 0;

  virtual bool connect(const MqttConnectOptions &options) = 0;
  virtual bool subscribe(const char *topic, uint8_t qos) = 0;
  virtual bool publish(const char *topic, const char *payload, bool retained) = 0;

  /**
   * Services the socket and delivers inbound messages to the handler. False
   * when the transport dropped or a keep-alive went unanswered.
   */
  virtual bool loop() = 0;

  virtual bool connected() = 0;
  virtual void disconnect() = 0;
  virtual void setMessageHandler(MqttMessageHandler handler, void *context) = 0;

  /** Library specific status code, for logs only. */
  virtual int state() = 0;
};

}  // namespace matrixclock
