#pragma once

#include <cstdint>

#include "backoff.hpp"
#include "clock_source.hpp"
#include "config_store.hpp"
#include "light_sensor.hpp"
#include "message_queue.hpp"
#include "mqtt_client.hpp"
#include "mqtt_link.hpp"
#include "record_storage.hpp"
#include "renderer.hpp"
#include "scheduler.hpp"
#include "udp_channel.hpp"

namespace matrixclock {

/**
 * Owns every component and the scheduler that drives them. The firmware
 * calls begin() from setup() and runOnce() from loop().
 */
class ClockRuntime {
 public:
  ClockRuntime(RecordStorage &storage, UdpChannel &udp, MqttClient &mqtt,
               LightSensorDriver &lightDriver, DisplayDriver &display,
               RandomSource random = nullptr);

  /**
   * Boot sequence: load the configuration, send the first NTP request,
   * connect to the broker, then register the steady-state tasks.
   */
  ConfigStore::LoadResult begin(uint32_t now);

  /** One scheduler pass. Returns how long the caller may idle. */
  uint32_t runOnce(uint32_t now);

  ConfigStore &config() { return config_; }
  ClockSource &clock() { return clock_; }
  LightSensor &light() { return light_; }
  MessageQueue &queue() { return queue_; }
  MqttLink &mqtt() { return mqtt_; }
  Renderer &renderer() { return renderer_; }
  Scheduler &scheduler() { return scheduler_; }

 private:
  static void onSyncRequest(void *context, uint32_t now);

  /** Turns clock and broker transitions into scroll messages. */
  void observe(uint32_t now);
  void scrollStatus(const char *text, uint32_t now);
  void scrollError(const char *text, uint32_t now);

  ConfigStore config_;
  ClockSource clock_;
  LightSensor light_;
  MessageQueue queue_;
  MqttLink mqtt_;
  Renderer renderer_;
  Scheduler scheduler_;
  SyncState seenSync_ = SyncState::Unset;
  bool seenConnected_ = false;
  uint32_t seenSessions_ = 0;
};

}  // namespace matrixclock
