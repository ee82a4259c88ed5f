#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "backoff.hpp"
#include "config_store.hpp"
#include "message_queue.hpp"
#include "mqtt_client.hpp"
#include "task.hpp"

namespace matrixclock {

enum class LinkState : uint8_t { Disconnected, Connecting, Connected };

const char *linkStateName(LinkState state);

/** Called when the command topic asks for an immediate time sync. */
typedef void (*SyncRequestHandler)(void *context, uint32_t now);

/**
 * Keeps the broker session alive and routes inbound topics: configuration
 * updates to ConfigStore, scroll text to MessageQueue, commands to the
 * installed handler. Reconnects with jittered exponential backoff.
 */
class MqttLink : public Task {
 public:
  MqttLink(MqttClient &client, ConfigStore &config, MessageQueue &queue,
           const char *topicBase = MQTT_TOPIC_BASE, RandomSource random = nullptr);

  /**
   * Opens the session: connect with last will, subscribe the control topics,
   * publish the retained online status. On any failure the session is torn
   * down and the next attempt is scheduled. Without a network nothing is
   * attempted and the backoff is left alone.
   */
  bool connect(uint32_t now);

  /** Time until the next connect attempt is worth making. */
  uint32_t retryDelay(uint32_t now) const;

  /** Publishes on the status topic. Dropped and counted when not Connected. */
  bool publishStatus(const std::string &payload, bool retained = false);

  /** Dispatches one inbound message by topic. */
  void handleMessage(const char *topic, const uint8_t *payload, size_t length);

  void setSyncHandler(SyncRequestHandler handler, void *context) {
    syncHandler_ = handler;
    syncContext_ = context;
  }

  LinkState state() const { return state_; }
  bool waitingForNetwork() const { return waitingForNetwork_; }
  const Backoff &backoff() const { return backoff_; }
  uint32_t droppedPublishes() const { return droppedPublishes_; }
  uint32_t sessions() const { return sessions_; }
  const std::string &statusTopic() const { return topicStatus_; }

  const char *name() const override { return "mqtt"; }
  TaskStep step(uint32_t now) override;
  void restart(uint32_t now) override;

 private:
  static void onMessage(void *context, const char *topic, const uint8_t *payload, size_t length);

  void handleConfig(const uint8_t *payload, size_t length);
  void handleScrollText(const uint8_t *payload, size_t length);
  void handleCommand(const uint8_t *payload, size_t length);
  bool failConnect(uint32_t now, const char *stage);
  void dropSession(uint32_t now, const char *reason);

  MqttClient &client_;
  ConfigStore &config_;
  MessageQueue &queue_;
  std::string topicConfig_;
  std::string topicMessage_;
  std::string topicCommand_;
  std::string topicStatus_;
  Backoff backoff_;
  contracts::Configuration endpoint_;
  LinkState state_ = LinkState::Disconnected;
  SyncRequestHandler syncHandler_ = nullptr;
  void *syncContext_ = nullptr;
  uint32_t tick_ = 0;
  uint32_t droppedPublishes_ = 0;
  uint32_t sessions_ = 0;
  bool waitingForNetwork_ = false;
};

}  // namespace matrixclock
