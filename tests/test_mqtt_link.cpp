#include <ArduinoJson.h>
#include <unity.h>

#include <cstring>
#include <string>

#include "clock_settings.hpp"
#include "config_store.hpp"
#include "fakes.hpp"
#include "message_queue.hpp"
#include "mqtt_link.hpp"

using namespace matrixclock;

namespace {

uint32_t maxJitter(uint32_t bound) { return bound - 1; }

struct SyncSpy {
  int calls = 0;
  uint32_t at = 0;
};

void recordSync(void *context, uint32_t now) {
  SyncSpy *spy = static_cast<SyncSpy *>(context);
  ++spy->calls;
  spy->at = now;
}

struct Rig {
  fakes::FakeStorage storage;
  fakes::FakeMqttClient client;
  ConfigStore config{storage};
  MessageQueue queue{4};
  MqttLink link{client, config, queue, "test/clock"};

  Rig() { config.load(); }
};

std::string field(const std::string &json, const char *key) {
  StaticJsonDocument<256> doc;
  if (deserializeJson(doc, json)) {
    return "";
  }
  if (doc[key].is<const char *>()) {
    return doc[key].as<const char *>();
  }
  return std::to_string(doc[key].as<long>());
}

}  // namespace

void setUp() {}
void tearDown() {}

void test_connect_subscribes_and_announces_online() {
  Rig rig;
  TEST_ASSERT_TRUE(rig.link.connect(0));
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
  TEST_ASSERT_EQUAL_STRING(MQTT_HOST, rig.client.host.c_str());
  TEST_ASSERT_EQUAL(MQTT_PORT, rig.client.port);
  TEST_ASSERT_EQUAL_STRING("test/clock/status", rig.client.willTopic.c_str());
  TEST_ASSERT_EQUAL_STRING("{\"state\":\"offline\"}", rig.client.willPayload.c_str());
  TEST_ASSERT_TRUE(rig.client.willRetain);
  TEST_ASSERT_EQUAL(kMqttKeepAliveSec, rig.client.keepAliveSec);

  TEST_ASSERT_EQUAL(3, rig.client.subscriptions.size());
  TEST_ASSERT_EQUAL_STRING("test/clock/config", rig.client.subscriptions[0].c_str());
  TEST_ASSERT_EQUAL_STRING("test/clock/message", rig.client.subscriptions[1].c_str());
  TEST_ASSERT_EQUAL_STRING("test/clock/command", rig.client.subscriptions[2].c_str());
  TEST_ASSERT_EQUAL(1, rig.client.lastQos);

  const fakes::Published *online = rig.client.lastPublished();
  TEST_ASSERT_NOT_NULL(online);
  TEST_ASSERT_EQUAL_STRING("test/clock/status", online->topic.c_str());
  TEST_ASSERT_TRUE(online->retained);
  TEST_ASSERT_EQUAL_STRING("online", field(online->payload, "state").c_str());
  TEST_ASSERT_FALSE(rig.link.backoff().armed());
}

void test_config_update_is_applied_and_acknowledged() {
  Rig rig;
  rig.link.connect(0);
  rig.client.deliver("test/clock/config", "{\"brightness_max\":55}");
  TEST_ASSERT_EQUAL(55, rig.config.current().brightnessMax);
  const fakes::Published *ack = rig.client.lastPublished();
  TEST_ASSERT_EQUAL_STRING("applied", field(ack->payload, "state").c_str());
  TEST_ASSERT_EQUAL_STRING("1", field(ack->payload, "revision").c_str());
  TEST_ASSERT_FALSE(ack->retained);
}

void test_inverted_bounds_are_rejected_with_error_status() {
  Rig rig;
  rig.link.connect(0);
  std::string before;
  contracts::encodeConfiguration(rig.config.current(), before);

  rig.client.deliver("test/clock/config", "{\"brightness_min\":10,\"brightness_max\":5}");

  std::string after;
  contracts::encodeConfiguration(rig.config.current(), after);
  TEST_ASSERT_EQUAL_STRING(before.c_str(), after.c_str());
  const fakes::Published *status = rig.client.lastPublished();
  TEST_ASSERT_EQUAL_STRING("test/clock/status", status->topic.c_str());
  TEST_ASSERT_EQUAL_STRING("error", field(status->payload, "state").c_str());
  TEST_ASSERT_EQUAL_STRING("bounds_inverted", field(status->payload, "code").c_str());
  TEST_ASSERT_EQUAL_STRING("brightness_min", field(status->payload, "field").c_str());
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
  TEST_ASSERT_EQUAL(0, rig.client.disconnects);
}

void test_malformed_config_keeps_session() {
  Rig rig;
  rig.link.connect(0);
  rig.client.deliver("test/clock/config", "{brightness");
  TEST_ASSERT_EQUAL_STRING("malformed", field(rig.client.lastPublished()->payload, "code").c_str());
  TaskStep next = rig.link.step(20);
  TEST_ASSERT_EQUAL_UINT32(kMqttServiceIntervalMs, next.delayMs);
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
}

void test_message_topic_feeds_queue() {
  Rig rig;
  rig.link.connect(0);
  rig.link.step(500);
  rig.client.deliver("test/clock/message", "Hello there");
  TEST_ASSERT_EQUAL(1, rig.queue.size());
  const ScrollMessage *msg = rig.queue.peekActive();
  TEST_ASSERT_EQUAL_STRING("Hello there", msg->text);
  TEST_ASSERT_EQUAL_UINT32(500, msg->enqueuedMs);
  Color blue;
  lookupColor("blue", blue);
  TEST_ASSERT_TRUE(msg->foreground == blue);
  TEST_ASSERT_TRUE(msg->background == kBlack);

  rig.client.deliver("test/clock/message",
                     "{\"message\":\"Alert\",\"foreground\":\"red\",\"background\":\"mauve\"}");
  const ScrollMessage *alert = rig.queue.at(1);
  TEST_ASSERT_EQUAL_STRING("Alert", alert->text);
  TEST_ASSERT_TRUE(alert->foreground == kRed);
  TEST_ASSERT_TRUE(alert->background == kBlack);

  rig.client.deliver("test/clock/message", "");
  TEST_ASSERT_EQUAL(2, rig.queue.size());
}

void test_sync_command_reaches_handler() {
  Rig rig;
  SyncSpy spy;
  rig.link.setSyncHandler(recordSync, &spy);
  rig.link.connect(0);
  rig.link.step(750);
  rig.client.deliver("test/clock/command", "sync");
  TEST_ASSERT_EQUAL(1, spy.calls);
  TEST_ASSERT_EQUAL_UINT32(750, spy.at);

  size_t published = rig.client.published.size();
  rig.client.deliver("test/clock/command", "dance");
  TEST_ASSERT_EQUAL(1, spy.calls);
  TEST_ASSERT_EQUAL(published + 1, rig.client.published.size());
  TEST_ASSERT_EQUAL_STRING("command", field(rig.client.lastPublished()->payload, "source").c_str());
}

void test_publish_while_disconnected_is_dropped() {
  Rig rig;
  TEST_ASSERT_FALSE(rig.link.publishStatus("{\"state\":\"applied\"}"));
  TEST_ASSERT_EQUAL(1, rig.link.droppedPublishes());
  TEST_ASSERT_EQUAL(0, rig.client.published.size());
}

void test_reconnect_backoff_doubles_to_cap_then_resets() {
  Rig rig;
  TEST_ASSERT_TRUE(rig.link.connect(0));
  rig.client.dropOnLoop = true;
  rig.client.failConnects = 6;

  uint32_t now = 1000;
  TaskStep step = rig.link.step(now);
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Disconnected),
                    static_cast<int>(rig.link.state()));
  rig.client.dropOnLoop = false;

  const uint32_t expected[] = {1000, 2000, 4000, 8000, 16000, 30000, 30000};
  for (size_t i = 0; i < sizeof(expected) / sizeof(expected[0]); ++i) {
    TEST_ASSERT_EQUAL_UINT32(expected[i], rig.link.backoff().lastDelayMs());
    TEST_ASSERT_EQUAL_UINT32(expected[i], step.delayMs);
    TaskStep early = rig.link.step(now + expected[i] - 1);
    TEST_ASSERT_EQUAL_UINT32(1, early.delayMs);
    now += expected[i];
    step = rig.link.step(now);
  }

  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
  TEST_ASSERT_FALSE(rig.link.backoff().armed());
  TEST_ASSERT_EQUAL(0, rig.link.backoff().attempts());
  TEST_ASSERT_EQUAL(2, rig.link.sessions());

  rig.client.dropOnLoop = true;
  rig.link.step(now + 20);
  TEST_ASSERT_EQUAL_UINT32(kMqttBackoffFloorMs, rig.link.backoff().lastDelayMs());
}

void test_jitter_is_added_to_the_delay() {
  fakes::FakeStorage storage;
  fakes::FakeMqttClient client;
  ConfigStore config(storage);
  config.load();
  MessageQueue queue(2);
  MqttLink link(client, config, queue, "test/clock", maxJitter);
  client.failConnects = 1;
  TEST_ASSERT_FALSE(link.connect(0));
  TEST_ASSERT_EQUAL_UINT32(kMqttBackoffFloorMs + kMqttBackoffJitterMs,
                           link.backoff().lastDelayMs());
}

void test_subscribe_failure_tears_down_session() {
  Rig rig;
  rig.client.subscribeOk = false;
  TEST_ASSERT_FALSE(rig.link.connect(0));
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Disconnected),
                    static_cast<int>(rig.link.state()));
  TEST_ASSERT_EQUAL(1, rig.client.disconnects);
  TEST_ASSERT_TRUE(rig.link.backoff().armed());
  TEST_ASSERT_EQUAL(0, rig.client.published.size());
}

void test_broker_change_reconnects_to_new_endpoint() {
  Rig rig;
  rig.link.connect(0);
  rig.client.deliver("test/clock/config", "{\"mqtt_host\":\"broker.lan\",\"mqtt_port\":8883}");
  TaskStep drop = rig.link.step(20);
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Disconnected),
                    static_cast<int>(rig.link.state()));
  TEST_ASSERT_EQUAL_UINT32(0, drop.delayMs);
  rig.link.step(20);
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
  TEST_ASSERT_EQUAL_STRING("broker.lan", rig.client.host.c_str());
  TEST_ASSERT_EQUAL(8883, rig.client.port);
}

void test_restart_drops_session_and_clears_backoff() {
  Rig rig;
  rig.client.failConnects = 1;
  rig.link.connect(0);
  TEST_ASSERT_TRUE(rig.link.backoff().armed());
  rig.link.restart(10);
  TEST_ASSERT_FALSE(rig.link.backoff().armed());
  TaskStep step = rig.link.step(10);
  TEST_ASSERT_EQUAL_UINT32(kMqttServiceIntervalMs, step.delayMs);
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
}

void test_no_network_skips_connect_without_backoff() {
  Rig rig;
  rig.client.network = false;
  TEST_ASSERT_FALSE(rig.link.connect(0));
  TEST_ASSERT_EQUAL(0, rig.client.connects);
  TEST_ASSERT_TRUE(rig.link.waitingForNetwork());
  TEST_ASSERT_FALSE(rig.link.backoff().armed());

  TaskStep waiting = rig.link.step(100);
  TEST_ASSERT_EQUAL_UINT32(kNetworkPollIntervalMs, waiting.delayMs);
  TEST_ASSERT_EQUAL(0, rig.client.connects);

  rig.client.network = true;
  TaskStep joined = rig.link.step(100 + kNetworkPollIntervalMs);
  TEST_ASSERT_EQUAL_UINT32(kMqttServiceIntervalMs, joined.delayMs);
  TEST_ASSERT_EQUAL(1, rig.client.connects);
  TEST_ASSERT_FALSE(rig.link.waitingForNetwork());
  TEST_ASSERT_EQUAL(static_cast<int>(LinkState::Connected), static_cast<int>(rig.link.state()));
}

void test_oversized_json_message_is_not_queued() {
  Rig rig;
  rig.link.connect(0);
  std::string payload = "{\"message\":\"" + std::string(1100, 'z') + "\"}";
  rig.client.deliver("test/clock/message", payload);
  TEST_ASSERT_TRUE(rig.queue.empty());
}

int main() {
  UNITY_BEGIN();
  RUN_TEST(test_connect_subscribes_and_announces_online);
  RUN_TEST(test_config_update_is_applied_and_acknowledged);
  RUN_TEST(test_inverted_bounds_are_rejected_with_error_status);
  RUN_TEST(test_malformed_config_keeps_session);
  RUN_TEST(test_message_topic_feeds_queue);
  RUN_TEST(test_sync_command_reaches_handler);
  RUN_TEST(test_publish_while_disconnected_is_dropped);
  RUN_TEST(test_reconnect_backoff_doubles_to_cap_then_resets);
  RUN_TEST(test_jitter_is_added_to_the_delay);
  RUN_TEST(test_subscribe_failure_tears_down_session);
  RUN_TEST(test_broker_change_reconnects_to_new_endpoint);
  RUN_TEST(test_restart_drops_session_and_clears_backoff);
  RUN_TEST(test_no_network_skips_connect_without_backoff);
  RUN_TEST(test_oversized_json_message_is_not_queued);
  return UNITY_END();
}
