#pragma once

#include <Arduino.h>
#include <ESP8266WiFi.h>
#include <PubSubClient.h>

#include "clock_log.hpp"
#include "clock_settings.hpp"
#include "mqtt_client.hpp"

/**
 * MqttClient over PubSubClient and a plain WiFiClient socket. The broker is
 * resolved here with a short DNS timeout and handed to PubSubClient as an
 * address, so connect() never waits on a resolver.
 */
class PubSubMqttClient : public matrixclock::MqttClient {
 public:
  PubSubMqttClient() : client_(net_) {
    client_.setBufferSize(kBufferSize);
    client_.setCallback([this](char *topic, uint8_t *payload, unsigned int length) {
      if (handler_) {
        handler_(context_, topic, payload, length);
      }
    });
  }

  bool networkUp() override { return WiFi.status() == WL_CONNECTED; }

  bool connect(const matrixclock::MqttConnectOptions &options) override {
    if (!networkUp()) {
      return false;
    }
    IPAddress broker;
    if (!broker.fromString(options.host) &&
        WiFi.hostByName(options.host, broker, matrixclock::kDnsTimeoutMs) != 1) {
      matrixclock::logf("mqtt", "could not resolve %s", options.host);
      return false;
    }
    client_.setServer(broker, options.port);
    client_.setKeepAlive(options.keepAliveSec);
    client_.setSocketTimeout(options.socketTimeoutSec);
    net_.setTimeout(matrixclock::kMqttConnectTimeoutMs);
    net_.setNoDelay(true);
    return client_.connect(options.clientId, options.user, options.password, options.willTopic,
                           options.willQos, options.willRetain, options.willPayload);
  }

  bool subscribe(const char *topic, uint8_t qos) override {
    return client_.subscribe(topic, qos);
  }

  bool publish(const char *topic, const char *payload, bool retained) override {
    return client_.publish(topic, payload, retained);
  }

  bool loop() override { return client_.loop(); }
  bool connected() override { return client_.connected(); }

  void disconnect() override {
    if (client_.connected()) {
      client_.disconnect();
    }
    net_.stop();
  }

  void setMessageHandler(matrixclock::MqttMessageHandler handler, void *context) override {
    handler_ = handler;
    context_ = context;
  }

  int state() override { return client_.state(); }

 private:
  static constexpr uint16_t kBufferSize = 768;

  WiFiClient net_;
  PubSubClient client_;
  matrixclock::MqttMessageHandler handler_ = nullptr;
  void *context_ = nullptr;
};
