#include "mqtt_link.hpp"

#include <cstring>

#include "clock_log.hpp"
#include "clock_settings.hpp"
#include "contracts.hpp"

namespace matrixclock {

namespace {

constexpr uint8_t kSubscribeQos = 1;
constexpr BackoffPolicy kMqttReconnectPolicy = {kMqttBackoffFloorMs, kMqttBackoffCapMs,
                                                kMqttBackoffJitterMs};

Color resolveColor(const std::string &name, const char *fallback) {
  Color color = kBlack;
  if (!name.empty() && lookupColor(name.c_str(), color)) {
    return color;
  }
  if (!name.empty()) {
    logf("mqtt", "unknown color '%s', using %s", name.c_str(), fallback);
  }
  if (!lookupColor(fallback, color)) {
    color = kWhite;
  }
  return color;
}

}  // namespace

const char *linkStateName(LinkState state) {
  switch (state) {
    case LinkState::Disconnected:
      return "disconnected";
    case LinkState::Connecting:
      return "connecting";
    case LinkState::Connected:
      return "connected";
  }
  return "?";
}

MqttLink::MqttLink(MqttClient &client, ConfigStore &config, MessageQueue &queue,
                   const char *topicBase, RandomSource random)
    : client_(client),
      config_(config),
      queue_(queue),
      topicConfig_(contracts::topic_config(topicBase)),
      topicMessage_(contracts::topic_message(topicBase)),
      topicCommand_(contracts::topic_command(topicBase)),
      topicStatus_(contracts::topic_status(topicBase)),
      backoff_(kMqttReconnectPolicy, random) {
  client_.setMessageHandler(&MqttLink::onMessage, this);
}

void MqttLink::onMessage(void *context, const char *topic, const uint8_t *payload,
                         size_t length) {
  static_cast<MqttLink *>(context)->handleMessage(topic, payload, length);
}

bool MqttLink::failConnect(uint32_t now, const char *stage) {
  logf("mqtt", "%s failed (state=%d)", stage, client_.state());
  client_.disconnect();
  state_ = LinkState::Disconnected;
  uint32_t delay = backoff_.schedule(now);
  logf("mqtt", "retry in %lu ms", static_cast<unsigned long>(delay));
  return false;
}

bool MqttLink::connect(uint32_t now) {
  tick_ = now;
  if (!client_.networkUp()) {
    if (!waitingForNetwork_) {
      logf("mqtt", "waiting for network");
      waitingForNetwork_ = true;
    }
    state_ = LinkState::Disconnected;
    return false;
  }
  waitingForNetwork_ = false;

  endpoint_ = config_.current();
  if (!endpoint_.mqttHost[0]) {
    logf("mqtt", "no broker configured");
    state_ = LinkState::Disconnected;
    backoff_.schedule(now);
    return false;
  }

  state_ = LinkState::Connecting;
  logf("mqtt", "connect %s:%u", endpoint_.mqttHost, static_cast<unsigned>(endpoint_.mqttPort));
  MqttConnectOptions options;
  options.host = endpoint_.mqttHost;
  options.port = endpoint_.mqttPort;
  options.clientId = MQTT_CLIENT_ID;
  options.user = endpoint_.mqttUser[0] ? endpoint_.mqttUser : nullptr;
  options.password = endpoint_.mqttPassword[0] ? endpoint_.mqttPassword : nullptr;
  options.willTopic = topicStatus_.c_str();
  options.willPayload = contracts::kOfflineStatus;
  options.willQos = kSubscribeQos;
  options.willRetain = true;
  options.keepAliveSec = kMqttKeepAliveSec;
  options.socketTimeoutSec = kMqttSocketTimeoutSec;
  if (!client_.connect(options)) {
    return failConnect(now, "connect");
  }

  const std::string *topics[] = {&topicConfig_, &topicMessage_, &topicCommand_};
  for (const std::string *topic : topics) {
    if (!client_.subscribe(topic->c_str(), kSubscribeQos)) {
      return failConnect(now, "subscribe");
    }
  }

  state_ = LinkState::Connected;
  std::string online;
  if (!contracts::encodeOnlineStatus(endpoint_, config_.revision(), online) ||
      !client_.publish(topicStatus_.c_str(), online.c_str(), true)) {
    return failConnect(now, "online status");
  }

  backoff_.reset();
  ++sessions_;
  logf("mqtt", "connected, session %lu", static_cast<unsigned long>(sessions_));
  return true;
}

void MqttLink::dropSession(uint32_t now, const char *reason) {
  logf("mqtt", "session lost: %s (state=%d)", reason, client_.state());
  client_.disconnect();
  state_ = LinkState::Disconnected;
  uint32_t delay = backoff_.schedule(now);
  logf("mqtt", "retry in %lu ms", static_cast<unsigned long>(delay));
}

bool MqttLink::publishStatus(const std::string &payload, bool retained) {
  if (state_ != LinkState::Connected) {
    ++droppedPublishes_;
    logf("mqtt", "status dropped while %s (%lu total)", linkStateName(state_),
         static_cast<unsigned long>(droppedPublishes_));
    return false;
  }
  if (!client_.publish(topicStatus_.c_str(), payload.c_str(), retained)) {
    ++droppedPublishes_;
    logf("mqtt", "status publish failed (state=%d)", client_.state());
    return false;
  }
  return true;
}

void MqttLink::handleMessage(const char *topic, const uint8_t *payload, size_t length) {
  if (!topic) {
    return;
  }
  if (topicConfig_ == topic) {
    handleConfig(payload, length);
  } else if (topicMessage_ == topic) {
    handleScrollText(payload, length);
  } else if (topicCommand_ == topic) {
    handleCommand(payload, length);
  } else {
    logf("mqtt", "ignoring message on %s", topic);
  }
}

void MqttLink::handleConfig(const uint8_t *payload, size_t length) {
  contracts::ValidationError error;
  std::string status;
  bool encoded = config_.applyJson(reinterpret_cast<const char *>(payload), length, error)
                     ? contracts::encodeAppliedStatus(config_.revision(), status)
                     : contracts::encodeErrorStatus("config", error, status);
  if (!encoded) {
    logf("mqtt", "could not encode config status");
    return;
  }
  publishStatus(status);
}

void MqttLink::handleScrollText(const uint8_t *payload, size_t length) {
  contracts::MessageRequest request;
  if (!contracts::decodeMessageRequest(reinterpret_cast<const char *>(payload), length,
                                       request)) {
    logf("mqtt", "ignoring message (%u bytes, empty or too large)", static_cast<unsigned>(length));
    return;
  }
  contracts::Configuration cfg = config_.current();
  Color fg = resolveColor(request.foreground, cfg.messageFg);
  Color bg = resolveColor(request.background, cfg.messageBg);
  MessageQueue::PushResult result =
      queue_.push(request.text.c_str(), request.text.size(), tick_, request.repeat, fg, bg);
  logf("mqtt", "message queued (%u/%u%s)", static_cast<unsigned>(queue_.size()),
       static_cast<unsigned>(queue_.capacity()),
       result == MessageQueue::PushResult::EvictedOldest ? ", oldest dropped" : "");
}

void MqttLink::handleCommand(const uint8_t *payload, size_t length) {
  contracts::Command command =
      contracts::decodeCommand(reinterpret_cast<const char *>(payload), length);
  if (command == contracts::Command::Sync) {
    logf("mqtt", "sync requested");
    if (syncHandler_) {
      syncHandler_(syncContext_, tick_);
    }
    return;
  }
  contracts::ValidationError error;
  contracts::failValidation(error, contracts::ValidationCode::BadEnum, "type");
  logf("mqtt", "unknown command");
  std::string status;
  if (contracts::encodeErrorStatus("command", error, status)) {
    publishStatus(status);
  }
}

TaskStep MqttLink::step(uint32_t now) {
  tick_ = now;
  if (state_ == LinkState::Connected) {
    if (!contracts::sameBrokerEndpoint(endpoint_, config_.current())) {
      logf("mqtt", "broker endpoint changed, reconnecting");
      client_.disconnect();
      state_ = LinkState::Disconnected;
      backoff_.reset();
      return TaskStep::ok(0);
    }
    if (!client_.loop()) {
      dropSession(now, "transport");
      return TaskStep::ok(backoff_.remaining(now));
    }
    return TaskStep::ok(kMqttServiceIntervalMs);
  }
  if (!backoff_.ready(now)) {
    return TaskStep::ok(backoff_.remaining(now));
  }
  if (connect(now)) {
    return TaskStep::ok(kMqttServiceIntervalMs);
  }
  return TaskStep::ok(retryDelay(now));
}

uint32_t MqttLink::retryDelay(uint32_t now) const {
  return waitingForNetwork_ ? kNetworkPollIntervalMs : backoff_.remaining(now);
}

void MqttLink::restart(uint32_t now) {
  (void)now;
  client_.disconnect();
  state_ = LinkState::Disconnected;
  backoff_.reset();
}

}  // namespace matrixclock
