#pragma once

#include <ArduinoJson.h>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>

#include "clock_settings.hpp"
#include "color.hpp"

namespace matrixclock {
namespace contracts {

constexpr size_t kHostMax = 64;
constexpr size_t kUserMax = 32;
constexpr size_t kPasswordMax = 64;
constexpr size_t kNtpServerMax = 64;
constexpr long kBrightnessCeiling = 100;
constexpr long kScrollStepMinMs = 10;
constexpr long kScrollStepMaxMs = 1000;
constexpr long kUtcOffsetMinMinutes = -24 * 60;
constexpr long kUtcOffsetMaxMinutes = 24 * 60;
constexpr long kRepeatMax = 10;

/**
 * Fixed ArduinoJson capacities so payload handling never grows the heap.
 */
constexpr size_t kConfigJsonCapacity = 1024;
// Holds the largest payload the device MQTT buffer delivers (768 bytes) once copied.
constexpr size_t kMessageJsonCapacity = 1024;
constexpr size_t kStatusJsonCapacity = 192;

/** Retained payload the broker publishes for us when the session dies. */
constexpr const char *kOfflineStatus = "{\"state\":\"offline\"}";

constexpr const char *kKeyTimeFormat = "time_format";
constexpr const char *kKeyShowSeconds = "show_seconds";
constexpr const char *kKeyBrightnessMin = "brightness_min";
constexpr const char *kKeyBrightnessMax = "brightness_max";
constexpr const char *kKeyScrollMs = "scroll_ms";
constexpr const char *kKeyMqttHost = "mqtt_host";
constexpr const char *kKeyMqttPort = "mqtt_port";
constexpr const char *kKeyMqttUser = "mqtt_user";
constexpr const char *kKeyMqttPassword = "mqtt_password";
constexpr const char *kKeyNtpServer = "ntp_server";
constexpr const char *kKeyUtcOffset = "utc_offset_min";
constexpr const char *kKeyMessageFg = "message_fg";
constexpr const char *kKeyMessageBg = "message_bg";

enum class TimeFormat : uint8_t { TwelveHour, TwentyFourHour };

/**
 * Canonical runtime configuration. Every string is bounded so the record has
 * a fixed footprint in RAM and flash.
 */
struct Configuration {
  TimeFormat timeFormat = CLOCK_USE_24H ? TimeFormat::TwentyFourHour : TimeFormat::TwelveHour;
  bool showSeconds = CLOCK_SHOW_SECONDS != 0;
  uint8_t brightnessMin = CLOCK_BRIGHTNESS_MIN;
  uint8_t brightnessMax = CLOCK_BRIGHTNESS_MAX;
  uint16_t scrollStepMs = CLOCK_SCROLL_STEP_MS;
  char mqttHost[kHostMax + 1] = MQTT_HOST;
  uint16_t mqttPort = MQTT_PORT;
  char mqttUser[kUserMax + 1] = MQTT_USER;
  char mqttPassword[kPasswordMax + 1] = MQTT_PASSWORD;
  char ntpServer[kNtpServerMax + 1] = NTP_SERVER;
  int16_t utcOffsetMinutes = TZ_OFFSET_MINUTES;
  char messageFg[kColorNameMax + 1] = "blue";
  char messageBg[kColorNameMax + 1] = "black";
};

/** Documented fallback used when nothing valid is stored. */
inline Configuration defaultConfiguration() { return Configuration(); }

enum class ValidationCode : uint8_t {
  None,
  Malformed,
  UnknownField,
  WrongType,
  OutOfRange,
  TooLong,
  BadEnum,
  BoundsInverted,
  Empty,
};

/** Reason a configuration record or update was rejected. */
struct ValidationError {
  ValidationCode code = ValidationCode::None;
  char field[24] = "";
};

inline const char *validationCodeName(ValidationCode code) {
  switch (code) {
    case ValidationCode::None:
      return "none";
    case ValidationCode::Malformed:
      return "malformed";
    case ValidationCode::UnknownField:
      return "unknown_field";
    case ValidationCode::WrongType:
      return "wrong_type";
    case ValidationCode::OutOfRange:
      return "out_of_range";
    case ValidationCode::TooLong:
      return "too_long";
    case ValidationCode::BadEnum:
      return "bad_enum";
    case ValidationCode::BoundsInverted:
      return "bounds_inverted";
    case ValidationCode::Empty:
      return "empty";
  }
  return "unknown";
}

/** One optional field of a partial update. */
template <typename T>
struct UpdateField {
  bool present = false;
  T value{};
  void set(const T &v) {
    present = true;
    value = v;
  }
};

/**
 * Partial configuration update as decoded from the wire. Values are kept
 * wide and unvalidated; mergeUpdate() is the only path that checks them.
 */
struct ConfigUpdate {
  UpdateField<std::string> timeFormat;
  UpdateField<bool> showSeconds;
  UpdateField<long> brightnessMin;
  UpdateField<long> brightnessMax;
  UpdateField<long> scrollStepMs;
  UpdateField<std::string> mqttHost;
  UpdateField<long> mqttPort;
  UpdateField<std::string> mqttUser;
  UpdateField<std::string> mqttPassword;
  UpdateField<std::string> ntpServer;
  UpdateField<long> utcOffsetMinutes;
  UpdateField<std::string> messageFg;
  UpdateField<std::string> messageBg;

  bool empty() const {
    return !timeFormat.present && !showSeconds.present && !brightnessMin.present &&
           !brightnessMax.present && !scrollStepMs.present && !mqttHost.present &&
           !mqttPort.present && !mqttUser.present && !mqttPassword.present &&
           !ntpServer.present && !utcOffsetMinutes.present && !messageFg.present &&
           !messageBg.present;
  }
};

/** Copies `src` into a fixed buffer, always terminating it. */
inline void copyText(char *dst, size_t cap, const char *src) {
  if (!cap) {
    return;
  }
  if (!src) {
    dst[0] = '\0';
    return;
  }
  std::strncpy(dst, src, cap - 1);
  dst[cap - 1] = '\0';
}

inline bool failValidation(ValidationError &error, ValidationCode code, const char *field) {
  error.code = code;
  copyText(error.field, sizeof(error.field), field);
  return false;
}

inline const char *timeFormatName(TimeFormat format) {
  return format == TimeFormat::TwelveHour ? "12h" : "24h";
}

inline bool parseTimeFormat(const std::string &text, TimeFormat &out) {
  if (text == "12h") {
    out = TimeFormat::TwelveHour;
    return true;
  }
  if (text == "24h") {
    out = TimeFormat::TwentyFourHour;
    return true;
  }
  return false;
}

namespace detail {

inline bool readString(JsonVariantConst value, const char *key, UpdateField<std::string> &field,
                       ValidationError &error) {
  if (!value.is<const char *>()) {
    return failValidation(error, ValidationCode::WrongType, key);
  }
  field.set(value.as<const char *>());
  return true;
}

inline bool readInteger(JsonVariantConst value, const char *key, UpdateField<long> &field,
                        ValidationError &error) {
  if (!value.is<long>()) {
    return failValidation(error, ValidationCode::WrongType, key);
  }
  field.set(value.as<long>());
  return true;
}

inline bool readBool(JsonVariantConst value, const char *key, UpdateField<bool> &field,
                     ValidationError &error) {
  if (!value.is<bool>()) {
    return failValidation(error, ValidationCode::WrongType, key);
  }
  field.set(value.as<bool>());
  return true;
}

inline bool decodeField(const char *key, JsonVariantConst value, ConfigUpdate &update,
                        ValidationError &error) {
  if (std::strcmp(key, kKeyTimeFormat) == 0) {
    return readString(value, key, update.timeFormat, error);
  }
  if (std::strcmp(key, kKeyShowSeconds) == 0) {
    return readBool(value, key, update.showSeconds, error);
  }
  if (std::strcmp(key, kKeyBrightnessMin) == 0) {
    return readInteger(value, key, update.brightnessMin, error);
  }
  if (std::strcmp(key, kKeyBrightnessMax) == 0) {
    return readInteger(value, key, update.brightnessMax, error);
  }
  if (std::strcmp(key, kKeyScrollMs) == 0) {
    return readInteger(value, key, update.scrollStepMs, error);
  }
  if (std::strcmp(key, kKeyMqttHost) == 0) {
    return readString(value, key, update.mqttHost, error);
  }
  if (std::strcmp(key, kKeyMqttPort) == 0) {
    return readInteger(value, key, update.mqttPort, error);
  }
  if (std::strcmp(key, kKeyMqttUser) == 0) {
    return readString(value, key, update.mqttUser, error);
  }
  if (std::strcmp(key, kKeyMqttPassword) == 0) {
    return readString(value, key, update.mqttPassword, error);
  }
  if (std::strcmp(key, kKeyNtpServer) == 0) {
    return readString(value, key, update.ntpServer, error);
  }
  if (std::strcmp(key, kKeyUtcOffset) == 0) {
    return readInteger(value, key, update.utcOffsetMinutes, error);
  }
  if (std::strcmp(key, kKeyMessageFg) == 0) {
    return readString(value, key, update.messageFg, error);
  }
  if (std::strcmp(key, kKeyMessageBg) == 0) {
    return readString(value, key, update.messageBg, error);
  }
  return failValidation(error, ValidationCode::UnknownField, key);
}

inline bool mergeText(const UpdateField<std::string> &field, const char *key, size_t maxLen,
                      bool allowEmpty, char *dst, size_t cap, ValidationError &error) {
  if (!field.present) {
    return true;
  }
  if (field.value.size() > maxLen) {
    return failValidation(error, ValidationCode::TooLong, key);
  }
  if (!allowEmpty && field.value.empty()) {
    return failValidation(error, ValidationCode::Empty, key);
  }
  copyText(dst, cap, field.value.c_str());
  return true;
}

inline bool mergeColor(const UpdateField<std::string> &field, const char *key, char *dst,
                       size_t cap, ValidationError &error) {
  if (!field.present) {
    return true;
  }
  Color unused;
  if (!lookupColor(field.value.c_str(), unused)) {
    return failValidation(error, ValidationCode::BadEnum, key);
  }
  copyText(dst, cap, field.value.c_str());
  return true;
}

inline bool inRange(long value, long lo, long hi) { return value >= lo && value <= hi; }

inline bool boundedString(const char *text, size_t cap) {
  return std::memchr(text, '\0', cap) != nullptr;
}

}  // namespace detail

/**
 * Checks every invariant of a complete record: bounds, lengths, enum
 * membership and brightness min <= max.
 */
inline bool validateConfiguration(const Configuration &cfg, ValidationError &error) {
  if (cfg.timeFormat != TimeFormat::TwelveHour && cfg.timeFormat != TimeFormat::TwentyFourHour) {
    return failValidation(error, ValidationCode::BadEnum, kKeyTimeFormat);
  }
  if (cfg.brightnessMin > kBrightnessCeiling) {
    return failValidation(error, ValidationCode::OutOfRange, kKeyBrightnessMin);
  }
  if (cfg.brightnessMax > kBrightnessCeiling) {
    return failValidation(error, ValidationCode::OutOfRange, kKeyBrightnessMax);
  }
  if (cfg.brightnessMin > cfg.brightnessMax) {
    return failValidation(error, ValidationCode::BoundsInverted, kKeyBrightnessMin);
  }
  if (!detail::inRange(cfg.scrollStepMs, kScrollStepMinMs, kScrollStepMaxMs)) {
    return failValidation(error, ValidationCode::OutOfRange, kKeyScrollMs);
  }
  if (cfg.mqttPort == 0) {
    return failValidation(error, ValidationCode::OutOfRange, kKeyMqttPort);
  }
  if (!detail::inRange(cfg.utcOffsetMinutes, kUtcOffsetMinMinutes, kUtcOffsetMaxMinutes)) {
    return failValidation(error, ValidationCode::OutOfRange, kKeyUtcOffset);
  }
  if (!detail::boundedString(cfg.mqttHost, sizeof(cfg.mqttHost))) {
    return failValidation(error, ValidationCode::TooLong, kKeyMqttHost);
  }
  if (!detail::boundedString(cfg.mqttUser, sizeof(cfg.mqttUser))) {
    return failValidation(error, ValidationCode::TooLong, kKeyMqttUser);
  }
  if (!detail::boundedString(cfg.mqttPassword, sizeof(cfg.mqttPassword))) {
    return failValidation(error, ValidationCode::TooLong, kKeyMqttPassword);
  }
  if (!detail::boundedString(cfg.ntpServer, sizeof(cfg.ntpServer))) {
    return failValidation(error, ValidationCode::TooLong, kKeyNtpServer);
  }
  if (!cfg.ntpServer[0]) {
    return failValidation(error, ValidationCode::Empty, kKeyNtpServer);
  }
  Color unused;
  if (!detail::boundedString(cfg.messageFg, sizeof(cfg.messageFg)) ||
      !lookupColor(cfg.messageFg, unused)) {
    return failValidation(error, ValidationCode::BadEnum, kKeyMessageFg);
  }
  if (!detail::boundedString(cfg.messageBg, sizeof(cfg.messageBg)) ||
      !lookupColor(cfg.messageBg, unused)) {
    return failValidation(error, ValidationCode::BadEnum, kKeyMessageBg);
  }
  return true;
}

/**
 * Parses a JSON object into a partial update. Only syntax, key names and
 * value types are checked here.
 */
inline bool decodeConfigUpdate(const char *json, size_t length, ConfigUpdate &out,
                               ValidationError &error) {
  StaticJsonDocument<kConfigJsonCapacity> doc;
  DeserializationError err = deserializeJson(doc, json, length);
  if (err) {
    return failValidation(error, ValidationCode::Malformed, "");
  }
  JsonObjectConst root = doc.as<JsonObjectConst>();
  if (root.isNull()) {
    return failValidation(error, ValidationCode::Malformed, "");
  }
  ConfigUpdate update;
  for (JsonPairConst kv : root) {
    if (!detail::decodeField(kv.key().c_str(), kv.value(), update, error)) {
      return false;
    }
  }
  if (update.empty()) {
    return failValidation(error, ValidationCode::Empty, "");
  }
  out = update;
  return true;
}

/**
 * Applies `update` on top of `base`, validating each present field and then
 * the merged record. `out` is only written when everything passes.
 */
inline bool mergeUpdate(const Configuration &base, const ConfigUpdate &update, Configuration &out,
                        ValidationError &error) {
  Configuration next = base;
  if (update.timeFormat.present &&
      !parseTimeFormat(update.timeFormat.value, next.timeFormat)) {
    return failValidation(error, ValidationCode::BadEnum, kKeyTimeFormat);
  }
  if (update.showSeconds.present) {
    next.showSeconds = update.showSeconds.value;
  }
  if (update.brightnessMin.present) {
    if (!detail::inRange(update.brightnessMin.value, 0, kBrightnessCeiling)) {
      return failValidation(error, ValidationCode::OutOfRange, kKeyBrightnessMin);
    }
    next.brightnessMin = static_cast<uint8_t>(update.brightnessMin.value);
  }
  if (update.brightnessMax.present) {
    if (!detail::inRange(update.brightnessMax.value, 0, kBrightnessCeiling)) {
      return failValidation(error, ValidationCode::OutOfRange, kKeyBrightnessMax);
    }
    next.brightnessMax = static_cast<uint8_t>(update.brightnessMax.value);
  }
  if (update.scrollStepMs.present) {
    if (!detail::inRange(update.scrollStepMs.value, kScrollStepMinMs, kScrollStepMaxMs)) {
      return failValidation(error, ValidationCode::OutOfRange, kKeyScrollMs);
    }
    next.scrollStepMs = static_cast<uint16_t>(update.scrollStepMs.value);
  }
  if (update.mqttPort.present) {
    if (!detail::inRange(update.mqttPort.value, 1, 65535)) {
      return failValidation(error, ValidationCode::OutOfRange, kKeyMqttPort);
    }
    next.mqttPort = static_cast<uint16_t>(update.mqttPort.value);
  }
  if (update.utcOffsetMinutes.present) {
    if (!detail::inRange(update.utcOffsetMinutes.value, kUtcOffsetMinMinutes,
                         kUtcOffsetMaxMinutes)) {
      return failValidation(error, ValidationCode::OutOfRange, kKeyUtcOffset);
    }
    next.utcOffsetMinutes = static_cast<int16_t>(update.utcOffsetMinutes.value);
  }
  if (!detail::mergeText(update.mqttHost, kKeyMqttHost, kHostMax, true, next.mqttHost,
                         sizeof(next.mqttHost), error) ||
      !detail::mergeText(update.mqttUser, kKeyMqttUser, kUserMax, true, next.mqttUser,
                         sizeof(next.mqttUser), error) ||
      !detail::mergeText(update.mqttPassword, kKeyMqttPassword, kPasswordMax, true,
                         next.mqttPassword, sizeof(next.mqttPassword), error) ||
      !detail::mergeText(update.ntpServer, kKeyNtpServer, kNtpServerMax, false, next.ntpServer,
                         sizeof(next.ntpServer), error)) {
    return false;
  }
  if (!detail::mergeColor(update.messageFg, kKeyMessageFg, next.messageFg,
                          sizeof(next.messageFg), error) ||
      !detail::mergeColor(update.messageBg, kKeyMessageBg, next.messageBg,
                          sizeof(next.messageBg), error)) {
    return false;
  }
  if (!validateConfiguration(next, error)) {
    return false;
  }
  out = next;
  return true;
}

/** Serializes every field of `cfg` as a JSON object. */
inline bool encodeConfiguration(const Configuration &cfg, std::string &out) {
  StaticJsonDocument<kConfigJsonCapacity> doc;
  doc[kKeyTimeFormat] = timeFormatName(cfg.timeFormat);
  doc[kKeyShowSeconds] = cfg.showSeconds;
  doc[kKeyBrightnessMin] = cfg.brightnessMin;
  doc[kKeyBrightnessMax] = cfg.brightnessMax;
  doc[kKeyScrollMs] = cfg.scrollStepMs;
  doc[kKeyMqttHost] = static_cast<const char *>(cfg.mqttHost);
  doc[kKeyMqttPort] = cfg.mqttPort;
  doc[kKeyMqttUser] = static_cast<const char *>(cfg.mqttUser);
  doc[kKeyMqttPassword] = static_cast<const char *>(cfg.mqttPassword);
  doc[kKeyNtpServer] = static_cast<const char *>(cfg.ntpServer);
  doc[kKeyUtcOffset] = cfg.utcOffsetMinutes;
  doc[kKeyMessageFg] = static_cast<const char *>(cfg.messageFg);
  doc[kKeyMessageBg] = static_cast<const char *>(cfg.messageBg);
  out.clear();
  return serializeJson(doc, out) > 0;
}

/**
 * Rebuilds a full record from stored JSON. Missing keys keep their defaults,
 * anything invalid rejects the whole record.
 */
inline bool decodeConfiguration(const char *json, size_t length, Configuration &out,
                                ValidationError &error) {
  ConfigUpdate update;
  if (!decodeConfigUpdate(json, length, update, error)) {
    return false;
  }
  return mergeUpdate(defaultConfiguration(), update, out, error);
}

/** Compares the fields that define the broker session. */
inline bool sameBrokerEndpoint(const Configuration &lhs, const Configuration &rhs) {
  return lhs.mqttPort == rhs.mqttPort && std::strcmp(lhs.mqttHost, rhs.mqttHost) == 0 &&
         std::strcmp(lhs.mqttUser, rhs.mqttUser) == 0 &&
         std::strcmp(lhs.mqttPassword, rhs.mqttPassword) == 0;
}

/** Builds `<base>/<suffix>`. */
inline std::string makeTopic(const char *base, const char *suffix) {
  std::string topic(base ? base : "");
  topic.reserve(topic.size() + std::strlen(suffix) + 1);
  topic += '/';
  topic += suffix;
  return topic;
}

/** Returns `<base>/config`. */
inline std::string topic_config(const char *base) { return makeTopic(base, "config"); }
/** Returns `<base>/message`. */
inline std::string topic_message(const char *base) { return makeTopic(base, "message"); }
/** Returns `<base>/command`. */
inline std::string topic_command(const char *base) { return makeTopic(base, "command"); }
/** Returns `<base>/status`. */
inline std::string topic_status(const char *base) { return makeTopic(base, "status"); }

/** Retained presence payload published right after connecting. */
inline bool encodeOnlineStatus(const Configuration &cfg, uint32_t revision, std::string &out) {
  StaticJsonDocument<kStatusJsonCapacity> doc;
  doc["state"] = "online";
  doc["revision"] = revision;
  doc[kKeyTimeFormat] = timeFormatName(cfg.timeFormat);
  doc[kKeyUtcOffset] = cfg.utcOffsetMinutes;
  out.clear();
  return serializeJson(doc, out) > 0;
}

/** Acknowledges a committed configuration update. */
inline bool encodeAppliedStatus(uint32_t revision, std::string &out) {
  StaticJsonDocument<kStatusJsonCapacity> doc;
  doc["state"] = "applied";
  doc["revision"] = revision;
  out.clear();
  return serializeJson(doc, out) > 0;
}

/** Reports a rejected payload back to whoever sent it. */
inline bool encodeErrorStatus(const char *source, const ValidationError &error,
                              std::string &out) {
  StaticJsonDocument<kStatusJsonCapacity> doc;
  doc["state"] = "error";
  doc["source"] = source;
  doc["code"] = validationCodeName(error.code);
  if (error.field[0]) {
    doc["field"] = static_cast<const char *>(error.field);
  }
  out.clear();
  return serializeJson(doc, out) > 0;
}

/**
 * Scroll request decoded from the message topic. Empty color names mean
 * "use the configured default".
 */
struct MessageRequest {
  std::string text;
  std::string foreground;
  std::string background;
  uint8_t repeat = 1;
};

/**
 * Accepts either plain text or `{"message": ..., "foreground": ...,
 * "background": ..., "repeat": n}`. Payloads that look like JSON but do not
 * parse as an object with a `message` string are shown verbatim. A JSON
 * payload too large to decode is rejected rather than shown as raw JSON.
 */
inline bool decodeMessageRequest(const char *payload, size_t length, MessageRequest &out) {
  out = MessageRequest();
  if (length && payload[0] == '{') {
    StaticJsonDocument<kMessageJsonCapacity> doc;
    DeserializationError err = deserializeJson(doc, payload, length);
    if (err == DeserializationError::NoMemory) {
      return false;
    }
    if (!err && doc["message"].is<const char *>()) {
      out.text = doc["message"].as<const char *>();
      out.foreground = doc["foreground"] | "";
      out.background = doc["background"] | "";
      long repeat = doc["repeat"] | 1L;
      if (repeat < 1) {
        repeat = 1;
      } else if (repeat > kRepeatMax) {
        repeat = kRepeatMax;
      }
      out.repeat = static_cast<uint8_t>(repeat);
      return !out.text.empty();
    }
  }
  out.text.assign(payload, length);
  return !out.text.empty();
}

enum class Command : uint8_t { Unknown, Sync };

/** Accepts `sync` or `{"type":"sync"}` on the command topic. */
inline Command decodeCommand(const char *payload, size_t length) {
  std::string text(payload, length);
  if (text == "sync") {
    return Command::Sync;
  }
  StaticJsonDocument<kStatusJsonCapacity> doc;
  if (deserializeJson(doc, payload, length)) {
    return Command::Unknown;
  }
  const char *type = doc["type"] | "";
  if (std::strcmp(type, "sync") == 0) {
    return Command::Sync;
  }
  return Command::Unknown;
}

}  // namespace contracts
}  // namespace matrixclock
