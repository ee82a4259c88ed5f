#pragma once

#include <cstddef>
#include <cstdint>

#include "config.h"

#ifndef MQTT_HOST
#define MQTT_HOST ""
#endif
#ifndef MQTT_PORT
#define MQTT_PORT 1883
#endif
#ifndef MQTT_USER
#define MQTT_USER ""
#endif
#ifndef MQTT_PASSWORD
#define MQTT_PASSWORD ""
#endif
#ifndef MQTT_CLIENT_ID
#define MQTT_CLIENT_ID "matrix-clock"
#endif
#ifndef MQTT_TOPIC_BASE
#define MQTT_TOPIC_BASE "matrixclock"
#endif
#ifndef MQTT_KEEPALIVE_SEC
#define MQTT_KEEPALIVE_SEC 15
#endif
#ifndef MQTT_SOCKET_TIMEOUT_SEC
#define MQTT_SOCKET_TIMEOUT_SEC 1
#endif
#ifndef MQTT_CONNECT_TIMEOUT_MS
#define MQTT_CONNECT_TIMEOUT_MS 500
#endif
#ifndef NET_DNS_TIMEOUT_MS
#define NET_DNS_TIMEOUT_MS 500
#endif
#ifndef MQTT_BACKOFF_FLOOR_MS
#define MQTT_BACKOFF_FLOOR_MS 1000
#endif
#ifndef MQTT_BACKOFF_CAP_MS
#define MQTT_BACKOFF_CAP_MS 30000
#endif
#ifndef MQTT_BACKOFF_JITTER_MS
#define MQTT_BACKOFF_JITTER_MS 250
#endif

#ifndef NTP_SERVER
#define NTP_SERVER "pool.ntp.org"
#endif
#ifndef NTP_PORT
#define NTP_PORT 123
#endif
#ifndef NTP_RESYNC_INTERVAL_MS
#define NTP_RESYNC_INTERVAL_MS 3600000UL
#endif
#ifndef NTP_RESPONSE_TIMEOUT_MS
#define NTP_RESPONSE_TIMEOUT_MS 1500
#endif
#ifndef NTP_RETRY_FLOOR_MS
#define NTP_RETRY_FLOOR_MS 2000
#endif
#ifndef NTP_RETRY_CAP_MS
#define NTP_RETRY_CAP_MS 300000UL
#endif
#ifndef NTP_STALE_AFTER_FAILURES
#define NTP_STALE_AFTER_FAILURES 3
#endif
#ifndef TZ_OFFSET_MINUTES
#define TZ_OFFSET_MINUTES 0
#endif

#ifndef CLOCK_USE_24H
#define CLOCK_USE_24H 1
#endif
#ifndef CLOCK_SHOW_SECONDS
#define CLOCK_SHOW_SECONDS 0
#endif
#ifndef CLOCK_BRIGHTNESS_MIN
#define CLOCK_BRIGHTNESS_MIN 5
#endif
#ifndef CLOCK_BRIGHTNESS_MAX
#define CLOCK_BRIGHTNESS_MAX 80
#endif
#ifndef CLOCK_BOOT_BRIGHTNESS
#define CLOCK_BOOT_BRIGHTNESS 40
#endif
#ifndef CLOCK_SCROLL_STEP_MS
#define CLOCK_SCROLL_STEP_MS 50
#endif
#ifndef CLOCK_FRAME_INTERVAL_MS
#define CLOCK_FRAME_INTERVAL_MS 50
#endif
#ifndef CLOCK_MESSAGE_QUEUE_CAPACITY
#define CLOCK_MESSAGE_QUEUE_CAPACITY 8
#endif
#ifndef CLOCK_PERSIST_INTERVAL_MS
#define CLOCK_PERSIST_INTERVAL_MS 250
#endif
#ifndef CLOCK_PERSIST_RETRY_MS
#define CLOCK_PERSIST_RETRY_MS 5000
#endif
#ifndef CLOCK_PERSIST_FAULT_LIMIT
#define CLOCK_PERSIST_FAULT_LIMIT 5
#endif

#ifndef MATRIX_WIDTH
#define MATRIX_WIDTH 32
#endif
#ifndef MATRIX_HEIGHT
#define MATRIX_HEIGHT 8
#endif

#ifndef LIGHT_SENSOR_RAW_MIN
#define LIGHT_SENSOR_RAW_MIN 4
#endif
#ifndef LIGHT_SENSOR_RAW_MAX
#define LIGHT_SENSOR_RAW_MAX 900
#endif
#ifndef LIGHT_SENSOR_SAMPLE_INTERVAL_MS
#define LIGHT_SENSOR_SAMPLE_INTERVAL_MS 100
#endif
#ifndef LIGHT_SENSOR_SMOOTHING_PERCENT
#define LIGHT_SENSOR_SMOOTHING_PERCENT 35
#endif

static_assert(CLOCK_BRIGHTNESS_MIN <= CLOCK_BRIGHTNESS_MAX,
              "CLOCK_BRIGHTNESS_MIN must not exceed CLOCK_BRIGHTNESS_MAX");
static_assert(CLOCK_BRIGHTNESS_MAX <= 100, "CLOCK_BRIGHTNESS_MAX must be between 0 and 100");
static_assert(LIGHT_SENSOR_RAW_MIN < LIGHT_SENSOR_RAW_MAX,
              "LIGHT_SENSOR_RAW_MIN must be below LIGHT_SENSOR_RAW_MAX");
static_assert(LIGHT_SENSOR_SMOOTHING_PERCENT > 0 && LIGHT_SENSOR_SMOOTHING_PERCENT <= 100,
              "LIGHT_SENSOR_SMOOTHING_PERCENT must be between 1 and 100");
static_assert(CLOCK_MESSAGE_QUEUE_CAPACITY > 0 && CLOCK_MESSAGE_QUEUE_CAPACITY <= 16,
              "CLOCK_MESSAGE_QUEUE_CAPACITY must be between 1 and 16");
static_assert(MQTT_SOCKET_TIMEOUT_SEC >= 1 && MQTT_SOCKET_TIMEOUT_SEC <= 2,
              "MQTT_SOCKET_TIMEOUT_SEC must be 1 or 2");
static_assert(MATRIX_WIDTH > 0 && MATRIX_WIDTH <= 64, "MATRIX_WIDTH must be between 1 and 64");

namespace matrixclock {

constexpr uint16_t kMqttKeepAliveSec = MQTT_KEEPALIVE_SEC;
constexpr uint16_t kMqttSocketTimeoutSec = MQTT_SOCKET_TIMEOUT_SEC;
constexpr uint32_t kMqttBackoffFloorMs = MQTT_BACKOFF_FLOOR_MS;
constexpr uint32_t kMqttBackoffCapMs = MQTT_BACKOFF_CAP_MS;
constexpr uint32_t kMqttBackoffJitterMs = MQTT_BACKOFF_JITTER_MS;
constexpr uint32_t kMqttConnectTimeoutMs = MQTT_CONNECT_TIMEOUT_MS;
constexpr uint32_t kMqttServiceIntervalMs = 20;

constexpr uint32_t kDnsTimeoutMs = NET_DNS_TIMEOUT_MS;
/** How often links look again while the station has no network. */
constexpr uint32_t kNetworkPollIntervalMs = 250;

constexpr uint16_t kNtpPort = NTP_PORT;
constexpr uint32_t kNtpResyncIntervalMs = NTP_RESYNC_INTERVAL_MS;
constexpr uint32_t kNtpResponseTimeoutMs = NTP_RESPONSE_TIMEOUT_MS;
constexpr uint32_t kNtpRetryFloorMs = NTP_RETRY_FLOOR_MS;
constexpr uint32_t kNtpRetryCapMs = NTP_RETRY_CAP_MS;
constexpr uint8_t kNtpStaleAfterFailures = NTP_STALE_AFTER_FAILURES;
constexpr uint32_t kNtpPollIntervalMs = 20;

constexpr uint8_t kBootBrightness = CLOCK_BOOT_BRIGHTNESS;
constexpr uint32_t kFrameIntervalMs = CLOCK_FRAME_INTERVAL_MS;
constexpr size_t kMessageQueueCapacity = CLOCK_MESSAGE_QUEUE_CAPACITY;
constexpr uint32_t kMessageFitHoldMs = 3000;
constexpr uint32_t kMessageEdgeHoldMs = 1000;
constexpr uint32_t kClockPanHoldMs = 1000;
constexpr uint32_t kPersistIntervalMs = CLOCK_PERSIST_INTERVAL_MS;
constexpr uint32_t kPersistRetryMs = CLOCK_PERSIST_RETRY_MS;
constexpr uint8_t kPersistFaultLimit = CLOCK_PERSIST_FAULT_LIMIT;

constexpr uint8_t kMatrixWidth = MATRIX_WIDTH;
constexpr uint8_t kMatrixHeight = MATRIX_HEIGHT;

constexpr uint16_t kLightRawMin = LIGHT_SENSOR_RAW_MIN;
constexpr uint16_t kLightRawMax = LIGHT_SENSOR_RAW_MAX;
constexpr uint32_t kLightSampleIntervalMs = LIGHT_SENSOR_SAMPLE_INTERVAL_MS;
constexpr float kLightSmoothingAlpha = LIGHT_SENSOR_SMOOTHING_PERCENT / 100.0f;
constexpr uint8_t kLightLevelHysteresis = 2;
constexpr uint8_t kLightReadFaultLimit = 5;

constexpr uint32_t kTaskRestartDelayMs = 1000;

constexpr const char *kConfigRecordName = "/clock.cfg";
constexpr const char *kConfigStagingName = "/clock.cfg.tmp";

}  // namespace matrixclock
