#pragma once

/**
 * Copy this file to include/config.h and edit the values to match your
 * network and matrix wiring before flashing the clock firmware.
 */

// Wi-Fi credentials for the clock.
#define WIFI_SSID "ChangeMe"
#define WIFI_PASS "ChangeMeToo"
#define WIFI_HOSTNAME "matrix-clock"

// MQTT broker defaults. Runtime updates on <base>/config override these.
#define MQTT_HOST "192.168.1.50"
#define MQTT_PORT 1883
#define MQTT_USER ""
#define MQTT_PASSWORD ""
#define MQTT_CLIENT_ID "matrix-clock"
#define MQTT_TOPIC_BASE "matrixclock"

// Timekeeping. Offset is minutes relative to UTC.
#define NTP_SERVER "pool.ntp.org"
#define TZ_OFFSET_MINUTES 0

// Display defaults.
#define CLOCK_USE_24H 1
#define CLOCK_SHOW_SECONDS 0
#define CLOCK_BRIGHTNESS_MIN 5
#define CLOCK_BRIGHTNESS_MAX 80
#define CLOCK_SCROLL_STEP_MS 50

// Matrix wiring (NeoMatrix, zig-zag rows starting top-left).
#define MATRIX_PIN D6
#define MATRIX_WIDTH 32
#define MATRIX_HEIGHT 8

// Ambient light sensor on the ADC.
#define LIGHT_SENSOR_PIN A0
