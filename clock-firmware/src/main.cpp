#include <Arduino.h>
#include <ESP8266WiFi.h>
#include <LittleFS.h>

#include "analog_light_sensor.hpp"
#include "backoff.hpp"
#include "clock_log.hpp"
#include "clock_runtime.hpp"
#include "clock_settings.hpp"
#include "config.h"
#include "littlefs_storage.hpp"
#include "neomatrix_display.hpp"
#include "pubsub_mqtt_client.hpp"
#include "wifi_udp_channel.hpp"

namespace {

constexpr matrixclock::BackoffPolicy kWifiRetryPolicy = {5000, 60000, 500};
constexpr uint32_t kLoopIdleCapMs = 5;

uint32_t arduinoRandom(uint32_t bound) { return static_cast<uint32_t>(random(bound)); }

void serialSink(const char *line) { Serial.println(line); }

LittleFsStorage storage;
WifiUdpChannel udp;
PubSubMqttClient mqttClient;
AnalogLightSensor lightDriver;
NeoMatrixDisplay display;
matrixclock::ClockRuntime runtime(storage, udp, mqttClient, lightDriver, display, arduinoRandom);

matrixclock::Backoff wifiBackoff(kWifiRetryPolicy, arduinoRandom);
bool wifiAnnounced = false;

/** Prints the current Wi-Fi association details. */
void logWifiSnapshot(const char *prefix) {
  matrixclock::logf("wifi", "%s status=%d ip=%s rssi=%d", prefix, static_cast<int>(WiFi.status()),
                    WiFi.localIP().toString().c_str(), static_cast<int>(WiFi.RSSI()));
}

/**
 * Keeps Wi-Fi associated without blocking the frame loop: the station
 * reconnects on its own, and a fresh begin() is issued on a backoff when it
 * stays down.
 */
void maintainWifi(uint32_t now) {
  if (WiFi.status() == WL_CONNECTED) {
    wifiBackoff.reset();
    if (!wifiAnnounced) {
      logWifiSnapshot("connected");
      wifiAnnounced = true;
    }
    return;
  }
  if (wifiAnnounced) {
    logWifiSnapshot("lost");
    wifiAnnounced = false;
  }
  if (!wifiBackoff.armed()) {
    wifiBackoff.schedule(now);
    return;
  }
  if (!wifiBackoff.ready(now)) {
    return;
  }
  matrixclock::logf("wifi", "reconnecting to %s", WIFI_SSID);
  WiFi.disconnect(false);
  WiFi.begin(WIFI_SSID, WIFI_PASS);
  wifiBackoff.schedule(now);
}

}  // namespace

void setup() {
  Serial.begin(115200);
  delay(100);
  matrixclock::setLogSink(serialSink);
  matrixclock::logf("boot", "matrix clock starting");
  randomSeed(ESP.getChipId());

  display.begin();
  lightDriver.begin();
  if (!storage.begin()) {
    matrixclock::logf("fs", "storage unavailable, running on defaults");
  }

  WiFi.mode(WIFI_STA);
  WiFi.setSleepMode(WIFI_NONE_SLEEP);
  WiFi.persistent(false);
  WiFi.setAutoReconnect(true);
#ifdef WIFI_HOSTNAME
  WiFi.hostname(WIFI_HOSTNAME);
#endif
  WiFi.begin(WIFI_SSID, WIFI_PASS);

  runtime.begin(millis());
}

/** Services Wi-Fi and runs one scheduler pass. */
void loop() {
  uint32_t now = millis();
  maintainWifi(now);
  uint32_t idle = runtime.runOnce(now);
  delay(idle < kLoopIdleCapMs ? idle : kLoopIdleCapMs);
}
