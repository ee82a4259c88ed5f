#pragma once

#include <Arduino.h>

#include "config.h"
#include "light_sensor.hpp"

#ifndef LIGHT_SENSOR_PIN
#define LIGHT_SENSOR_PIN A0
#endif

/** Photoresistor divider on the ESP8266 ADC (0-1023). */
class AnalogLightSensor : public matrixclock::LightSensorDriver {
 public:
  void begin() { pinMode(LIGHT_SENSOR_PIN, INPUT); }

  bool read(uint16_t &raw) override {
    int value = analogRead(LIGHT_SENSOR_PIN);
    if (value < 0 || value > kAdcMax) {
      return false;
    }
    raw = static_cast<uint16_t>(value);
    return true;
  }

 private:
  static constexpr int kAdcMax = 1023;
};
