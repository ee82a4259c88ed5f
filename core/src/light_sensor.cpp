#include "light_sensor.hpp"

#include "clock_log.hpp"
#include "clock_settings.hpp"

namespace matrixclock {

uint8_t mapBrightness(float smoothedRaw, uint8_t minLevel, uint8_t maxLevel) {
  float span = static_cast<float>(kLightRawMax - kLightRawMin);
  float ratio = (smoothedRaw - static_cast<float>(kLightRawMin)) / span;
  if (ratio < 0.0f) {
    ratio = 0.0f;
  } else if (ratio > 1.0f) {
    ratio = 1.0f;
  }
  float level = minLevel + ratio * static_cast<float>(maxLevel - minLevel);
  int rounded = static_cast<int>(level + 0.5f);
  if (rounded < minLevel) {
    rounded = minLevel;
  } else if (rounded > maxLevel) {
    rounded = maxLevel;
  }
  return static_cast<uint8_t>(rounded);
}

bool LightSensor::sample() {
  uint16_t raw = 0;
  if (!driver_.read(raw)) {
    return false;
  }
  sample_.raw = raw;
  if (!sample_.valid) {
    sample_.smoothed = raw;
  } else {
    sample_.smoothed += kLightSmoothingAlpha * (static_cast<float>(raw) - sample_.smoothed);
  }

  contracts::Configuration cfg = config_.current();
  uint8_t target = mapBrightness(sample_.smoothed, cfg.brightnessMin, cfg.brightnessMax);
  bool boundsMoved = cfg.brightnessMin != boundsMin_ || cfg.brightnessMax != boundsMax_;
  int delta = static_cast<int>(target) - static_cast<int>(sample_.level);
  if (delta < 0) {
    delta = -delta;
  }
  // Small wobbles are ignored, but the window edges are always reachable.
  if (!sample_.valid || boundsMoved || delta >= kLightLevelHysteresis ||
      target == cfg.brightnessMin || target == cfg.brightnessMax) {
    sample_.level = target;
  }
  boundsMin_ = cfg.brightnessMin;
  boundsMax_ = cfg.brightnessMax;
  sample_.valid = true;
  return true;
}

TaskStep LightSensor::step(uint32_t now) {
  (void)now;
  if (sample()) {
    readFailures_ = 0;
    return TaskStep::ok(kLightSampleIntervalMs);
  }
  ++readFailures_;
  logf("light", "read failed (%u in a row)", readFailures_);
  if (readFailures_ >= kLightReadFaultLimit) {
    return TaskStep::fault();
  }
  return TaskStep::ok(kLightSampleIntervalMs);
}

void LightSensor::restart(uint32_t now) {
  (void)now;
  uint8_t keep = sample_.level;
  sample_ = BrightnessSample();
  sample_.level = keep;
  readFailures_ = 0;
}

}  // namespace matrixclock
