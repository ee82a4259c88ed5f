#pragma once

#include <cstdint>

#include "clock_settings.hpp"
#include "config_store.hpp"
#include "task.hpp"

namespace matrixclock {

/** Raw ambient-light ADC read. */
class LightSensorDriver {
 public:
  virtual ~LightSensorDriver() = default;
  virtual bool read(uint16_t &raw) = 0;
};

struct BrightnessSample {
  uint16_t raw = 0;
  float smoothed = 0.0f;
  uint8_t level = kBootBrightness;
  bool valid = false;
};

/**
 * Maps a smoothed reading onto the configured brightness window: normalized
 * over the sensor's usable raw range, then interpolated and clamped.
 */
uint8_t mapBrightness(float smoothedRaw, uint8_t minLevel, uint8_t maxLevel);

/**
 * Samples the sensor on a fixed cadence and keeps an exponentially smoothed
 * brightness level for the renderer.
 */
class LightSensor : public Task {
 public:
  LightSensor(LightSensorDriver &driver, const ConfigStore &config)
      : driver_(driver), config_(config) {}

  /** Takes one reading. Returns false when the driver read failed. */
  bool sample();

  const BrightnessSample &latest() const { return sample_; }
  uint8_t level() const { return sample_.level; }
  uint8_t readFailures() const { return readFailures_; }

  const char *name() const override { return "light"; }
  TaskStep step(uint32_t now) override;
  void restart(uint32_t now) override;

 private:
  LightSensorDriver &driver_;
  const ConfigStore &config_;
  BrightnessSample sample_;
  uint8_t readFailures_ = 0;
  uint8_t boundsMin_ = 0;
  uint8_t boundsMax_ = 0;
};

}  // namespace matrixclock
