#pragma once

#include <cstddef>
#include <cstdint>

#include "civil_time.hpp"
#include "clock_source.hpp"
#include "config_store.hpp"
#include "frame.hpp"
#include "light_sensor.hpp"
#include "message_queue.hpp"
#include "task.hpp"

namespace matrixclock {

/** Formats the clock face text for `local` ("14:05", "2:05", "14:05:09"). */
void formatClockText(const LocalTime &local, const contracts::Configuration &cfg, char *out,
                     size_t cap);

/**
 * Fills the per-column background with the time-of-day gradient: a deep hue
 * at midnight swinging to a bright one at midday, mirrored around the
 * center column.
 */
void fillDayGradient(uint32_t millisOfDay, Color (&columns)[kMatrixWidth]);

/**
 * Composes a frame every tick from the latest state of the other components
 * and hands it to the display. It never touches the network or the sensor.
 *
 * A message that fits is held centered for kMessageFitHoldMs before it
 * scrolls off to the left. A longer one starts flush left and pauses
 * kMessageEdgeHoldMs at the start and again when its end reaches the right
 * edge. A clock face wider than the matrix (seconds on a narrow panel) pans
 * back and forth.
 */
class Renderer : public Task {
 public:
  Renderer(DisplayDriver &display, const ClockSource &clock, const ConfigStore &config,
           MessageQueue &queue, const LightSensor &light)
      : display_(display), clock_(clock), config_(config), queue_(queue), light_(light) {}

  /** Builds the frame for `now`, advancing any scrolling message. */
  void compose(uint32_t now, Frame &out);

  const Frame &lastFrame() const { return frame_; }
  uint32_t frames() const { return frames_; }

  const char *name() const override { return "render"; }
  TaskStep step(uint32_t now) override;
  void restart(uint32_t now) override;
  bool restartable() const override { return false; }

 private:
  bool composeMessage(uint32_t now, const contracts::Configuration &cfg, Frame &out);
  void composeClock(uint32_t now, const contracts::Configuration &cfg, Frame &out);
  void startPass(uint32_t now, int16_t width);
  int16_t panClock(uint32_t now, const contracts::Configuration &cfg, int16_t width);

  DisplayDriver &display_;
  const ClockSource &clock_;
  const ConfigStore &config_;
  MessageQueue &queue_;
  const LightSensor &light_;
  Frame frame_{};
  uint32_t frames_ = 0;
  uint32_t activeId_ = 0;
  int16_t scrollX_ = 0;
  uint8_t passes_ = 0;
  uint32_t lastScrollMs_ = 0;
  uint32_t holdUntilMs_ = 0;
  bool holding_ = false;
  int16_t clockX_ = 0;
  int8_t clockStep_ = -1;
  uint32_t lastClockPanMs_ = 0;
  uint32_t clockHoldUntilMs_ = 0;
  bool clockHolding_ = false;
  bool clockPanning_ = false;
};

}  // namespace matrixclock
