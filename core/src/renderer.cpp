#include "renderer.hpp"

#include <cmath>
#include <cstdio>

#include "clock_log.hpp"

namespace matrixclock {

namespace {

constexpr float kMiddayHue = 1.1f;
constexpr float kMidnightHue = 0.8f;
constexpr float kHueOffset = -0.1f;
constexpr float kMiddaySaturation = 1.0f;
constexpr float kMidnightSaturation = 1.0f;
constexpr float kMiddayValue = 0.8f;
constexpr float kMidnightValue = 0.3f;
constexpr float kTwoPi = 6.28318530718f;

constexpr Color kMarkerUnset = kRed;
constexpr Color kMarkerStale = kYellow;

float lerp(float from, float to, float t) { return from + (to - from) * t; }

}  // namespace

void formatClockText(const LocalTime &local, const contracts::Configuration &cfg, char *out,
                     size_t cap) {
  unsigned hour = local.hour;
  if (cfg.timeFormat == contracts::TimeFormat::TwelveHour) {
    hour %= 12;
    if (hour == 0) {
      hour = 12;
    }
  }
  const char *pattern24 = cfg.showSeconds ? "%02u:%02u:%02u" : "%02u:%02u";
  const char *pattern12 = cfg.showSeconds ? "%u:%02u:%02u" : "%u:%02u";
  const char *pattern =
      cfg.timeFormat == contracts::TimeFormat::TwelveHour ? pattern12 : pattern24;
  std::snprintf(out, cap, pattern, hour, static_cast<unsigned>(local.minute),
                static_cast<unsigned>(local.second));
}

void fillDayGradient(uint32_t millisOfDay, Color (&columns)[kMatrixWidth]) {
  float throughDay = static_cast<float>(millisOfDay) / 86400000.0f;
  float toMidday = 1.0f - (std::cos(throughDay * kTwoPi) + 1.0f) / 2.0f;
  float hue = lerp(kMidnightHue, kMiddayHue, toMidday);
  float sat = lerp(kMidnightSaturation, kMiddaySaturation, toMidday);
  float val = lerp(kMidnightValue, kMiddayValue, toMidday);

  // Edges carry the start hue, the center column the shifted end hue.
  const int half = kMatrixWidth / 2;
  for (int x = 0; x < half; ++x) {
    float t = static_cast<float>(x) / static_cast<float>(half);
    Color c = colorFromHsv(lerp(hue, hue + kHueOffset, t), sat, val);
    columns[x] = c;
    columns[kMatrixWidth - x - 1] = c;
  }
  columns[half] = colorFromHsv(hue + kHueOffset, sat, val);
}

void Renderer::startPass(uint32_t now, int16_t width) {
  bool fits = width <= kMatrixWidth;
  scrollX_ = fits ? static_cast<int16_t>((kMatrixWidth - width) / 2) : 0;
  holdUntilMs_ = now + (fits ? kMessageFitHoldMs : kMessageEdgeHoldMs);
  holding_ = true;
}

bool Renderer::composeMessage(uint32_t now, const contracts::Configuration &cfg, Frame &out) {
  const ScrollMessage *active = queue_.peekActive();
  if (!active) {
    activeId_ = 0;
    return false;
  }
  int16_t width = textPixelWidth(active->text);
  if (active->id != activeId_) {
    activeId_ = active->id;
    passes_ = 0;
    startPass(now, width);
  } else if (holding_) {
    if (static_cast<int32_t>(now - holdUntilMs_) >= 0) {
      holding_ = false;
      lastScrollMs_ = now;
    }
  } else if (now - lastScrollMs_ >= cfg.scrollStepMs) {
    --scrollX_;
    lastScrollMs_ = now;
    if (width > kMatrixWidth && scrollX_ == kMatrixWidth - width) {
      holdUntilMs_ = now + kMessageEdgeHoldMs;
      holding_ = true;
    } else if (scrollX_ <= -width) {
      ++passes_;
      if (passes_ >= active->repeat) {
        queue_.advance();
        activeId_ = 0;
        return composeMessage(now, cfg, out);
      }
      startPass(now, width);
    }
  }

  for (uint8_t x = 0; x < kMatrixWidth; ++x) {
    out.background[x] = active->background;
  }
  contracts::copyText(out.text, sizeof(out.text), active->text);
  out.textX = scrollX_;
  out.textColor = active->foreground;
  out.outlined = false;
  clockPanning_ = false;
  return true;
}

int16_t Renderer::panClock(uint32_t now, const contracts::Configuration &cfg, int16_t width) {
  // Sweeps between the left and right edges, pausing at each end.
  int16_t leftmost = static_cast<int16_t>(kMatrixWidth - width);
  if (!clockPanning_) {
    clockPanning_ = true;
    clockX_ = 0;
    clockStep_ = -1;
    clockHoldUntilMs_ = now + kClockPanHoldMs;
    clockHolding_ = true;
  } else if (clockHolding_) {
    if (static_cast<int32_t>(now - clockHoldUntilMs_) >= 0) {
      clockHolding_ = false;
      lastClockPanMs_ = now;
    }
  } else if (now - lastClockPanMs_ >= cfg.scrollStepMs) {
    clockX_ = static_cast<int16_t>(clockX_ + clockStep_);
    lastClockPanMs_ = now;
    if (clockX_ <= leftmost || clockX_ >= 0) {
      clockX_ = clockX_ <= leftmost ? leftmost : 0;
      clockStep_ = static_cast<int8_t>(-clockStep_);
      clockHoldUntilMs_ = now + kClockPanHoldMs;
      clockHolding_ = true;
    }
  }
  return clockX_;
}

void Renderer::composeClock(uint32_t now, const contracts::Configuration &cfg, Frame &out) {
  Timestamp ts;
  if (clock_.now(now, ts)) {
    LocalTime local = toLocalTime(ts.epochMs, cfg.utcOffsetMinutes);
    formatClockText(local, cfg, out.text, sizeof(out.text));
    fillDayGradient(local.millisOfDay, out.background);
  } else {
    contracts::copyText(out.text, sizeof(out.text), cfg.showSeconds ? "--:--:--" : "--:--");
    fillDayGradient(0, out.background);
  }
  int16_t width = textPixelWidth(out.text);
  if (width <= kMatrixWidth) {
    clockPanning_ = false;
    out.textX = static_cast<int16_t>((kMatrixWidth - width) / 2);
  } else {
    out.textX = panClock(now, cfg, width);
  }
  out.textColor = kWhite;
  out.outlined = true;
  out.outlineColor = kBlack;
}

void Renderer::compose(uint32_t now, Frame &out) {
  contracts::Configuration cfg = config_.current();
  out.textY = 0;
  if (!composeMessage(now, cfg, out)) {
    composeClock(now, cfg, out);
  }

  switch (clock_.state()) {
    case SyncState::Unset:
    case SyncState::Failed:
      out.marker = FrameMarker::Unset;
      out.markerColor = kMarkerUnset;
      break;
    case SyncState::Stale:
      out.marker = FrameMarker::Stale;
      out.markerColor = kMarkerStale;
      break;
    case SyncState::Synced:
      out.marker = FrameMarker::None;
      out.markerColor = kBlack;
      break;
  }
  out.brightness = light_.level();
  out.sequence = ++frames_;
}

TaskStep Renderer::step(uint32_t now) {
  compose(now, frame_);
  display_.present(frame_);
  return TaskStep::ok(kFrameIntervalMs);
}

void Renderer::restart(uint32_t now) {
  (void)now;
  activeId_ = 0;
  passes_ = 0;
  holding_ = false;
  clockPanning_ = false;
  logf("render", "scroll state reset");
}

}  // namespace matrixclock
