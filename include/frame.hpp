#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include "clock_settings.hpp"
#include "color.hpp"
#include "message_queue.hpp"

namespace matrixclock {

/** Horizontal advance of one glyph in the Adafruit GFX built-in 5x7 font. */
constexpr int16_t kGlyphAdvance = 6;

enum class FrameMarker : uint8_t { None, Unset, Stale };

/**
 * One composed picture: a background color per column (constant over the
 * matrix height), a single run of text, an optional status marker pixel and
 * a global brightness (0..100).
 */
struct Frame {
  Color background[kMatrixWidth];
  char text[kMessageTextMax + 1];
  int16_t textX;
  int16_t textY;
  Color textColor;
  bool outlined;
  Color outlineColor;
  FrameMarker marker;
  Color markerColor;
  uint8_t brightness;
  uint32_t sequence;
};

/** Pixel width of `text` as drawn, without the trailing blank column. */
inline int16_t textPixelWidth(const char *text) {
  size_t length = std::strlen(text);
  return length ? static_cast<int16_t>(length * kGlyphAdvance - 1) : 0;
}

/** Paints frames onto the physical matrix. Must not block. */
class DisplayDriver {
 public:
  virtual ~DisplayDriver() = default;
  virtual void present(const Frame &frame) = 0;
};

}  // namespace matrixclock
