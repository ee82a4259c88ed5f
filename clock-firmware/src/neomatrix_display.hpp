#pragma once

#include <Adafruit_GFX.h>
#include <Adafruit_NeoMatrix.h>
#include <Adafruit_NeoPixel.h>
#include <Arduino.h>

#include "config.h"
#include "frame.hpp"

#ifndef MATRIX_PIN
#define MATRIX_PIN D6
#endif
#ifndef MATRIX_LAYOUT
#define MATRIX_LAYOUT (NEO_MATRIX_TOP + NEO_MATRIX_LEFT + NEO_MATRIX_ROWS + NEO_MATRIX_ZIGZAG)
#endif

/**
 * Paints frames on a WS2812 matrix through Adafruit NeoMatrix, using the
 * GFX built-in font for text.
 */
class NeoMatrixDisplay : public matrixclock::DisplayDriver {
 public:
  NeoMatrixDisplay()
      : matrix_(matrixclock::kMatrixWidth, matrixclock::kMatrixHeight, MATRIX_PIN, MATRIX_LAYOUT,
                NEO_GRB + NEO_KHZ800) {}

  void begin() {
    matrix_.begin();
    matrix_.setTextWrap(false);
    matrix_.setTextSize(1);
    matrix_.setBrightness(scaleBrightness(matrixclock::kBootBrightness));
    matrix_.fillScreen(0);
    matrix_.show();
  }

  void present(const matrixclock::Frame &frame) override {
    matrix_.setBrightness(scaleBrightness(frame.brightness));
    for (int16_t x = 0; x < matrixclock::kMatrixWidth; ++x) {
      matrix_.drawFastVLine(x, 0, matrixclock::kMatrixHeight, pack(frame.background[x]));
    }
    if (frame.outlined) {
      static const int8_t kOffsets[][2] = {{-1, -1}, {0, -1}, {1, -1}, {-1, 0},
                                           {1, 0},   {-1, 1}, {0, 1},  {1, 1}};
      matrix_.setTextColor(pack(frame.outlineColor));
      for (const auto &offset : kOffsets) {
        matrix_.setCursor(frame.textX + offset[0], frame.textY + offset[1]);
        matrix_.print(frame.text);
      }
    }
    matrix_.setTextColor(pack(frame.textColor));
    matrix_.setCursor(frame.textX, frame.textY);
    matrix_.print(frame.text);
    if (frame.marker != matrixclock::FrameMarker::None) {
      matrix_.drawPixel(matrixclock::kMatrixWidth - 1, 0, pack(frame.markerColor));
    }
    matrix_.show();
  }

 private:
  static uint8_t scaleBrightness(uint8_t percent) {
    return static_cast<uint8_t>((static_cast<uint16_t>(percent) * 255u) / 100u);
  }

  static uint16_t pack(const matrixclock::Color &c) {
    return Adafruit_NeoMatrix::Color(c.r, c.g, c.b);
  }

  Adafruit_NeoMatrix matrix_;
};
