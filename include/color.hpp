#pragma once

#include <cmath>
#include <cstdint>
#include <cstring>

namespace matrixclock {

struct Color {
  uint8_t r;
  uint8_t g;
  uint8_t b;
};

inline bool operator==(const Color &lhs, const Color &rhs) {
  return lhs.r == rhs.r && lhs.g == rhs.g && lhs.b == rhs.b;
}
inline bool operator!=(const Color &lhs, const Color &rhs) { return !(lhs == rhs); }

constexpr Color kBlack = {0, 0, 0};
constexpr Color kWhite = {255, 255, 255};
constexpr Color kRed = {255, 0, 0};
constexpr Color kYellow = {255, 255, 0};

constexpr size_t kColorNameMax = 7;

struct NamedColor {
  const char *name;
  Color color;
};

/** Palette accepted in configuration and message payloads. */
constexpr NamedColor kPalette[] = {
    {"black", {0, 0, 0}},     {"white", {255, 255, 255}}, {"red", {255, 0, 0}},
    {"green", {0, 255, 0}},   {"blue", {0, 0, 255}},      {"yellow", {255, 255, 0}},
    {"purple", {255, 0, 255}}, {"cyan", {0, 255, 255}},   {"orange", {255, 127, 0}},
};

/** Resolves a palette name (case-sensitive). Returns false for unknown names. */
inline bool lookupColor(const char *name, Color &out) {
  if (!name) {
    return false;
  }
  for (const auto &entry : kPalette) {
    if (std::strcmp(entry.name, name) == 0) {
      out = entry.color;
      return true;
    }
  }
  return false;
}

/** Converts hue/saturation/value (hue wraps every 1.0) into RGB. */
inline Color colorFromHsv(float h, float s, float v) {
  float i = std::floor(h * 6.0f);
  float f = h * 6.0f - i;
  v *= 255.0f;
  float p = v * (1.0f - s);
  float q = v * (1.0f - f * s);
  float t = v * (1.0f - (1.0f - f) * s);
  int sector = static_cast<int>(i) % 6;
  if (sector < 0) {
    sector += 6;
  }
  auto u8 = [](float x) -> uint8_t {
    if (x <= 0.0f) {
      return 0;
    }
    if (x >= 255.0f) {
      return 255;
    }
    return static_cast<uint8_t>(x);
  };
  switch (sector) {
    case 0:
      return Color{u8(v), u8(t), u8(p)};
    case 1:
      return Color{u8(q), u8(v), u8(p)};
    case 2:
      return Color{u8(p), u8(v), u8(t)};
    case 3:
      return Color{u8(p), u8(q), u8(v)};
    case 4:
      return Color{u8(t), u8(p), u8(v)};
    default:
      return Color{u8(v), u8(p), u8(q)};
  }
}

}  // namespace matrixclock
