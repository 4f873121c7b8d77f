#pragma once

#include <cstdint>
#include <string_view>

namespace VectorText {

// Empirical factor applied on top of fontSize / unitsPerEm so a glyph's
// rendered em matches the requested pixel size.
constexpr float EmCorrection = 1.254f;

// Output is laid out at 150 dpi.
constexpr float PointsToPixelsScale = 150.0f / 72.0f;

constexpr auto PointsToPixels(float points) -> float {
  return points * PointsToPixelsScale;
}

// Font units to pixels for a given pixel size.
constexpr auto LayoutScale(float fontSizePx, uint16_t unitsPerEm) -> float {
  return unitsPerEm == 0 ? 0.0f : fontSizePx / static_cast<float>(unitsPerEm) * EmCorrection;
}

struct RenderSize {
  uint32_t width = 800;
  uint32_t height = 600;
};

enum class Align : uint8_t {
  Start = 0,
  Middle,
  End,
};

auto ToString(Align align) -> std::string_view;

} // namespace VectorText

inline auto VectorText::ToString(Align align) -> std::string_view {
  switch (align) {
    case Align::Start: return "start";
    case Align::Middle: return "middle";
    case Align::End: return "end";
  }
  return "start";
}
