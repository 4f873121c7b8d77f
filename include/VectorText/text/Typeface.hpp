#pragma once

#include "VectorText/mesh/Outline.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace VectorText {

// One shaped glyph, in font design units.
struct GlyphAdvance {
  uint32_t glyphId = 0;
  int32_t xAdvance = 0;
  int32_t yAdvance = 0;
  int32_t xOffset = 0;
  int32_t yOffset = 0;
};

// Font data as seen by the mesh and layout engines: outline extraction and
// shaping. Implementations are immutable once loaded and shared by handle.
class Typeface {
public:
  virtual ~Typeface() = default;

  // Identity used for glyph mesh cache keys. Unique per loaded face.
  virtual auto id() const -> uint32_t = 0;
  virtual auto unitsPerEm() const -> uint16_t = 0;
  // True when outlines come from a native (glyf) contour table.
  virtual bool hasNativeContours() const = 0;
  // Outline events and bounding box, or nullopt for glyphs without contours.
  virtual auto outline(uint32_t glyphId) const -> std::optional<GlyphOutline> = 0;
  virtual auto shape(std::string_view text,
                     Diagnostics* diagnostics) const -> std::optional<std::vector<GlyphAdvance>> = 0;
};

inline auto ReverseWinding(Typeface const& face) -> bool {
  return !face.hasNativeContours();
}

} // namespace VectorText
