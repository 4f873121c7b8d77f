#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/text/LayoutMetrics.hpp"
#include "VectorText/text/Typeface.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <cstddef>
#include <cstdint>

namespace VectorText {

struct TextMeshParams {
  float fontSizePx = 16.0f;
  // Bottom-left of the text block in pixels, y up.
  Point2D origin{};
  uint16_t unitsPerEm = 1000;
  RenderSize renderSize{};
  Color color{};
};

// Places glyph meshes along the shaping cursor and maps them to NDC.
class TextMeshBuilder {
public:
  explicit TextMeshBuilder(TextMeshParams params);

  // Appends one shaped glyph. `mesh` may be null for glyphs without
  // geometry; the cursor advances either way. A glyph that would push the
  // mesh past the 16-bit index range is dropped with IndexOverflow.
  void add(GlyphMesh const* mesh, GlyphAdvance const& advance, Diagnostics* diagnostics = nullptr);

  auto cursor() const -> Point2D { return cursor_; }
  auto glyphCount() const -> size_t { return mesh_.glyphOrigins.size(); }

  auto build() -> TextMesh;

private:
  auto toNdc(float x, float y) const -> Point2D;

  TextMeshParams params_;
  float scale_ = 0.0f;
  Point2D originNdc_{};
  Point2D cursor_{};
  TextMesh mesh_;
};

} // namespace VectorText
