#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/mesh/Outline.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace VectorText {

class Typeface;

struct ShapeGroup {
  Ring outer;
  std::vector<Ring> holes;
};

// Even-odd containment of `point` in the closed ring.
auto RingContains(std::span<Point2D const> ring, Point2D point) -> bool;

// One group per solid ring, in encounter order. Each hole joins the innermost
// solid that contains it, wherever the two sit in the contour order. nullopt
// when a hole lies inside no solid.
auto GroupRings(std::vector<Ring> rings, bool reverseWind) -> std::optional<std::vector<ShapeGroup>>;

// Triangulates one solid with its holes. Indices address the outer ring's
// points followed by each hole's points, and are appended to `outIndices`.
// False, with `outIndices` untouched, when the outer ring has fewer than three
// distinct points or no area, or when no triangulation comes back.
auto TriangulateGroup(ShapeGroup const& group, std::vector<uint32_t>& outIndices) -> bool;

// Turns glyph outlines into flat-fill + curve-triangle meshes.
class GlyphMeshBuilder {
public:
  explicit GlyphMeshBuilder(bool reverseWind = false);

  bool reverseWind() const { return reverseWind_; }

  // Fails with DegenerateGeometry when a shape group cannot be triangulated.
  auto build(uint32_t glyphId,
             GlyphOutline const& outline,
             Diagnostics* diagnostics = nullptr) const -> std::optional<GlyphMesh>;

  auto build(uint32_t glyphId,
             std::vector<Ring> rings,
             std::span<CurveTriangle const> curves,
             Rect bounds,
             Diagnostics* diagnostics = nullptr) const -> std::optional<GlyphMesh>;

private:
  bool reverseWind_ = false;
};

// Builds one glyph of `face`. Glyphs without an outline give nullopt and a
// GlyphNotFound record; degenerate ones give nullopt and DegenerateGeometry.
auto BuildGlyphMesh(Typeface const& face,
                    uint32_t glyphId,
                    Diagnostics* diagnostics = nullptr) -> std::optional<GlyphMesh>;

} // namespace VectorText
