#include "VectorText/mesh/GlyphMeshBuilder.hpp"
#include "VectorText/mesh/OutlineCollector.hpp"
#include "VectorText/mesh/Winding.hpp"
#include "VectorText/text/Typeface.hpp"

#include <mapbox/earcut.hpp>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstddef>
#include <limits>
#include <string>

namespace mapbox {
namespace util {

template <>
struct nth<0, VectorText::Point2D> {
  inline static auto get(VectorText::Point2D const& t) { return t.x; }
};

template <>
struct nth<1, VectorText::Point2D> {
  inline static auto get(VectorText::Point2D const& t) { return t.y; }
};

} // namespace util
} // namespace mapbox

namespace VectorText {

namespace {

auto flat_vertex(Point2D p) -> GlyphVertex {
  GlyphVertex vertex;
  vertex.position = {p.x, p.y, 0.0f};
  return vertex;
}

auto curve_vertex(Point2D p, size_t corner, bool concave) -> GlyphVertex {
  GlyphVertex vertex;
  vertex.position = {p.x, p.y, 0.0f};
  vertex.uv = CurveTriangleUv[corner];
  vertex.metadata = VertexFlagCurve | (concave ? VertexFlagConcave : 0);
  return vertex;
}

} // namespace

auto RingContains(std::span<Point2D const> ring, Point2D point) -> bool {
  bool inside = false;
  size_t count = ring.size();
  if (count < 3) return false;
  for (size_t i = 0, j = count - 1; i < count; j = i++) {
    Point2D a = ring[i];
    Point2D b = ring[j];
    if ((a.y > point.y) != (b.y > point.y)) {
      float crossX = a.x + (point.y - a.y) * (b.x - a.x) / (b.y - a.y);
      if (point.x < crossX) inside = !inside;
    }
  }
  return inside;
}

namespace {

// A hole sits inside a solid when most of its vertices do; vertices that touch
// the solid's edge can land on either side.
auto ring_inside(Ring const& hole, Ring const& solid) -> bool {
  size_t inside = 0;
  for (auto const& p : hole) {
    if (RingContains(solid, p)) ++inside;
  }
  return !hole.empty() && inside * 2 > hole.size();
}

auto distinct_points_at_least_three(Ring const& ring) -> bool {
  if (ring.empty()) return false;
  Point2D first = ring.front();
  for (size_t i = 1; i < ring.size(); ++i) {
    if (ring[i] == first) continue;
    for (size_t j = i + 1; j < ring.size(); ++j) {
      if (ring[j] != first && ring[j] != ring[i]) return true;
    }
    return false;
  }
  return false;
}

} // namespace

auto GroupRings(std::vector<Ring> rings, bool reverseWind) -> std::optional<std::vector<ShapeGroup>> {
  std::vector<ShapeGroup> groups;
  std::vector<Ring> holes;
  for (auto& ring : rings) {
    if (IsHoleRing(ring, reverseWind)) {
      holes.push_back(std::move(ring));
    } else {
      groups.push_back(ShapeGroup{std::move(ring), {}});
    }
  }

  for (auto& hole : holes) {
    ShapeGroup* parent = nullptr;
    float parentArea = std::numeric_limits<float>::max();
    for (auto& group : groups) {
      float area = std::fabs(SignedArea(group.outer));
      if (area < parentArea && ring_inside(hole, group.outer)) {
        parent = &group;
        parentArea = area;
      }
    }
    if (!parent) {
      return std::nullopt;
    }
    parent->holes.push_back(std::move(hole));
  }
  return groups;
}

auto TriangulateGroup(ShapeGroup const& group, std::vector<uint32_t>& outIndices) -> bool {
  if (!distinct_points_at_least_three(group.outer) || SignedArea(group.outer) == 0.0f) {
    return false;
  }
  std::vector<Ring> polygon;
  polygon.reserve(group.holes.size() + 1);
  polygon.push_back(group.outer);
  polygon.insert(polygon.end(), group.holes.begin(), group.holes.end());

  std::vector<uint32_t> triangles = mapbox::earcut<uint32_t>(polygon);
  if (triangles.empty()) {
    return false;
  }
  outIndices.insert(outIndices.end(), triangles.begin(), triangles.end());
  return true;
}

GlyphMeshBuilder::GlyphMeshBuilder(bool reverseWind)
    : reverseWind_(reverseWind) {}

auto GlyphMeshBuilder::build(uint32_t glyphId,
                             GlyphOutline const& outline,
                             Diagnostics* diagnostics) const -> std::optional<GlyphMesh> {
  OutlineCollector collector(reverseWind_);
  collector.apply(outline.events);
  collector.finish();
  auto curves = collector.takeCurves();
  return build(glyphId, collector.takeRings(), curves, outline.bounds, diagnostics);
}

auto GlyphMeshBuilder::build(uint32_t glyphId,
                             std::vector<Ring> rings,
                             std::span<CurveTriangle const> curves,
                             Rect bounds,
                             Diagnostics* diagnostics) const -> std::optional<GlyphMesh> {
  auto groups = GroupRings(std::move(rings), reverseWind_);
  if (!groups) {
    spdlog::warn("glyph {}: hole contour lies inside no solid contour", glyphId);
    Report(diagnostics, ErrorKind::DegenerateGeometry, glyphId, "hole contour outside every solid contour");
    return std::nullopt;
  }

  GlyphMesh mesh;
  mesh.glyphId = glyphId;
  mesh.bounds = bounds;

  std::vector<Point2D> points;
  std::vector<uint32_t> local;
  for (size_t groupIndex = 0; groupIndex < groups->size(); ++groupIndex) {
    ShapeGroup const& group = (*groups)[groupIndex];
    points.clear();
    local.clear();
    points.insert(points.end(), group.outer.begin(), group.outer.end());
    for (auto const& hole : group.holes) {
      points.insert(points.end(), hole.begin(), hole.end());
    }

    if (!TriangulateGroup(group, local)) {
      spdlog::warn("glyph {}: shape group {} could not be triangulated", glyphId, groupIndex);
      Report(diagnostics,
             ErrorKind::DegenerateGeometry,
             glyphId,
             "shape group " + std::to_string(groupIndex) + " has no valid triangulation");
      return std::nullopt;
    }

    size_t base = mesh.vertices.size();
    if (base + points.size() > MaxMeshVertices) {
      Report(diagnostics, ErrorKind::IndexOverflow, glyphId, "glyph exceeds 16-bit vertex range");
      return std::nullopt;
    }
    for (auto const& p : points) {
      mesh.vertices.push_back(flat_vertex(p));
    }
    for (uint32_t index : local) {
      mesh.indices.push_back(static_cast<uint16_t>(base + index));
    }
  }

  if (mesh.vertices.size() + curves.size() * 3u > MaxMeshVertices) {
    Report(diagnostics, ErrorKind::IndexOverflow, glyphId, "glyph exceeds 16-bit vertex range");
    return std::nullopt;
  }
  for (auto const& curve : curves) {
    for (size_t corner = 0; corner < 3; ++corner) {
      mesh.indices.push_back(static_cast<uint16_t>(mesh.vertices.size()));
      mesh.vertices.push_back(curve_vertex(curve.points[corner], corner, curve.isConcave));
    }
  }

  spdlog::debug("glyph {}: {} shape groups, {} curves, {} vertices, {} indices",
                glyphId,
                groups->size(),
                curves.size(),
                mesh.vertices.size(),
                mesh.indices.size());
  return mesh;
}

auto BuildGlyphMesh(Typeface const& face,
                    uint32_t glyphId,
                    Diagnostics* diagnostics) -> std::optional<GlyphMesh> {
  auto outline = face.outline(glyphId);
  if (!outline) {
    spdlog::debug("glyph {} has no outline", glyphId);
    Report(diagnostics, ErrorKind::GlyphNotFound, glyphId, "glyph has no outline");
    return std::nullopt;
  }
  GlyphMeshBuilder builder(ReverseWinding(face));
  return builder.build(glyphId, *outline, diagnostics);
}

} // namespace VectorText
