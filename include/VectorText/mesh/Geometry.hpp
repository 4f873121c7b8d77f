#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace VectorText {

struct Point2D {
  float x = 0.0f;
  float y = 0.0f;

  bool operator==(Point2D const& other) const {
    return x == other.x && y == other.y;
  }
};

struct Rect {
  float xMin = 0.0f;
  float yMin = 0.0f;
  float xMax = 0.0f;
  float yMax = 0.0f;

  auto width() const -> float { return xMax - xMin; }
  auto height() const -> float { return yMax - yMin; }
};

struct Color {
  float r = 0.0f;
  float g = 0.0f;
  float b = 0.0f;
  float a = 1.0f;

  bool operator==(Color const& other) const {
    return r == other.r && g == other.g && b == other.b && a == other.a;
  }
};

using Ring = std::vector<Point2D>;

struct CurveTriangle {
  std::array<Point2D, 3> points{};
  bool isConcave = false;
};

enum VertexFlags : int32_t {
  VertexFlagConcave = 1 << 0,
  VertexFlagCurve = 1 << 1,
};

// UVs of the three corners of a curve triangle, in vertex order.
constexpr std::array<std::array<float, 2>, 3> CurveTriangleUv{{
    {0.0f, 0.0f},
    {0.5f, 0.0f},
    {1.0f, 1.0f},
}};

struct GlyphVertex {
  std::array<float, 3> position{};
  std::array<float, 2> uv{};
  int32_t metadata = 0;
  Color color{};
  uint32_t paletteIndex = 0;
};

struct GlyphMesh {
  uint32_t glyphId = 0;
  std::vector<GlyphVertex> vertices;
  std::vector<uint16_t> indices;
  Rect bounds{};
};

struct TextMesh {
  std::vector<GlyphVertex> vertices;
  std::vector<uint16_t> indices;
  // Cursor (font units) each shaped glyph was placed at, in shaping order.
  std::vector<Point2D> glyphOrigins;
};

constexpr size_t MaxMeshVertices = 65536u;

inline auto IsCurveVertex(GlyphVertex const& vertex) -> bool {
  return (vertex.metadata & VertexFlagCurve) != 0;
}

inline auto IsConcaveVertex(GlyphVertex const& vertex) -> bool {
  return (vertex.metadata & VertexFlagConcave) != 0;
}

} // namespace VectorText
