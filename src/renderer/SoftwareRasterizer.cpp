#include "VectorText/renderer/SoftwareRasterizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>

namespace VectorText {

namespace {

inline auto mul_div_255(uint8_t v, uint8_t a) -> uint8_t {
  return static_cast<uint8_t>((static_cast<uint16_t>(v) * a + 127u) / 255u);
}

auto apply_coverage(uint8_t baseAlpha, uint8_t coverage) -> uint8_t {
  uint16_t v = static_cast<uint16_t>(baseAlpha) * static_cast<uint16_t>(coverage);
  v = static_cast<uint16_t>((v + 127u) / 255u);
  return static_cast<uint8_t>(std::min<uint16_t>(v, 255u));
}

auto blend_premultiplied(uint8_t* dst, uint8_t srcR, uint8_t srcG, uint8_t srcB, uint8_t srcA) -> void {
  uint8_t invA = static_cast<uint8_t>(255u - srcA);
  dst[0] = static_cast<uint8_t>(static_cast<uint16_t>(srcR) + mul_div_255(dst[0], invA));
  dst[1] = static_cast<uint8_t>(static_cast<uint16_t>(srcG) + mul_div_255(dst[1], invA));
  dst[2] = static_cast<uint8_t>(static_cast<uint16_t>(srcB) + mul_div_255(dst[2], invA));
  dst[3] = static_cast<uint8_t>(static_cast<uint16_t>(srcA) + mul_div_255(dst[3], invA));
}

struct ScreenVertex {
  float x = 0.0f;
  float y = 0.0f;
};

inline auto edge(ScreenVertex const& a, ScreenVertex const& b, float px, float py) -> float {
  return (b.x - a.x) * (py - a.y) - (b.y - a.y) * (px - a.x);
}

} // namespace

auto CurveSampleInside(float b0, float b1, float b2, bool concave) -> bool {
  float u = b0 * CurveTriangleUv[0][0] + b1 * CurveTriangleUv[1][0] + b2 * CurveTriangleUv[2][0];
  float v = b0 * CurveTriangleUv[0][1] + b1 * CurveTriangleUv[1][1] + b2 * CurveTriangleUv[2][1];
  return (u * u - v < 0.0f) != concave;
}

auto SoftwareRasterizer::draw(DrawRequest const& request, Diagnostics* diagnostics) -> std::optional<Image> {
  uint32_t width = request.renderSize.width;
  uint32_t height = request.renderSize.height;
  if (width == 0 || height == 0) {
    Report(diagnostics, ErrorKind::DegenerateGeometry, 0, "render target has zero size");
    return std::nullopt;
  }
  if (request.indices.size() % 3 != 0) {
    Report(diagnostics, ErrorKind::DegenerateGeometry, 0, "index count is not a multiple of three");
    return std::nullopt;
  }
  for (uint16_t index : request.indices) {
    if (index >= request.vertices.size()) {
      Report(diagnostics, ErrorKind::IndexOverflow, 0, "index " + std::to_string(index) + " out of range");
      return std::nullopt;
    }
  }
  if (!request.palette.empty()) {
    for (auto const& vertex : request.vertices) {
      if (vertex.paletteIndex >= request.palette.size()) {
        Report(diagnostics, ErrorKind::IndexOverflow, 0, "palette index out of range");
        return std::nullopt;
      }
    }
  }

  std::vector<float> offsets;
  uint32_t instances = std::min<uint32_t>(request.instanceCount,
                                          static_cast<uint32_t>(request.subpixelOffsets.size()));
  offsets.assign(request.subpixelOffsets.begin(), request.subpixelOffsets.begin() + instances);
  if (offsets.empty()) offsets.push_back(0.0f);

  Image image = MakeImage(width, height, ToRgba8(request.clearColor));
  float fw = static_cast<float>(width);
  float fh = static_cast<float>(height);

  auto to_screen = [&](GlyphVertex const& vertex) -> ScreenVertex {
    return ScreenVertex{(vertex.position[0] + 1.0f) * 0.5f * fw,
                        (vertex.position[1] + 1.0f) * 0.5f * fh};
  };

  size_t drawn = 0;
  for (size_t tri = 0; tri + 2 < request.indices.size(); tri += 3) {
    GlyphVertex const& v0 = request.vertices[request.indices[tri + 0]];
    GlyphVertex const& v1 = request.vertices[request.indices[tri + 1]];
    GlyphVertex const& v2 = request.vertices[request.indices[tri + 2]];
    ScreenVertex s0 = to_screen(v0);
    ScreenVertex s1 = to_screen(v1);
    ScreenVertex s2 = to_screen(v2);

    float area = edge(s0, s1, s2.x, s2.y);
    if (area == 0.0f || !std::isfinite(area)) continue;

    bool curve = IsCurveVertex(v0);
    bool concave = IsConcaveVertex(v0);
    Color color = request.palette.empty() ? v0.color : request.palette[v0.paletteIndex];
    Rgba8 src = ToRgba8(color);
    if (src.a == 0) continue;

    float minX = std::min({s0.x, s1.x, s2.x}) - 1.0f;
    float maxX = std::max({s0.x, s1.x, s2.x}) + 1.0f;
    float minY = std::min({s0.y, s1.y, s2.y});
    float maxY = std::max({s0.y, s1.y, s2.y});
    // Clamp in float space; bounds far outside the target do not fit in int32_t.
    int32_t x0 = static_cast<int32_t>(std::floor(std::clamp(minX, 0.0f, fw)));
    int32_t x1 = std::min(static_cast<int32_t>(width) - 1, static_cast<int32_t>(std::ceil(std::clamp(maxX, 0.0f, fw))));
    int32_t y0 = static_cast<int32_t>(std::floor(std::clamp(minY, 0.0f, fh)));
    int32_t y1 = std::min(static_cast<int32_t>(height) - 1, static_cast<int32_t>(std::ceil(std::clamp(maxY, 0.0f, fh))));
    if (x0 > x1 || y0 > y1) continue;

    for (int32_t py = y0; py <= y1; ++py) {
      float sy = static_cast<float>(py) + 0.5f;
      // Pixel space is y-up; image rows run top-down.
      uint8_t* row = image.pixels.data() + static_cast<size_t>(height - 1u - static_cast<uint32_t>(py)) * image.strideBytes;
      for (int32_t px = x0; px <= x1; ++px) {
        uint32_t inside = 0;
        for (float offset : offsets) {
          float sx = static_cast<float>(px) + 0.5f + offset;
          float b0 = edge(s1, s2, sx, sy) / area;
          float b1 = edge(s2, s0, sx, sy) / area;
          float b2 = edge(s0, s1, sx, sy) / area;
          if (b0 < 0.0f || b1 < 0.0f || b2 < 0.0f) continue;
          if (curve && !CurveSampleInside(b0, b1, b2, concave)) continue;
          ++inside;
        }
        if (inside == 0) continue;
        auto coverage = static_cast<uint8_t>((inside * 255u) / static_cast<uint32_t>(offsets.size()));
        uint8_t alpha = apply_coverage(src.a, coverage);
        blend_premultiplied(row + static_cast<size_t>(px) * 4,
                            mul_div_255(src.r, alpha),
                            mul_div_255(src.g, alpha),
                            mul_div_255(src.b, alpha),
                            alpha);
      }
    }
    ++drawn;
  }

  spdlog::debug("software raster: {} of {} triangles drawn at {}x{}, {} samples",
                drawn,
                request.indices.size() / 3,
                width,
                height,
                offsets.size());
  return image;
}

} // namespace VectorText
