#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/renderer/Image.hpp"
#include "VectorText/text/LayoutMetrics.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>

namespace VectorText {

// Horizontal sample offsets in pixels, one per draw instance.
constexpr std::array<float, 3> SubpixelOffsets{-1.0f / 3.0f, 1.0f / 3.0f, 0.0f};

struct DrawRequest {
  std::span<GlyphVertex const> vertices;
  std::span<uint16_t const> indices;
  // Empty: vertices carry their color inline.
  std::span<Color const> palette;
  std::span<float const> subpixelOffsets = SubpixelOffsets;
  uint32_t instanceCount = static_cast<uint32_t>(SubpixelOffsets.size());
  RenderSize renderSize{};
  Color clearColor{1.0f, 1.0f, 1.0f, 1.0f};
};

// One alpha-blended triangle-list draw. Curve triangles keep the half-plane
// (u * u - v < 0) XOR concave.
class RasterBackend {
public:
  virtual ~RasterBackend() = default;

  virtual auto draw(DrawRequest const& request, Diagnostics* diagnostics = nullptr) -> std::optional<Image> = 0;
};

} // namespace VectorText
