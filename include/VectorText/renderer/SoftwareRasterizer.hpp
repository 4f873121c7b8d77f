#pragma once

#include "VectorText/renderer/RasterBackend.hpp"

namespace VectorText {

// CPU reference backend. Each pixel's coverage is the fraction of its
// subpixel samples inside the primitive; color is blended source-over.
class SoftwareRasterizer final : public RasterBackend {
public:
  auto draw(DrawRequest const& request, Diagnostics* diagnostics = nullptr) -> std::optional<Image> override;
};

// True when the sample at barycentric (b0, b1, b2) of a curve triangle lies
// in the filled region.
auto CurveSampleInside(float b0, float b1, float b2, bool concave) -> bool;

} // namespace VectorText
