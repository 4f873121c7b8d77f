#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/mesh/GlyphMeshCache.hpp"
#include "VectorText/renderer/RasterBackend.hpp"
#include "VectorText/text/LayoutMetrics.hpp"
#include "VectorText/text/Span.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <optional>
#include <vector>

namespace VectorText {

struct CompositeBatch {
  std::vector<GlyphVertex> vertices;
  std::vector<uint16_t> indices;
  std::vector<Color> palette;
};

// Batches spans into one mesh with a deduplicated color palette.
class Compositor {
public:
  explicit Compositor(RenderSize renderSize = {});

  void add(Span span);
  auto spans() const -> std::vector<Span> const& { return spans_; }
  auto renderSize() const -> RenderSize { return renderSize_; }
  void clear() { spans_.clear(); }

  // Spans are meshed in submission order. A span that cannot be shaped
  // aborts the composition, as does exceeding the 16-bit index range.
  auto compose(Diagnostics* diagnostics = nullptr) -> std::optional<CompositeBatch>;

  auto render(RasterBackend& backend,
              Diagnostics* diagnostics = nullptr,
              Color clearColor = Color{1.0f, 1.0f, 1.0f, 1.0f}) -> std::optional<Image>;

private:
  RenderSize renderSize_{};
  std::vector<Span> spans_;
  GlyphMeshCache cache_;
};

// Index of `color` in `palette`, appending it when absent.
auto PaletteIndex(std::vector<Color>& palette, Color const& color) -> uint32_t;

} // namespace VectorText
