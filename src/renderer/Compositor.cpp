#include "VectorText/renderer/Compositor.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <utility>

namespace VectorText {

auto PaletteIndex(std::vector<Color>& palette, Color const& color) -> uint32_t {
  for (size_t i = 0; i < palette.size(); ++i) {
    if (palette[i] == color) {
      return static_cast<uint32_t>(i);
    }
  }
  palette.push_back(color);
  return static_cast<uint32_t>(palette.size() - 1);
}

Compositor::Compositor(RenderSize renderSize)
    : renderSize_(renderSize) {}

void Compositor::add(Span span) {
  spans_.push_back(std::move(span));
}

auto Compositor::compose(Diagnostics* diagnostics) -> std::optional<CompositeBatch> {
  CompositeBatch batch;
  for (size_t spanIndex = 0; spanIndex < spans_.size(); ++spanIndex) {
    Span const& span = spans_[spanIndex];
    auto mesh = span.generateTextMesh(renderSize_, diagnostics, &cache_);
    if (!mesh) {
      spdlog::error("composition aborted at span {}", spanIndex);
      return std::nullopt;
    }

    size_t base = batch.vertices.size();
    if (base + mesh->vertices.size() > MaxMeshVertices) {
      spdlog::error("composition exceeds 16-bit index range at span {}", spanIndex);
      Report(diagnostics, ErrorKind::IndexOverflow, 0,
             "composition exceeds 16-bit vertex range at span " + std::to_string(spanIndex));
      return std::nullopt;
    }

    uint32_t paletteIndex = PaletteIndex(batch.palette, span.color());
    for (auto vertex : mesh->vertices) {
      vertex.paletteIndex = paletteIndex;
      batch.vertices.push_back(vertex);
    }
    for (uint16_t index : mesh->indices) {
      batch.indices.push_back(static_cast<uint16_t>(base + index));
    }
  }
  spdlog::debug("composed {} spans: {} vertices, {} indices, {} palette entries",
                spans_.size(),
                batch.vertices.size(),
                batch.indices.size(),
                batch.palette.size());
  return batch;
}

auto Compositor::render(RasterBackend& backend,
                        Diagnostics* diagnostics,
                        Color clearColor) -> std::optional<Image> {
  auto batch = compose(diagnostics);
  if (!batch) return std::nullopt;

  DrawRequest request;
  request.vertices = batch->vertices;
  request.indices = batch->indices;
  request.palette = batch->palette;
  request.subpixelOffsets = SubpixelOffsets;
  request.instanceCount = static_cast<uint32_t>(SubpixelOffsets.size());
  request.renderSize = renderSize_;
  request.clearColor = clearColor;
  return backend.draw(request, diagnostics);
}

} // namespace VectorText
