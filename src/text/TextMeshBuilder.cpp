#include "VectorText/text/TextMeshBuilder.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <utility>

namespace VectorText {

TextMeshBuilder::TextMeshBuilder(TextMeshParams params)
    : params_(params) {
  scale_ = LayoutScale(params_.fontSizePx, params_.unitsPerEm);
  float width = static_cast<float>(params_.renderSize.width);
  float height = static_cast<float>(params_.renderSize.height);
  if (width > 0.0f && height > 0.0f) {
    originNdc_ = Point2D{params_.origin.x / width * 2.0f, params_.origin.y / height * 2.0f};
  }
}

auto TextMeshBuilder::toNdc(float x, float y) const -> Point2D {
  float width = static_cast<float>(params_.renderSize.width);
  float height = static_cast<float>(params_.renderSize.height);
  if (width <= 0.0f || height <= 0.0f) return Point2D{};
  float px = x * scale_;
  float py = y * scale_;
  return Point2D{px / width * 2.0f - 1.0f + originNdc_.x, py / height * 2.0f - 1.0f + originNdc_.y};
}

void TextMeshBuilder::add(GlyphMesh const* mesh, GlyphAdvance const& advance, Diagnostics* diagnostics) {
  Point2D placed{cursor_.x + static_cast<float>(advance.xOffset),
                 cursor_.y + static_cast<float>(advance.yOffset)};
  mesh_.glyphOrigins.push_back(cursor_);

  if (mesh) {
    size_t base = mesh_.vertices.size();
    if (base + mesh->vertices.size() > MaxMeshVertices) {
      spdlog::warn("glyph {}: text mesh would exceed 16-bit index range, skipped", advance.glyphId);
      Report(diagnostics, ErrorKind::IndexOverflow, advance.glyphId, "text mesh exceeds 16-bit vertex range");
    } else {
      for (auto const& source : mesh->vertices) {
        GlyphVertex vertex = source;
        Point2D ndc = toNdc(source.position[0] + placed.x, source.position[1] + placed.y);
        vertex.position = {ndc.x, ndc.y, source.position[2]};
        vertex.color = params_.color;
        mesh_.vertices.push_back(vertex);
      }
      for (uint16_t index : mesh->indices) {
        mesh_.indices.push_back(static_cast<uint16_t>(base + index));
      }
    }
  }

  cursor_.x += static_cast<float>(advance.xAdvance);
  cursor_.y += static_cast<float>(advance.yAdvance);
}

auto TextMeshBuilder::build() -> TextMesh {
  spdlog::debug("text mesh: {} glyphs, {} vertices, {} indices",
                mesh_.glyphOrigins.size(),
                mesh_.vertices.size(),
                mesh_.indices.size());
  TextMesh out = std::move(mesh_);
  mesh_ = TextMesh{};
  cursor_ = Point2D{};
  return out;
}

} // namespace VectorText
