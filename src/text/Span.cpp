#include "VectorText/text/Span.hpp"
#include "VectorText/mesh/GlyphMeshBuilder.hpp"
#include "VectorText/mesh/GlyphMeshCache.hpp"
#include "VectorText/text/TextMeshBuilder.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace VectorText {

auto AlignOffset(Align align, float available, float content) -> float {
  switch (align) {
    case Align::Start: return 0.0f;
    case Align::Middle: return available * 0.5f - content * 0.5f;
    case Align::End: return available - content;
  }
  return 0.0f;
}

Span::Span(std::string text, std::shared_ptr<Typeface const> face)
    : text_(std::move(text)), face_(std::move(face)) {}

auto Span::withText(std::string text) const -> Span {
  Span copy = *this;
  copy.text_ = std::move(text);
  return copy;
}

auto Span::withFace(std::shared_ptr<Typeface const> face) const -> Span {
  Span copy = *this;
  copy.face_ = std::move(face);
  return copy;
}

auto Span::withPosition(Point2D position) const -> Span {
  Span copy = *this;
  copy.position_ = position;
  return copy;
}

auto Span::withFontSize(float pixels) const -> Span {
  Span copy = *this;
  copy.fontSize_ = pixels;
  return copy;
}

auto Span::withFontSizePoints(float points) const -> Span {
  return withFontSize(PointsToPixels(points));
}

auto Span::withBox(BoxSize box) const -> Span {
  Span copy = *this;
  copy.box_ = box;
  return copy;
}

auto Span::withoutBox() const -> Span {
  Span copy = *this;
  copy.box_.reset();
  return copy;
}

auto Span::withAlign(Align horizontal, Align vertical) const -> Span {
  Span copy = *this;
  copy.hAlign_ = horizontal;
  copy.vAlign_ = vertical;
  return copy;
}

auto Span::withHorizontalAlign(Align align) const -> Span {
  Span copy = *this;
  copy.hAlign_ = align;
  return copy;
}

auto Span::withVerticalAlign(Align align) const -> Span {
  Span copy = *this;
  copy.vAlign_ = align;
  return copy;
}

auto Span::withColor(Color color) const -> Span {
  Span copy = *this;
  copy.color_ = color;
  return copy;
}

auto Span::layout(Diagnostics* diagnostics) const -> std::optional<SpanLayout> {
  if (!face_) {
    spdlog::error("span has no font face");
    Report(diagnostics, ErrorKind::InvalidFontData, 0, "span has no font face");
    return std::nullopt;
  }

  auto shaped = face_->shape(text_, diagnostics);
  if (!shaped) {
    spdlog::error("shaping failed for span '{}'", text_);
    return std::nullopt;
  }

  SpanLayout out;
  out.fontSizePx = fontSize_;
  out.glyphs = std::move(*shaped);

  float advanceUnits = 0.0f;
  for (auto const& glyph : out.glyphs) {
    advanceUnits += static_cast<float>(glyph.xAdvance);
  }
  out.measuredWidth = advanceUnits * LayoutScale(fontSize_, face_->unitsPerEm());

  out.origin = position_;
  if (box_) {
    out.origin.x += AlignOffset(hAlign_, box_->width, out.measuredWidth);
    out.origin.y += AlignOffset(vAlign_, box_->height, fontSize_);
  }
  spdlog::debug("span '{}': {} glyphs, width {} px, origin {} {}",
                text_,
                out.glyphs.size(),
                out.measuredWidth,
                out.origin.x,
                out.origin.y);
  return out;
}

auto Span::generateTextMesh(RenderSize renderSize,
                            Diagnostics* diagnostics,
                            GlyphMeshCache* cache) const -> std::optional<TextMesh> {
  auto laidOut = layout(diagnostics);
  if (!laidOut) return std::nullopt;

  TextMeshParams params;
  params.fontSizePx = laidOut->fontSizePx;
  params.origin = laidOut->origin;
  params.unitsPerEm = face_->unitsPerEm();
  params.renderSize = renderSize;
  params.color = color_;
  TextMeshBuilder builder(params);

  for (auto const& glyph : laidOut->glyphs) {
    if (cache) {
      builder.add(cache->get(*face_, glyph.glyphId, diagnostics), glyph, diagnostics);
    } else {
      auto mesh = BuildGlyphMesh(*face_, glyph.glyphId, diagnostics);
      builder.add(mesh ? &*mesh : nullptr, glyph, diagnostics);
    }
  }
  return builder.build();
}

} // namespace VectorText
