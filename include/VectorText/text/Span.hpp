#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/text/LayoutMetrics.hpp"
#include "VectorText/text/Typeface.hpp"
#include "VectorText/util/Diagnostics.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace VectorText {

class GlyphMeshCache;

struct BoxSize {
  float width = 0.0f;
  float height = 0.0f;
};

struct SpanLayout {
  // Alignment-adjusted bottom-left of the text, pixels.
  Point2D origin{};
  float measuredWidth = 0.0f;
  float fontSizePx = 0.0f;
  std::vector<GlyphAdvance> glyphs;
};

// A styled run of text. Spans are values: every with* call returns a
// modified copy and leaves the original untouched.
class Span {
public:
  Span() = default;
  Span(std::string text, std::shared_ptr<Typeface const> face);

  auto withText(std::string text) const -> Span;
  auto withFace(std::shared_ptr<Typeface const> face) const -> Span;
  auto withPosition(Point2D position) const -> Span;
  auto withFontSize(float pixels) const -> Span;
  auto withFontSizePoints(float points) const -> Span;
  auto withBox(BoxSize box) const -> Span;
  auto withoutBox() const -> Span;
  auto withAlign(Align horizontal, Align vertical) const -> Span;
  auto withHorizontalAlign(Align align) const -> Span;
  auto withVerticalAlign(Align align) const -> Span;
  auto withColor(Color color) const -> Span;

  auto text() const -> std::string const& { return text_; }
  auto face() const -> std::shared_ptr<Typeface const> const& { return face_; }
  auto position() const -> Point2D { return position_; }
  auto fontSize() const -> float { return fontSize_; }
  auto box() const -> std::optional<BoxSize> const& { return box_; }
  auto horizontalAlign() const -> Align { return hAlign_; }
  auto verticalAlign() const -> Align { return vAlign_; }
  auto color() const -> Color { return color_; }

  // Shapes the text and resolves the aligned origin. nullopt on a missing
  // face or a shaping failure.
  auto layout(Diagnostics* diagnostics = nullptr) const -> std::optional<SpanLayout>;

  // Glyphs that fail to build are left out and reported; the cursor still
  // advances over them.
  auto generateTextMesh(RenderSize renderSize,
                        Diagnostics* diagnostics = nullptr,
                        GlyphMeshCache* cache = nullptr) const -> std::optional<TextMesh>;

private:
  std::string text_;
  std::shared_ptr<Typeface const> face_;
  Point2D position_{};
  float fontSize_ = 16.0f;
  std::optional<BoxSize> box_;
  Align hAlign_ = Align::Start;
  Align vAlign_ = Align::Start;
  Color color_{0.0f, 0.0f, 0.0f, 1.0f};
};

// Offset of content of `content` size inside `available` for an alignment.
auto AlignOffset(Align align, float available, float content) -> float;

} // namespace VectorText
