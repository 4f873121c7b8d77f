#pragma once

#include "VectorText/mesh/Geometry.hpp"

#include <cstdint>
#include <string_view>
#include <vector>

namespace VectorText {

enum class OutlineEventType : uint8_t {
  MoveTo = 0,
  LineTo = 1,
  QuadTo = 2,
  CubicTo = 3,
  Close = 4,
};

constexpr auto outlineEventTypeName(OutlineEventType type) -> std::string_view {
  switch (type) {
    case OutlineEventType::MoveTo:
      return "MoveTo";
    case OutlineEventType::LineTo:
      return "LineTo";
    case OutlineEventType::QuadTo:
      return "QuadTo";
    case OutlineEventType::CubicTo:
      return "CubicTo";
    case OutlineEventType::Close:
      return "Close";
  }
  return "UnknownOutlineEvent";
}

// One drawing command of a glyph outline. Unused control points stay zero:
// MoveTo/LineTo use `to`, QuadTo uses `c1` and `to`, CubicTo uses all three.
struct OutlineEvent {
  OutlineEventType type{OutlineEventType::MoveTo};
  Point2D c1{};
  Point2D c2{};
  Point2D to{};

  static auto moveTo(float x, float y) -> OutlineEvent {
    return OutlineEvent{OutlineEventType::MoveTo, {}, {}, {x, y}};
  }
  static auto lineTo(float x, float y) -> OutlineEvent {
    return OutlineEvent{OutlineEventType::LineTo, {}, {}, {x, y}};
  }
  static auto quadTo(float cx, float cy, float x, float y) -> OutlineEvent {
    return OutlineEvent{OutlineEventType::QuadTo, {cx, cy}, {}, {x, y}};
  }
  static auto cubicTo(float c1x, float c1y, float c2x, float c2y, float x, float y) -> OutlineEvent {
    return OutlineEvent{OutlineEventType::CubicTo, {c1x, c1y}, {c2x, c2y}, {x, y}};
  }
  static auto close() -> OutlineEvent {
    return OutlineEvent{OutlineEventType::Close, {}, {}, {}};
  }
};

// Materialized outline of one glyph in font design units.
struct GlyphOutline {
  std::vector<OutlineEvent> events;
  Rect bounds{};
};

} // namespace VectorText
