#pragma once

#include "VectorText/mesh/Geometry.hpp"
#include "VectorText/mesh/Outline.hpp"

#include <span>
#include <utility>
#include <vector>

namespace VectorText {

// Accumulates the rings and curve triangles of one glyph outline.
class OutlineCollector {
public:
  explicit OutlineCollector(bool reverseWind = false);

  void moveTo(float x, float y);
  void lineTo(float x, float y);
  void quadTo(float cx, float cy, float x, float y);
  void cubicTo(float c1x, float c1y, float c2x, float c2y, float x, float y);
  void close();

  void apply(OutlineEvent const& event);
  void apply(std::span<OutlineEvent const> events);

  // Closes any open ring. Rings with fewer than three points are dropped.
  void finish();

  bool reverseWind() const { return reverseWind_; }
  auto rings() const -> std::vector<Ring> const& { return rings_; }
  auto curves() const -> std::vector<CurveTriangle> const& { return curves_; }

  auto takeRings() -> std::vector<Ring> { return std::move(rings_); }
  auto takeCurves() -> std::vector<CurveTriangle> { return std::move(curves_); }

private:
  auto currentRing() -> Ring&;
  auto lastPoint() -> Point2D;
  void pushCurve(Point2D p0, Point2D control, Point2D p1);

  bool reverseWind_ = false;
  bool ringOpen_ = false;
  std::vector<Ring> rings_;
  std::vector<CurveTriangle> curves_;
};

} // namespace VectorText
