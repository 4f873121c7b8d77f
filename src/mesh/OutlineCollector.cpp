#include "VectorText/mesh/OutlineCollector.hpp"
#include "VectorText/mesh/Winding.hpp"

#include <spdlog/spdlog.h>

namespace VectorText {

OutlineCollector::OutlineCollector(bool reverseWind)
    : reverseWind_(reverseWind) {}

auto OutlineCollector::currentRing() -> Ring& {
  if (!ringOpen_) {
    spdlog::debug("outline drawing command without move-to, starting ring at origin");
    rings_.emplace_back();
    rings_.back().push_back(Point2D{0.0f, 0.0f});
    ringOpen_ = true;
  }
  return rings_.back();
}

auto OutlineCollector::lastPoint() -> Point2D {
  Ring& ring = currentRing();
  return ring.back();
}

void OutlineCollector::pushCurve(Point2D p0, Point2D control, Point2D p1) {
  bool concave = IsConcaveCurve(p0, control, p1, reverseWind_);
  curves_.push_back(CurveTriangle{{p0, control, p1}, concave});
  // A concave curve bulges into the fill: route the flat ring through the
  // control point so the curve triangle covers the remaining sliver.
  if (concave) {
    currentRing().push_back(control);
  }
}

void OutlineCollector::moveTo(float x, float y) {
  spdlog::trace("move to {} {}", x, y);
  if (ringOpen_) close();
  rings_.emplace_back();
  rings_.back().push_back(Point2D{x, y});
  ringOpen_ = true;
}

void OutlineCollector::lineTo(float x, float y) {
  spdlog::trace("line to {} {}", x, y);
  currentRing().push_back(Point2D{x, y});
}

void OutlineCollector::quadTo(float cx, float cy, float x, float y) {
  spdlog::trace("quadratic to {} {} over {} {}", x, y, cx, cy);
  Point2D start = lastPoint();
  Point2D end{x, y};
  pushCurve(start, Point2D{cx, cy}, end);
  currentRing().push_back(end);
}

void OutlineCollector::cubicTo(float c1x, float c1y, float c2x, float c2y, float x, float y) {
  Point2D start = lastPoint();
  Point2D c1{c1x, c1y};
  Point2D c2{c2x, c2y};
  Point2D end{x, y};
  // Approximated by two quadratics meeting at the midpoint of the controls.
  Point2D mid{c1.x + (c2.x - c1.x) * 0.5f, c1.y + (c2.y - c1.y) * 0.5f};
  spdlog::trace("cubic to {} {} over {} {}", x, y, mid.x, mid.y);

  pushCurve(start, c1, mid);
  currentRing().push_back(mid);
  pushCurve(mid, c2, end);
  currentRing().push_back(end);
}

void OutlineCollector::close() {
  spdlog::trace("close");
  if (!ringOpen_) return;
  ringOpen_ = false;
  Ring& ring = rings_.back();
  if (ring.size() > 1 && ring.back() == ring.front()) {
    ring.pop_back();
  }
  if (ring.size() < 3) {
    spdlog::debug("dropping ring with {} points", ring.size());
    rings_.pop_back();
  }
}

void OutlineCollector::apply(OutlineEvent const& event) {
  switch (event.type) {
    case OutlineEventType::MoveTo:
      moveTo(event.to.x, event.to.y);
      break;
    case OutlineEventType::LineTo:
      lineTo(event.to.x, event.to.y);
      break;
    case OutlineEventType::QuadTo:
      quadTo(event.c1.x, event.c1.y, event.to.x, event.to.y);
      break;
    case OutlineEventType::CubicTo:
      cubicTo(event.c1.x, event.c1.y, event.c2.x, event.c2.y, event.to.x, event.to.y);
      break;
    case OutlineEventType::Close:
      close();
      break;
  }
}

void OutlineCollector::apply(std::span<OutlineEvent const> events) {
  for (auto const& event : events) {
    apply(event);
  }
}

void OutlineCollector::finish() {
  close();
}

} // namespace VectorText
