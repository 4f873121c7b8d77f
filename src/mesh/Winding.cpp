#include "VectorText/mesh/Winding.hpp"

#include <array>
#include <cstddef>

namespace VectorText {

auto SignedArea(std::span<Point2D const> ring) -> float {
  if (ring.empty()) return 0.0f;
  double sum = 0.0;
  size_t count = ring.size();
  for (size_t i = 0; i < count; ++i) {
    Point2D const& current = ring[i];
    Point2D const& next = ring[(i + 1) % count];
    sum += static_cast<double>(current.x) * next.y - static_cast<double>(next.x) * current.y;
  }
  return static_cast<float>(sum);
}

auto IsCounterClockwise(std::span<Point2D const> ring) -> bool {
  return SignedArea(ring) >= 0.0f;
}

auto IsHoleRing(std::span<Point2D const> ring, bool reverseWind) -> bool {
  return IsCounterClockwise(ring) != reverseWind;
}

auto IsConcaveCurve(Point2D p0, Point2D control, Point2D p1, bool reverseWind) -> bool {
  std::array<Point2D, 3> triangle{p0, control, p1};
  return IsCounterClockwise(triangle) != reverseWind;
}

} // namespace VectorText
