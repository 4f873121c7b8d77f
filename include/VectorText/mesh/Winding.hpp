#pragma once

#include "VectorText/mesh/Geometry.hpp"

#include <span>

namespace VectorText {

// Shoelace sum over the closed ring: sum(x[i] * y[i+1] - x[i+1] * y[i]).
// Twice the signed area; positive for counter-clockwise rings in a y-up frame.
auto SignedArea(std::span<Point2D const> ring) -> float;

// Zero-area rings count as counter-clockwise.
auto IsCounterClockwise(std::span<Point2D const> ring) -> bool;

// Native (glyf) contours wind solids clockwise; PostScript-style contours wind
// them counter-clockwise. `reverseWind` is set for faces of the second kind.
auto IsHoleRing(std::span<Point2D const> ring, bool reverseWind) -> bool;

auto IsConcaveCurve(Point2D p0, Point2D control, Point2D p1, bool reverseWind) -> bool;

} // namespace VectorText
