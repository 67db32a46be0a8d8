#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "../core/types.hpp"

namespace mathud::geometry {

using Triangle = std::array<std::size_t, 3>;

// Twice the signed area; positive for counter-clockwise in a y-up frame.
[[nodiscard]] double signed_area2(const std::vector<core::Point2D>& loop);

// Ear-clipping triangulation of a simple polygon given as an open loop.
// Returns indices into `loop`, n - 2 triangles for n distinct vertices.
// Self-intersecting input cannot always be clipped; the remainder is then
// fanned from its first vertex so the whole outline is still covered.
[[nodiscard]] std::vector<Triangle> triangulate_polygon(const std::vector<core::Point2D>& loop);

} // namespace mathud::geometry
