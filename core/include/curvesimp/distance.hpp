#pragma once

#include <cstddef>
#include <vector>

#include "curvesimp/types.hpp"

namespace curvesimp {

// Distance from each point to the infinite line through a and b. When a == b the
// Euclidean distance to that single point is written instead. `out` must hold
// `count` values.
void perpendicular_distances(const Point* points, std::size_t count, const Point& a, const Point& b, double* out);

std::vector<double> perpendicular_distances(const std::vector<Point>& points, const Point& a, const Point& b);

} // namespace curvesimp
