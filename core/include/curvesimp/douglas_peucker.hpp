#pragma once

#include <cstddef>
#include <vector>

#include "curvesimp/types.hpp"

namespace curvesimp {

std::vector<std::size_t> douglas_peucker_indices(const std::vector<Point>& points, double tolerance);

CurveData select_points(const CurveData& curve, const std::vector<std::size_t>& indices);

CurveData simplify_with_tolerance(const CurveData& curve, double tolerance);

} // namespace curvesimp
