#include "curvesimp/douglas_peucker.hpp"

#include <utility>

#include "curvesimp/distance.hpp"

namespace curvesimp {

std::vector<std::size_t> douglas_peucker_indices(const std::vector<Point>& points, double tolerance) {
    const std::size_t n = points.size();
    std::vector<std::size_t> out;
    if (n < 3) {
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back(i);
        }
        return out;
    }

    std::vector<bool> keep(n, false);
    keep.front() = true;
    keep.back() = true;

    std::vector<double> distances(n - 2, 0.0);
    std::vector<std::pair<std::size_t, std::size_t>> stack;
    stack.push_back({0, n - 1});

    while (!stack.empty()) {
        const auto range = stack.back();
        stack.pop_back();
        const std::size_t start = range.first;
        const std::size_t end = range.second;
        if (end - start <= 1) {
            continue;
        }

        const std::size_t interior = end - start - 1;
        perpendicular_distances(&points[start + 1], interior, points[start], points[end], distances.data());

        // Strict comparison keeps the first maximum on ties.
        std::size_t max_offset = 0;
        for (std::size_t i = 1; i < interior; ++i) {
            if (distances[i] > distances[max_offset]) {
                max_offset = i;
            }
        }

        if (distances[max_offset] > tolerance) {
            const std::size_t index = start + 1 + max_offset;
            keep[index] = true;
            stack.push_back({start, index});
            stack.push_back({index, end});
        }
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (keep[i]) {
            out.push_back(i);
        }
    }
    return out;
}

CurveData select_points(const CurveData& curve, const std::vector<std::size_t>& indices) {
    CurveData out;
    out.x.reserve(indices.size());
    out.y.reserve(indices.size());
    for (std::size_t i : indices) {
        out.x.push_back(curve.x[i]);
        out.y.push_back(curve.y[i]);
    }
    return out;
}

CurveData simplify_with_tolerance(const CurveData& curve, double tolerance) {
    if (curve.size() < 3) {
        return curve;
    }
    return select_points(curve, douglas_peucker_indices(curve.points(), tolerance));
}

} // namespace curvesimp
