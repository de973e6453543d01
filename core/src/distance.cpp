#include "curvesimp/distance.hpp"

#include <cmath>

namespace curvesimp {

void perpendicular_distances(const Point* points, std::size_t count, const Point& a, const Point& b, double* out) {
    if (count == 0) {
        return;
    }

    const double dx = b.x - a.x;
    const double dy = b.y - a.y;

    if (dx == 0.0 && dy == 0.0) {
        for (std::size_t i = 0; i < count; ++i) {
            const double ex = points[i].x - a.x;
            const double ey = points[i].y - a.y;
            out[i] = std::sqrt(ex * ex + ey * ey);
        }
        return;
    }

    const double offset = a.y * dx - a.x * dy;
    const double inv_len = 1.0 / std::sqrt(dx * dx + dy * dy);
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = std::fabs(dy * points[i].x - dx * points[i].y + offset) * inv_len;
    }
}

std::vector<double> perpendicular_distances(const std::vector<Point>& points, const Point& a, const Point& b) {
    std::vector<double> out(points.size(), 0.0);
    perpendicular_distances(points.data(), points.size(), a, b, out.data());
    return out;
}

} // namespace curvesimp
