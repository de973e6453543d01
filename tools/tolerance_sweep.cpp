#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "curvesimp/douglas_peucker.hpp"
#include "curvesimp/tolerance_search.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [rows=1000] [tol_min=1e-4] [tol_max=0.1] [steps=20] [noise=0.002]\n";
}

curvesimp::CurveData make_curve(std::size_t rows, double noise) {
    curvesimp::CurveData curve;
    for (std::size_t i = 0; i < rows; ++i) {
        const double x = static_cast<double>(i) / static_cast<double>(rows - 1);
        // Two-mode cumulative curve with a deterministic ripple.
        const double y = 0.6 / (1.0 + std::exp(-(x - 0.3) * 25.0)) + 0.4 / (1.0 + std::exp(-(x - 0.75) * 40.0)) +
                         noise * std::sin(static_cast<double>(i) * 1.7);
        curve.x.push_back(x);
        curve.y.push_back(y);
    }
    return curve;
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_usage(argv[0]);
        return 0;
    }

    const std::size_t rows = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 1000;
    const double tol_min = (argc > 2) ? std::atof(argv[2]) : 1e-4;
    const double tol_max = (argc > 3) ? std::atof(argv[3]) : 0.1;
    const std::size_t steps = (argc > 4) ? static_cast<std::size_t>(std::strtoull(argv[4], nullptr, 10)) : 20;
    const double noise = (argc > 5) ? std::atof(argv[5]) : 0.002;

    if (rows < 3) {
        std::cerr << "rows must be >= 3\n";
        return 1;
    }
    if (tol_min <= 0.0 || tol_max <= tol_min) {
        std::cerr << "require 0 < tol_min < tol_max\n";
        return 1;
    }
    if (steps < 2) {
        std::cerr << "steps must be >= 2\n";
        return 1;
    }

    const curvesimp::CurveData curve = make_curve(rows, noise);
    const std::vector<curvesimp::Point> points = curve.points();

    // Log-spaced tolerances, since kept points fall off roughly with log(tolerance).
    const double ratio = std::pow(tol_max / tol_min, 1.0 / static_cast<double>(steps - 1));
    std::cout << "tolerance,kept_points,compression_ratio,similarity\n";
    std::cout << std::fixed << std::setprecision(6);
    double tolerance = tol_min;
    for (std::size_t i = 0; i < steps; ++i) {
        double similarity = 0.0;
        std::string error;
        if (!curvesimp::evaluate_tolerance(curve, tolerance, &similarity, &error)) {
            std::cerr << "Evaluation failed at tolerance " << tolerance << ": " << error << "\n";
            return 1;
        }
        const std::size_t kept = curvesimp::douglas_peucker_indices(points, tolerance).size();
        std::cout << tolerance << ',' << kept << ','
                  << static_cast<double>(rows) / static_cast<double>(kept) << ',' << similarity << '\n';
        tolerance *= ratio;
    }
    return 0;
}
