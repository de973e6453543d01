#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

#include "curvesimp/curve_simplifier.hpp"
#include "curvesimp/tolerance_search.hpp"

namespace {

// Cumulative log-normal distribution on a normalized diameter axis with a small
// deterministic ripple, like a measured particle-size curve.
curvesimp::CurveData make_synthetic_cdf(std::size_t rows) {
    curvesimp::CurveData curve;
    curve.x.reserve(rows);
    curve.y.reserve(rows);

    const double mu = std::log(0.3);
    const double sigma = 0.6;
    for (std::size_t i = 0; i < rows; ++i) {
        const double x = 0.01 + 0.99 * static_cast<double>(i) / static_cast<double>(rows - 1);
        const double z = (std::log(x) - mu) / (sigma * std::sqrt(2.0));
        const double ripple = 0.002 * std::sin(static_cast<double>(i) * 0.37);
        curve.x.push_back(x);
        curve.y.push_back(0.5 * (1.0 + std::erf(z)) + ripple);
    }
    return curve;
}

} // namespace

int main(int argc, char** argv) {
    const std::size_t rows = (argc > 1) ? static_cast<std::size_t>(std::stoull(argv[1])) : 1000;
    const double target = (argc > 2) ? std::atof(argv[2]) : 0.995;
    if (rows < 3) {
        std::cerr << "rows must be >= 3\n";
        return 1;
    }

    const curvesimp::CurveData curve = make_synthetic_cdf(rows);

    const auto search_start = std::chrono::steady_clock::now();
    const curvesimp::SearchResult search = curvesimp::find_tolerance(curve, target, curvesimp::SearchSettings{});
    const auto search_end = std::chrono::steady_clock::now();
    if (!search.success) {
        std::cerr << "Tolerance search failed: " << search.error << "\n";
        return 1;
    }

    curvesimp::SimplifySettings settings;
    settings.tolerance = search.tolerance;

    const auto simplify_start = std::chrono::steady_clock::now();
    const curvesimp::SimplifyResult result = curvesimp::simplify_curve(curve, settings);
    const auto simplify_end = std::chrono::steady_clock::now();

    if (!result.success) {
        std::cerr << "Simplification failed: " << result.error << "\n";
        return 1;
    }

    const auto search_ms = std::chrono::duration_cast<std::chrono::milliseconds>(search_end - search_start).count();
    const auto simplify_us =
        std::chrono::duration_cast<std::chrono::microseconds>(simplify_end - simplify_start).count();

    std::cout << "Points: " << curve.size() << "\n";
    std::cout << "Search ms: " << search_ms << " (" << search.evaluations << " evaluations)\n";
    std::cout << "Simplify us: " << simplify_us << "\n";
    std::cout << "Tolerance: " << search.tolerance << (search.converged ? "" : " (best effort)") << "\n";
    std::cout << "Kept points: " << result.curve.size() << "\n";
    std::cout << "Similarity: " << result.similarity << "\n";
    for (const auto& w : search.warnings) {
        std::cout << "warning: " << w << "\n";
    }
    return 0;
}
