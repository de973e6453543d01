#include "curvesimp/tolerance_search.hpp"

#include <cmath>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "curvesimp/douglas_peucker.hpp"
#include "curvesimp/similarity.hpp"

namespace curvesimp {
namespace {

struct Interval {
    double low{0.0};
    double high{0.0};
    int depth{0};
};

} // namespace

bool evaluate_tolerance(const CurveData& curve, double tolerance, double* similarity, std::string* error) {
    const CurveData simplified = simplify_with_tolerance(curve, tolerance);
    return normalized_cross_correlation(curve, simplified, similarity, error);
}

SearchResult find_tolerance(const CurveData& curve, double target_similarity, const SearchSettings& settings) {
    SearchResult result;
    result.tolerance = settings.high;
    if (!curve.is_valid()) {
        result.error = "Malformed curve: x has " + std::to_string(curve.x.size()) + " values but y has " +
                       std::to_string(curve.y.size());
        return result;
    }
    if (curve.size() < 2) {
        result.error = "Tolerance search needs at least 2 points, got " + std::to_string(curve.size());
        return result;
    }
    if (!settings.is_valid()) {
        result.error =
            "Invalid search settings (require 0 <= low < high, max_iterations > 0, tolerance_epsilon > 0).";
        return result;
    }

    // The point view is built once and shared by every evaluation.
    const std::vector<Point> points = curve.points();
    std::string error;
    bool failed = false;
    auto score = [&](double tolerance) {
        ++result.evaluations;
        double similarity = 0.0;
        if (!normalized_cross_correlation(curve, select_points(curve, douglas_peucker_indices(points, tolerance)),
                                          &similarity,
                                          &error)) {
            failed = true;
            return 0.0;
        }
        return similarity;
    };

    double best_diff = std::numeric_limits<double>::infinity();
    bool have_best = false;

    std::vector<Interval> stack;
    stack.push_back({settings.low, settings.high, 0});

    while (!stack.empty()) {
        const Interval interval = stack.back();
        stack.pop_back();

        if (interval.depth >= settings.max_iterations || interval.high - interval.low < settings.tolerance_epsilon) {
            continue;
        }

        const double mid = (interval.low + interval.high) / 2.0;
        const double mid_similarity = score(mid);
        if (failed) {
            break;
        }

        const double diff = std::fabs(target_similarity - mid_similarity);
        if (diff < settings.tolerance_epsilon) {
            result.tolerance = mid;
            result.similarity = mid_similarity;
            result.converged = true;
            result.success = true;
            return result;
        }

        if (diff < best_diff) {
            best_diff = diff;
            result.tolerance = mid;
            result.similarity = mid_similarity;
            have_best = true;
        }

        const double left_similarity = score((interval.low + mid) / 2.0);
        const double right_similarity = score((mid + interval.high) / 2.0);
        if (failed) {
            break;
        }

        if (std::fabs(left_similarity - target_similarity) < std::fabs(right_similarity - target_similarity)) {
            stack.push_back({interval.low, mid, interval.depth + 1});
        } else {
            stack.push_back({mid, interval.high, interval.depth + 1});
        }
    }

    if (failed) {
        result.error = "Tolerance search aborted: " + error;
        return result;
    }

    if (!have_best) {
        // Nothing was evaluated; score the fallback so the caller still sees its similarity.
        result.similarity = score(result.tolerance);
        if (failed) {
            result.error = "Tolerance search aborted: " + error;
            return result;
        }
    }

    std::ostringstream oss;
    oss << "Tolerance search did not reach target similarity " << target_similarity << "; using tolerance "
        << result.tolerance << " (similarity " << result.similarity << ").";
    result.warnings.push_back(oss.str());
    result.success = true;
    return result;
}

} // namespace curvesimp
