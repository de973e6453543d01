#include "curvesimp/curve_simplifier.hpp"

#include <string>

#include "curvesimp/douglas_peucker.hpp"
#include "curvesimp/similarity.hpp"
#include "curvesimp/tolerance_search.hpp"

namespace curvesimp {

SimplifyResult simplify_curve(const CurveData& curve, const SimplifySettings& settings) {
    SimplifyResult result;
    if (!settings.is_valid()) {
        result.error = "Invalid simplify settings (require target_similarity in (-1, 1], tolerance >= 0, "
                       "0 <= search.low < search.high, max_iterations > 0, tolerance_epsilon > 0).";
        return result;
    }
    if (!curve.is_valid()) {
        result.error = "Malformed curve: x has " + std::to_string(curve.x.size()) + " values but y has " +
                       std::to_string(curve.y.size());
        return result;
    }

    if (curve.size() < 3) {
        result.success = true;
        result.curve = curve;
        for (std::size_t i = 0; i < curve.size(); ++i) {
            result.indices.push_back(i);
        }
        result.tolerance = settings.tolerance.value_or(0.0);
        if (curve.size() == 2) {
            std::string error;
            if (!normalized_cross_correlation(curve, curve, &result.similarity, &error)) {
                result.success = false;
                result.error = "Failed to score curve: " + error;
                return result;
            }
        }
        result.warnings.push_back("Curve has fewer than 3 points; returned unchanged.");
        return result;
    }

    if (settings.tolerance.has_value()) {
        result.tolerance = *settings.tolerance;
    } else {
        SearchResult search = find_tolerance(curve, settings.target_similarity, settings.search);
        if (!search.success) {
            result.error = search.error;
            return result;
        }
        result.tolerance = search.tolerance;
        result.searched = true;
        result.warnings.insert(result.warnings.end(), search.warnings.begin(), search.warnings.end());
    }

    result.indices = douglas_peucker_indices(curve.points(), result.tolerance);
    result.curve = select_points(curve, result.indices);

    std::string error;
    if (!normalized_cross_correlation(curve, result.curve, &result.similarity, &error)) {
        result.error = "Failed to score simplified curve: " + error;
        return result;
    }

    result.success = true;
    return result;
}

CurveSimplifier::CurveSimplifier(double target_similarity) {
    settings_.target_similarity = target_similarity;
}

CurveSimplifier::CurveSimplifier(const SimplifySettings& settings) : settings_(settings) {
    if (settings_.tolerance.has_value()) {
        resolved_tolerance_ = settings_.tolerance;
    }
}

SimplifyResult CurveSimplifier::simplify(const CurveData& curve) {
    if (resolved_tolerance_.has_value()) {
        SimplifySettings fixed = settings_;
        fixed.tolerance = resolved_tolerance_;
        return simplify_curve(curve, fixed);
    }

    SimplifyResult result = simplify_curve(curve, settings_);
    // A curve too short to simplify says nothing about the tolerance to cache.
    if (result.success && curve.size() >= 3) {
        resolved_tolerance_ = result.tolerance;
    }
    return result;
}

double CurveSimplifier::target_similarity() const {
    return settings_.target_similarity;
}

void CurveSimplifier::set_target_similarity(double target_similarity) {
    settings_.target_similarity = target_similarity;
    reset();
}

const std::optional<double>& CurveSimplifier::resolved_tolerance() const {
    return resolved_tolerance_;
}

void CurveSimplifier::reset() {
    resolved_tolerance_ = settings_.tolerance;
}

} // namespace curvesimp
