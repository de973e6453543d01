#include "curvesimp/distribution.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "curvesimp/curve_simplifier.hpp"
#include "curvesimp/similarity.hpp"

namespace curvesimp {

DistributionResult prepare_distribution(const std::vector<double>& x,
                                        const std::vector<double>& y,
                                        const DistributionSettings& settings) {
    DistributionResult result;
    if (x.size() != y.size()) {
        result.error = "Distribution columns differ in length: x has " + std::to_string(x.size()) +
                       " values but y has " + std::to_string(y.size());
        return result;
    }
    result.input_points = x.size();

    std::vector<Point> valid_rows;
    valid_rows.reserve(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i]) || !std::isfinite(y[i])) {
            ++result.dropped_points;
            continue;
        }
        valid_rows.push_back({x[i], y[i]});
    }

    if (valid_rows.empty()) {
        result.error = "Distribution has no finite (x, y) pairs";
        return result;
    }
    if (result.dropped_points > 0) {
        std::ostringstream oss;
        oss << "Dropped " << result.dropped_points << " non-finite row(s).";
        result.warnings.push_back(oss.str());
    }

    const bool unordered = !std::is_sorted(valid_rows.begin(), valid_rows.end(), [](const Point& a, const Point& b) {
        return a.x < b.x;
    });
    if (unordered) {
        result.warnings.push_back("Distribution x values were unsorted. Data was sorted ascending.");
        std::stable_sort(valid_rows.begin(), valid_rows.end(), [](const Point& a, const Point& b) { return a.x < b.x; });
    }

    CurveData cleaned;
    cleaned.x.reserve(valid_rows.size());
    cleaned.y.reserve(valid_rows.size());
    for (const Point& p : valid_rows) {
        cleaned.x.push_back(p.x);
        cleaned.y.push_back(p.y);
    }

    if (cleaned.size() <= settings.simplify_threshold) {
        if (cleaned.size() >= 2) {
            std::string error;
            if (!normalized_cross_correlation(cleaned, cleaned, &result.similarity, &error)) {
                result.error = error;
                return result;
            }
        }
        result.curve = std::move(cleaned);
        result.output_points = result.curve.size();
        result.success = true;
        return result;
    }

    SimplifySettings simplify_settings;
    simplify_settings.target_similarity = settings.target_similarity;
    simplify_settings.search = settings.search;

    SimplifyResult simplified = simplify_curve(cleaned, simplify_settings);
    result.warnings.insert(result.warnings.end(), simplified.warnings.begin(), simplified.warnings.end());
    if (!simplified.success) {
        result.error = simplified.error;
        return result;
    }

    result.curve = std::move(simplified.curve);
    result.output_points = result.curve.size();
    result.simplified = true;
    result.tolerance = simplified.tolerance;
    result.similarity = simplified.similarity;
    result.success = true;
    return result;
}

} // namespace curvesimp
