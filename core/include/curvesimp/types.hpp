#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace curvesimp {

struct Point {
    double x{0.0};
    double y{0.0};
};

struct CurveData {
    std::vector<double> x;
    std::vector<double> y;

    std::size_t size() const {
        return x.size();
    }

    bool is_valid() const {
        return x.size() == y.size();
    }

    std::vector<Point> points() const {
        std::vector<Point> out;
        const std::size_t n = std::min(x.size(), y.size());
        out.reserve(n);
        for (std::size_t i = 0; i < n; ++i) {
            out.push_back({x[i], y[i]});
        }
        return out;
    }
};

struct SearchSettings {
    double low{1e-6};
    double high{1.0};
    int max_iterations{50};
    double tolerance_epsilon{1e-4}; // convergence band on similarity and minimum interval width

    bool is_valid() const {
        return std::isfinite(low) && std::isfinite(high) && low >= 0.0 && low < high && max_iterations > 0 &&
               tolerance_epsilon > 0.0;
    }
};

struct SimplifySettings {
    double target_similarity{0.995};
    std::optional<double> tolerance; // set to skip the adaptive search
    SearchSettings search;

    bool is_valid() const {
        if (!(target_similarity > -1.0 && target_similarity <= 1.0)) {
            return false;
        }
        if (tolerance.has_value() && (!std::isfinite(*tolerance) || *tolerance < 0.0)) {
            return false;
        }
        return search.is_valid();
    }
};

struct SearchResult {
    bool success{false};
    std::string error;
    double tolerance{0.0};
    double similarity{0.0};
    bool converged{false};
    std::size_t evaluations{0};
    std::vector<std::string> warnings;
};

struct SimplifyResult {
    bool success{false};
    std::string error;
    CurveData curve;
    std::vector<std::size_t> indices;
    double tolerance{0.0};
    double similarity{0.0};
    bool searched{false};
    std::vector<std::string> warnings;
};

struct DistributionSettings {
    std::size_t simplify_threshold{100};
    double target_similarity{0.998};
    SearchSettings search;
};

struct DistributionResult {
    bool success{false};
    std::string error;
    CurveData curve;
    std::size_t input_points{0};
    std::size_t dropped_points{0};
    std::size_t output_points{0};
    bool simplified{false};
    double tolerance{0.0};
    double similarity{0.0};
    std::vector<std::string> warnings;
};

} // namespace curvesimp
