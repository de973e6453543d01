#include "curvesimp/similarity.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numeric>

namespace curvesimp {
namespace {

void set_error(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

bool is_sorted_by_x(const CurveData& curve) {
    return std::is_sorted(curve.x.begin(), curve.x.end());
}

CurveData sorted_by_x(const CurveData& curve) {
    std::vector<std::size_t> order(curve.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) { return curve.x[a] < curve.x[b]; });

    CurveData out;
    out.x.reserve(order.size());
    out.y.reserve(order.size());
    for (std::size_t i : order) {
        out.x.push_back(curve.x[i]);
        out.y.push_back(curve.y[i]);
    }
    return out;
}

double interpolate(const CurveData& curve, double q) {
    const std::size_t n = curve.size();
    const auto it = std::upper_bound(curve.x.begin(), curve.x.end(), q);
    std::size_t hi = static_cast<std::size_t>(it - curve.x.begin());
    hi = std::min(std::max<std::size_t>(hi, 1), n - 1);
    const std::size_t lo = hi - 1;

    const double x0 = curve.x[lo];
    const double x1 = curve.x[hi];
    const double y0 = curve.y[lo];
    const double y1 = curve.y[hi];
    if (x1 == x0) {
        return y1;
    }
    return y0 + (q - x0) * (y1 - y0) / (x1 - x0);
}

void mean_and_std(const std::vector<double>& values, double* mean, double* std_dev) {
    double sum = 0.0;
    for (double v : values) {
        sum += v;
    }
    const double m = sum / static_cast<double>(values.size());

    double sq = 0.0;
    for (double v : values) {
        sq += (v - m) * (v - m);
    }
    *mean = m;
    *std_dev = std::sqrt(sq / static_cast<double>(values.size()));
}

} // namespace

bool resample_linear(const CurveData& curve,
                     const std::vector<double>& xs,
                     std::vector<double>* out,
                     std::string* error) {
    if (!curve.is_valid()) {
        set_error(error,
                  "Cannot resample curve: x has " + std::to_string(curve.x.size()) + " values but y has " +
                      std::to_string(curve.y.size()));
        return false;
    }
    if (curve.size() < 2) {
        set_error(error,
                  "Cannot resample curve: at least 2 points are required, got " + std::to_string(curve.size()));
        return false;
    }

    out->clear();
    out->reserve(xs.size());
    if (is_sorted_by_x(curve)) {
        for (double q : xs) {
            out->push_back(interpolate(curve, q));
        }
    } else {
        const CurveData sorted = sorted_by_x(curve);
        for (double q : xs) {
            out->push_back(interpolate(sorted, q));
        }
    }
    return true;
}

bool normalized_cross_correlation(const CurveData& reference,
                                  const CurveData& candidate,
                                  double* out,
                                  std::string* error) {
    if (!reference.is_valid()) {
        set_error(error,
                  "Reference curve is malformed: x has " + std::to_string(reference.x.size()) + " values but y has " +
                      std::to_string(reference.y.size()));
        return false;
    }
    if (reference.size() == 0) {
        set_error(error, "Reference curve is empty");
        return false;
    }

    std::vector<double> resampled;
    if (!resample_linear(candidate, reference.x, &resampled, error)) {
        return false;
    }

    double mean_ref = 0.0;
    double std_ref = 0.0;
    double mean_cand = 0.0;
    double std_cand = 0.0;
    mean_and_std(reference.y, &mean_ref, &std_ref);
    mean_and_std(resampled, &mean_cand, &std_cand);

    if (std_ref == 0.0 || std_cand == 0.0) {
        *out = 0.0;
        return true;
    }

    double sum = 0.0;
    for (std::size_t i = 0; i < resampled.size(); ++i) {
        sum += (reference.y[i] - mean_ref) * (resampled[i] - mean_cand);
    }
    *out = sum / (std_ref * std_cand * static_cast<double>(resampled.size()));
    return true;
}

} // namespace curvesimp
