#pragma once

#include <optional>

#include "curvesimp/types.hpp"

namespace curvesimp {

SimplifyResult simplify_curve(const CurveData& curve, const SimplifySettings& settings);

// Caches the tolerance resolved for the first curve it simplifies and applies it
// to every later curve. Use one instance per curve family, or per thread.
class CurveSimplifier {
public:
    explicit CurveSimplifier(double target_similarity = 0.995);
    explicit CurveSimplifier(const SimplifySettings& settings);

    SimplifyResult simplify(const CurveData& curve);

    double target_similarity() const;
    void set_target_similarity(double target_similarity);

    const std::optional<double>& resolved_tolerance() const;
    void reset();

private:
    SimplifySettings settings_;
    std::optional<double> resolved_tolerance_;
};

} // namespace curvesimp
