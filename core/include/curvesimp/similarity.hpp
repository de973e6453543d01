#pragma once

#include <string>
#include <vector>

#include "curvesimp/types.hpp"

namespace curvesimp {

bool resample_linear(const CurveData& curve,
                     const std::vector<double>& xs,
                     std::vector<double>* out,
                     std::string* error);

// Zero-variance input scores 0.
bool normalized_cross_correlation(const CurveData& reference,
                                  const CurveData& candidate,
                                  double* out,
                                  std::string* error);

} // namespace curvesimp
