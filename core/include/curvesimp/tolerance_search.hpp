#pragma once

#include <string>

#include "curvesimp/types.hpp"

namespace curvesimp {

bool evaluate_tolerance(const CurveData& curve, double tolerance, double* similarity, std::string* error);

SearchResult find_tolerance(const CurveData& curve, double target_similarity, const SearchSettings& settings);

} // namespace curvesimp
