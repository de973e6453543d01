#pragma once

#include <vector>

#include "curvesimp/types.hpp"

namespace curvesimp {

DistributionResult prepare_distribution(const std::vector<double>& x,
                                        const std::vector<double>& y,
                                        const DistributionSettings& settings);

} // namespace curvesimp
