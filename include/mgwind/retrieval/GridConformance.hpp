#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Grid.hpp"
#include <vector>

namespace mgwind::retrieval {

inline constexpr Real DEFAULT_AXIS_TOLERANCE = 10.0;

// Throws ConfigurationError unless every grid shares the coordinate system
// of its predecessor: x, y and z axes of equal length matching within
// `tolerance`, and identical origin latitude. The first grid's axes must
// also be strictly increasing with at least two nodes each.
void checkGridConformance(const std::vector<Grid>& grids,
                          Real tolerance = DEFAULT_AXIS_TOLERANCE);

} // namespace mgwind::retrieval
