#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/WindField.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include <string>
#include <vector>

namespace mgwind::retrieval {

struct AssemblyOptions {
    std::string velocityField = "corrected_velocity";   // metadata template
    Real minBca = 30.0;
    Real maxBca = 150.0;
    bool maskOutsideOpt = false;    // mask u, v, w outside the weighted region
    bool maskWOutsideOpt = true;    // mask w outside the weighted region
};

// Names of the output fields
inline const std::string U_FIELD = "u";
inline const std::string V_FIELD = "v";
inline const std::string W_FIELD = "w";

// Sum of the observation and model weights of every cell
VectorX combinedWeight(const physics::WeightSet& weights);

// Output field for one wind component: metadata copied from `templateField`,
// values from `winds`, masked where `mask` is set or the value is not finite
GridField windComponentField(const GridField& templateField, const WindField& winds,
                             WindComponent component, const std::vector<bool>& mask,
                             const AssemblyOptions& options);

// Copies of every grid with identical u, v and w fields added (replacing any
// existing ones)
std::vector<Grid> assembleResult(const std::vector<Grid>& grids,
                                 const WindField& winds,
                                 const physics::WeightSet& weights,
                                 const AssemblyOptions& options = AssemblyOptions());

} // namespace mgwind::retrieval
