#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/WindField.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include "mgwind/physics/CostFunction.hpp"
#include "mgwind/physics/RadarGeometry.hpp"
#include "mgwind/retrieval/GridConformance.hpp"
#include "mgwind/retrieval/WeightBuilder.hpp"
#include "mgwind/solvers/Multigrid.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mgwind::retrieval {

// Settings of one retrieval call
struct RetrievalSettings {
    physics::CostParameters cost;
    solvers::MultigridSettings multigrid;

    Real minBca = 30.0;                 // degrees
    Real maxBca = 150.0;                // degrees
    bool maskOutsideOpt = false;
    bool maskWOutsideOpt = true;

    std::string velocityField = "corrected_velocity";
    std::string reflectivityField = "reflectivity";
    Real freezingLevel = physics::DEFAULT_FREEZING_LEVEL;
    Real axisTolerance = DEFAULT_AXIS_TOLERANCE;

    void validate(bool haveModelFields) const;
};

// Wind sounding used by the background constraint
struct Sounding {
    VectorX z;
    VectorX u;
    VectorX v;
};

// Per-call inputs besides the grids
struct RetrievalInputs {
    Field3D u0;
    Field3D v0;
    Field3D w0;
    std::optional<Sounding> sounding;
    std::vector<std::string> modelFields;   // reads U_<name>, V_<name>, W_<name>
    WeightOverrides weights;
};

struct RetrievalResult {
    std::vector<Grid> grids;                // input grids with u, v, w added
    WindField winds;
    physics::WeightSet weights;             // fine-level weights
    Real rmsVr = 1.0;
    std::vector<solvers::CycleDiagnostics> history;
};

// Fine and coarse analysis levels of a retrieval
struct AnalysisLevels {
    physics::AnalysisLevel fine;
    physics::AnalysisLevel coarse;
};

// Observations, weights, background and model winds on both levels.
// `grids` receive the AZ and EL fields.
AnalysisLevels buildAnalysisLevels(std::vector<Grid>& grids,
                                   const RetrievalInputs& inputs,
                                   const RetrievalSettings& settings);

// Root mean square of the weighted radial velocities of a level; 1 when no
// cell is weighted
Real weightedRmsVr(const physics::AnalysisLevel& level);

// Multigrid variational retrieval of (u, v, w) from the radial velocities
// of every grid
RetrievalResult retrieveWinds(const std::vector<Grid>& grids,
                              const RetrievalInputs& inputs,
                              const RetrievalSettings& settings,
                              const physics::CostFunction& costFunction);

// Same, with the reference variational cost function
RetrievalResult retrieveWinds(const std::vector<Grid>& grids,
                              const RetrievalInputs& inputs,
                              const RetrievalSettings& settings);

} // namespace mgwind::retrieval
