#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/numerics/GridTransfer.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include <optional>
#include <vector>

namespace mgwind::retrieval {

// Caller-supplied weights that replace the computed ones verbatim
struct WeightOverrides {
    std::optional<std::vector<VectorX>> observation;   // one per radar
    std::optional<VectorX> background;
    std::optional<std::vector<VectorX>> model;         // one per model field set
};

// Options of the coverage computation
struct CoverageOptions {
    Real minBca = 30.0;     // degrees
    Real maxBca = 150.0;    // degrees
};

// Observation, background and model weights on the fine level.
//
// Every unordered radar pair contributes to the observation weight of both
// radars where their beam crossing angle lies in [minBca, maxBca] and the
// radar has a valid observation. Weights are clipped to {0, 1} after the
// reduction. The background weight is 1 where some pair has a defined
// crossing angle but no radar is weighted. A single radar weights its valid
// observations and leaves the rest to the background.
physics::WeightSet buildWeights(const GridLevel& level,
                                const std::vector<RadarSite>& sites,
                                const physics::ObservationSet& observations,
                                std::size_t numModels,
                                const CoverageOptions& options = CoverageOptions(),
                                const WeightOverrides& overrides = WeightOverrides());

// Summed observation weights normalised by their maximum; zero when nothing
// is covered
VectorX coverageGrade(const physics::WeightSet& weights);

// Weights interpolated to the coarse level; cells without a defined
// interpolant get zero weight
physics::WeightSet restrictWeights(const physics::WeightSet& fine,
                                   const numerics::GridTransfer& transfer);

} // namespace mgwind::retrieval
