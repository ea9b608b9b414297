#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/GridLevel.hpp"
#include <string>
#include <vector>

namespace mgwind::physics {

// Observations of one radar on one grid level. Angles are in radians.
struct RadarObservations {
    Field3D radialVelocity;
    Field3D fallSpeed;
    Field3D azimuth;
    Field3D elevation;
};

// Per-radar observations, immutable once built for a level
struct ObservationSet {
    std::vector<RadarObservations> radars;

    std::size_t numRadars() const { return radars.size(); }
};

// Weights of every constraint on one level, each in (z, y, x) order
struct WeightSet {
    std::vector<VectorX> observation;   // one per radar
    VectorX background;
    std::vector<VectorX> model;         // one per model field set
};

// Numerical model winds used as a soft constraint
struct ModelWinds {
    std::string name;
    Field3D u;
    Field3D v;
    Field3D w;
};

// Background (sounding) wind, one value per vertical level; NaN where the
// sounding does not reach
struct BackgroundProfile {
    VectorX u;
    VectorX v;

    static BackgroundProfile zeros(Index nz) {
        return {VectorX::Zero(nz), VectorX::Zero(nz)};
    }
};

// Everything the cost function sees at one resolution
struct AnalysisLevel {
    GridLevel grid;
    ObservationSet observations;
    WeightSet weights;
    BackgroundProfile background;
    std::vector<ModelWinds> models;
    Real rmsVr = 1.0;   // radial velocity normalisation of the observation term

    const Shape3& shape() const { return grid.shape(); }
};

} // namespace mgwind::physics
