#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/WindField.hpp"
#include <string>
#include <vector>

namespace mgwind::io {

// Analytic wind field used to fabricate radar observations:
//   u = u0 + shear * z / 1000
//   v = v0
//   w = wAmplitude * sin(pi * (z - zmin) / (zmax - zmin))
struct SyntheticFlow {
    Real u0 = 3.0;
    Real v0 = 3.0;
    Real shear = 0.0;           // m/s per km
    Real wAmplitude = 0.0;
    Real reflectivity = 30.0;   // dBZ, uniform
};

// The analytic winds on every node of `level`
WindField synthesizeWinds(const GridLevel& level, const SyntheticFlow& flow);

// Grid of one radar observing `truth`: a uniform reflectivity field and the
// radial velocity (fall speed included) of every node
Grid syntheticRadarGrid(const GridLevel& level,
                        const RadarSite& site,
                        const WindField& truth,
                        const SyntheticFlow& flow,
                        const std::string& velocityField = "corrected_velocity",
                        const std::string& reflectivityField = "reflectivity",
                        Real freezingLevel = 4500.0);

// One grid per site observing the analytic flow
std::vector<Grid> syntheticCase(const GridLevel& level,
                                const std::vector<RadarSite>& sites,
                                const SyntheticFlow& flow,
                                const std::string& velocityField = "corrected_velocity",
                                const std::string& reflectivityField = "reflectivity",
                                Real freezingLevel = 4500.0);

} // namespace mgwind::io
