#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/Field.hpp"
#include "mgwind/core/Grid.hpp"
#include "mgwind/core/WindField.hpp"
#include <string>

namespace mgwind::physics {

// Effective earth radius of the 4/3 refraction model
inline constexpr Real EARTH_RADIUS = 6371000.0;
inline constexpr Real EFFECTIVE_EARTH_RADIUS = EARTH_RADIUS * Real(4) / Real(3);

inline constexpr Real DEFAULT_FREEZING_LEVEL = 4500.0;

// Air density relative to the surface, rho = exp(-z / 10000)
Real referenceDensity(Real z);

// Terminal velocity of hydrometeors (m/s, negative downward) for one
// reflectivity (dBZ) at height z
Real terminalVelocity(Real reflectivity, Real z, Real freezingLevel = DEFAULT_FREEZING_LEVEL);

// Terminal fall speed of every node of `grid` from its reflectivity field.
// Masked wherever the reflectivity is masked.
Field3D fallSpeed(const Grid& grid, const std::string& reflectivityField,
                  Real freezingLevel = DEFAULT_FREEZING_LEVEL);

// Azimuth and elevation of a point as seen from a radar, in degrees.
// Azimuth is clockwise from north in [0, 360).
struct BeamAngles {
    Real azimuth = 0.0;
    Real elevation = 0.0;
};

BeamAngles beamAngles(Real dx, Real dy, Real height);

// Adds "AZ" and "EL" fields (degrees) to `grid`, masked where the
// reflectivity is masked. Existing fields of that name are replaced.
void annotateAngles(Grid& grid, const std::string& reflectivityField);

// Beam crossing angle (radians) between two radars at every horizontal node
// of `level`, in (y, x) order. NaN at the radar sites.
VectorX beamCrossingAngle(const RadarSite& siteA, const RadarSite& siteB,
                          const GridLevel& level);

// Radial velocity seen by a radar for the given winds. Angles are in
// radians. Masked where an angle or the wind is undefined; a masked fall
// speed counts as zero.
Field3D radialVelocity(const WindField& winds, const Field3D& azimuth,
                       const Field3D& elevation, const Field3D& fallSpeed);

} // namespace mgwind::physics
