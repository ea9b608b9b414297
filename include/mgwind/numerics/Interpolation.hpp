#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/GridLevel.hpp"

namespace mgwind::numerics {

// Trilinear interpolation of a field defined on the nodes of a rectilinear
// grid level. Queries outside the source axes yield NaN (no extrapolation).
// A NaN source value only propagates when its corner carries a non-zero
// weight. The interpolator keeps references to the level and the values.
class TrilinearInterpolator {
public:
    TrilinearInterpolator(const GridLevel& level, const VectorX& values);

    // Value at an arbitrary point
    Real operator()(Real z, Real y, Real x) const;

    // Values at every node of `target`, in (z, y, x) order
    VectorX sample(const GridLevel& target) const;

    // Position of a query along one axis
    struct Bracket {
        Index lower = 0;
        Real t = 0.0;
        bool inside = false;
    };

    static Bracket locate(const VectorX& axis, Real q);

private:
    const GridLevel& level_;
    const VectorX& values_;

    Real blend(const Bracket& bz, const Bracket& by, const Bracket& bx) const;
};

// Resample `values` from one level onto the nodes of another
VectorX resample(const GridLevel& source, const VectorX& values, const GridLevel& target);

// Piecewise linear interpolation of a 1D profile (e.g. a sounding) at the
// given heights; NaN outside the profile. `heights` must be increasing.
VectorX interpolateProfile(const VectorX& heights, const VectorX& values,
                           const VectorX& targets);

} // namespace mgwind::numerics
