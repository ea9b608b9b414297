// === src/physics/RadarGeometry.cpp ===
#include "mgwind/physics/RadarGeometry.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace mgwind::physics {

Real referenceDensity(Real z) {
    return std::exp(-z / Real(10000));
}

Real terminalVelocity(Real reflectivity, Real z, Real freezingLevel) {
    Real a, b;
    if (z < freezingLevel) {
        // Rain
        if (reflectivity < 55) {
            a = -2.6;
            b = 0.0107;
        } else if (reflectivity < 60) {
            a = -2.5;
            b = 0.013;
        } else {
            a = -3.95;
            b = 0.0148;
        }
    } else {
        // Ice
        if (reflectivity < 33) {
            a = -0.817;
            b = 0.0063;
        } else if (reflectivity < 49) {
            a = -2.5;
            b = 0.013;
        } else {
            a = -3.95;
            b = 0.0148;
        }
    }
    return a * std::pow(Real(10), b * reflectivity) *
           std::pow(Real(1.2) / referenceDensity(z), Real(0.4));
}

Field3D fallSpeed(const Grid& grid, const std::string& reflectivityField, Real freezingLevel) {
    const Field3D& refl = grid.field(reflectivityField).data;
    const Shape3& s = grid.shape();
    Field3D vt(s);
    for (Index k = 0; k < s.nz; ++k) {
        const Real z = grid.z()[k];
        for (Index p = k * s.planeSize(); p < (k + 1) * s.planeSize(); ++p) {
            if (refl.isMasked(p) || !std::isfinite(refl[p])) {
                vt.setMasked(p, true);
                continue;
            }
            vt[p] = terminalVelocity(refl[p], z, freezingLevel);
        }
    }
    return vt;
}

BeamAngles beamAngles(Real dx, Real dy, Real height) {
    BeamAngles angles;
    Real az = std::atan2(dx, dy) * RAD_TO_DEG;
    angles.azimuth = az < 0 ? az + Real(360) : az;

    // Target position in the plane through the earth centre, radar at the
    // origin and the centre at (0, -R)
    const Real R = EFFECTIVE_EARTH_RADIUS;
    const Real s = std::hypot(dx, dy);
    const Real theta = s / R;
    const Real along = (R + height) * std::sin(theta);
    const Real up = (R + height) * std::cos(theta) - R;
    angles.elevation = std::atan2(up, along) * RAD_TO_DEG;
    return angles;
}

void annotateAngles(Grid& grid, const std::string& reflectivityField) {
    const Field3D& refl = grid.field(reflectivityField).data;
    const Shape3& s = grid.shape();
    const RadarSite& site = grid.site();

    Field3D az(s), el(s);
    for (Index k = 0; k < s.nz; ++k) {
        for (Index j = 0; j < s.ny; ++j) {
            for (Index i = 0; i < s.nx; ++i) {
                const Index p = s.index(k, j, i);
                if (refl.isMasked(p)) {
                    az.setMasked(p, true);
                    el.setMasked(p, true);
                    continue;
                }
                BeamAngles angles = beamAngles(grid.x()[i] - site.x, grid.y()[j] - site.y,
                                               grid.z()[k] - site.altitude);
                az[p] = angles.azimuth;
                el[p] = angles.elevation;
            }
        }
    }

    GridField azField(std::move(az), "degrees");
    azField.standardName = "azimuth";
    azField.longName = "Azimuth of the radar beam";
    GridField elField(std::move(el), "degrees");
    elField.standardName = "elevation";
    elField.longName = "Elevation of the radar beam";
    grid.addField("AZ", std::move(azField), true);
    grid.addField("EL", std::move(elField), true);
}

VectorX beamCrossingAngle(const RadarSite& siteA, const RadarSite& siteB,
                          const GridLevel& level) {
    const Shape3& s = level.shape();
    const Real c2 = sqr(siteA.x - siteB.x) + sqr(siteA.y - siteB.y);

    VectorX bca(s.planeSize());
    for (Index j = 0; j < s.ny; ++j) {
        for (Index i = 0; i < s.nx; ++i) {
            const Real x = level.x()[i];
            const Real y = level.y()[j];
            const Real a2 = sqr(x - siteA.x) + sqr(y - siteA.y);
            const Real b2 = sqr(x - siteB.x) + sqr(y - siteB.y);
            const Real denom = Real(2) * std::sqrt(a2) * std::sqrt(b2);
            if (denom <= Real(0)) {
                bca[j * s.nx + i] = NaN;
                continue;
            }
            Real cosine = (a2 + b2 - c2) / denom;
            cosine = std::max(Real(-1), std::min(Real(1), cosine));
            bca[j * s.nx + i] = std::acos(cosine);
        }
    }
    return bca;
}

Field3D radialVelocity(const WindField& winds, const Field3D& azimuth,
                       const Field3D& elevation, const Field3D& fallSpeed) {
    const Shape3& s = winds.shape();
    if (azimuth.shape() != s || elevation.shape() != s || fallSpeed.shape() != s) {
        throw ConfigurationError("Angle and fall speed fields must match the wind field shape");
    }

    auto u = winds.u();
    auto v = winds.v();
    auto w = winds.w();
    VectorX vr(s.size());
    for (Index p = 0; p < s.size(); ++p) {
        if (azimuth.isMasked(p) || elevation.isMasked(p)) {
            vr[p] = NaN;
            continue;
        }
        const Real az = azimuth[p];
        const Real el = elevation[p];
        const Real vt = fallSpeed.isValid(p) ? fallSpeed[p] : Real(0);
        vr[p] = std::cos(el) * std::sin(az) * u[p] + std::cos(el) * std::cos(az) * v[p] +
                std::sin(el) * (w[p] - std::abs(vt));
    }
    return Field3D::fromFilled(s, vr);
}

} // namespace mgwind::physics
