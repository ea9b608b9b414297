// === src/io/SyntheticCase.cpp ===
#include "mgwind/io/SyntheticCase.hpp"
#include "mgwind/physics/RadarGeometry.hpp"
#include <cmath>

namespace mgwind::io {

WindField synthesizeWinds(const GridLevel& level, const SyntheticFlow& flow) {
    const Shape3& s = level.shape();
    WindField winds(s);
    auto u = winds.u();
    auto v = winds.v();
    auto w = winds.w();

    const Real zmin = level.z()[0];
    const Real zmax = level.z()[s.nz - 1];
    for (Index k = 0; k < s.nz; ++k) {
        const Real z = level.z()[k];
        const Real profile = zmax > zmin ? std::sin(PI * (z - zmin) / (zmax - zmin)) : Real(0);
        for (Index p = k * s.planeSize(); p < (k + 1) * s.planeSize(); ++p) {
            u[p] = flow.u0 + flow.shear * z / Real(1000);
            v[p] = flow.v0;
            w[p] = flow.wAmplitude * profile;
        }
    }
    return winds;
}

Grid syntheticRadarGrid(const GridLevel& level,
                        const RadarSite& site,
                        const WindField& truth,
                        const SyntheticFlow& flow,
                        const std::string& velocityField,
                        const std::string& reflectivityField,
                        Real freezingLevel) {
    Grid grid(level, site);

    GridField refl(Field3D(level.shape(), flow.reflectivity), "dBZ");
    refl.standardName = "equivalent_reflectivity_factor";
    refl.longName = "Reflectivity";
    grid.addField(reflectivityField, std::move(refl));

    Field3D vt = physics::fallSpeed(grid, reflectivityField, freezingLevel);
    physics::annotateAngles(grid, reflectivityField);

    Field3D az = grid.field("AZ").data;
    Field3D el = grid.field("EL").data;
    az.data() *= DEG_TO_RAD;
    el.data() *= DEG_TO_RAD;

    GridField vr(physics::radialVelocity(truth, az, el, vt), "m/s");
    vr.standardName = "radial_velocity_of_scatterers_away_from_instrument";
    vr.longName = "Corrected mean Doppler velocity";
    grid.addField(velocityField, std::move(vr));
    return grid;
}

std::vector<Grid> syntheticCase(const GridLevel& level,
                                const std::vector<RadarSite>& sites,
                                const SyntheticFlow& flow,
                                const std::string& velocityField,
                                const std::string& reflectivityField,
                                Real freezingLevel) {
    WindField truth = synthesizeWinds(level, flow);
    std::vector<Grid> grids;
    for (const RadarSite& site : sites) {
        grids.push_back(syntheticRadarGrid(level, site, truth, flow, velocityField,
                                           reflectivityField, freezingLevel));
    }
    return grids;
}

} // namespace mgwind::io
