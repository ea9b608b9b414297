// === src/retrieval/WindRetrieval.cpp ===
#include "mgwind/retrieval/WindRetrieval.hpp"
#include "mgwind/retrieval/ResultAssembler.hpp"
#include "mgwind/numerics/GridTransfer.hpp"
#include "mgwind/numerics/Interpolation.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <cmath>
#include <string>

namespace mgwind::retrieval {

namespace {

// Every first-guess cell must hold a finite value
void checkFirstGuess(const Field3D& field, const char* name) {
    for (Index p = 0; p < field.size(); ++p) {
        if (field.isMasked(p) || !std::isfinite(field[p])) {
            throw ConfigurationError(std::string("Initial ") + name +
                                     " has a masked or non-finite value at index " +
                                     std::to_string(p));
        }
    }
}

Field3D degreesToRadians(const Field3D& degrees) {
    Field3D radians = degrees;
    radians.data() *= DEG_TO_RAD;
    return radians;
}

physics::RadarObservations readObservations(Grid& grid, const RetrievalSettings& settings) {
    physics::RadarObservations obs;
    obs.radialVelocity = grid.field(settings.velocityField).data;
    obs.radialVelocity.maskNonFinite();
    obs.fallSpeed = physics::fallSpeed(grid, settings.reflectivityField, settings.freezingLevel);
    physics::annotateAngles(grid, settings.reflectivityField);
    obs.azimuth = degreesToRadians(grid.field("AZ").data);
    obs.elevation = degreesToRadians(grid.field("EL").data);
    return obs;
}

physics::RadarObservations restrictObservations(const physics::RadarObservations& fine,
                                                const numerics::GridTransfer& transfer) {
    physics::RadarObservations coarse;
    coarse.radialVelocity = transfer.restrictField(fine.radialVelocity);
    coarse.fallSpeed = transfer.restrictField(fine.fallSpeed);
    coarse.azimuth = transfer.restrictField(fine.azimuth);
    coarse.elevation = transfer.restrictField(fine.elevation);
    return coarse;
}

physics::BackgroundProfile backgroundProfile(const std::optional<Sounding>& sounding,
                                             const GridLevel& level) {
    if (!sounding) {
        return physics::BackgroundProfile::zeros(level.shape().nz);
    }
    if (sounding->z.size() != sounding->u.size() || sounding->z.size() != sounding->v.size()) {
        throw ConfigurationError("Sounding heights and winds must have equal lengths");
    }
    MGWIND_LOG_INFO("Interpolating sounding to radar grid");
    physics::BackgroundProfile profile;
    profile.u = numerics::interpolateProfile(sounding->z, sounding->u, level.z());
    profile.v = numerics::interpolateProfile(sounding->z, sounding->v, level.z());
    return profile;
}

} // namespace

void RetrievalSettings::validate(bool haveModelFields) const {
    cost.validate(haveModelFields);
    multigrid.validate();
    if (!(minBca >= 0 && minBca <= maxBca && maxBca <= 180)) {
        throw ConfigurationError("Beam crossing angle bounds must satisfy 0 <= min <= max <= 180");
    }
    if (!(axisTolerance >= 0)) {
        throw ConfigurationError("Axis tolerance must be non-negative");
    }
    if (velocityField.empty() || reflectivityField.empty()) {
        throw ConfigurationError("Velocity and reflectivity field names must be given");
    }
}

Real weightedRmsVr(const physics::AnalysisLevel& level) {
    Real sumSquares = 0.0;
    Real sumWeights = 0.0;
    for (std::size_t r = 0; r < level.observations.numRadars(); ++r) {
        const Field3D& vr = level.observations.radars[r].radialVelocity;
        const VectorX& weight = level.weights.observation[r];
        for (Index p = 0; p < vr.size(); ++p) {
            if (vr.isValid(p) && weight[p] > 0) {
                sumSquares += weight[p] * sqr(vr[p]);
                sumWeights += weight[p];
            }
        }
    }
    if (sumWeights <= 0 || sumSquares <= 0) {
        return 1.0;
    }
    return std::sqrt(sumSquares / sumWeights);
}

AnalysisLevels buildAnalysisLevels(std::vector<Grid>& grids,
                                   const RetrievalInputs& inputs,
                                   const RetrievalSettings& settings) {
    AnalysisLevels levels;
    physics::AnalysisLevel& fine = levels.fine;
    physics::AnalysisLevel& coarse = levels.coarse;

    fine.grid = grids.front().level();
    numerics::GridTransfer transfer(fine.grid);
    coarse.grid = transfer.coarse();

    // Observations
    std::vector<RadarSite> sites;
    for (std::size_t i = 0; i < grids.size(); ++i) {
        MGWIND_LOG_DEBUG("Reading observations of radar {} ({})", i, grids[i].site().name);
        fine.observations.radars.push_back(readObservations(grids[i], settings));
        sites.push_back(grids[i].site());
    }

    // Model winds, read from the first grid
    for (const std::string& name : inputs.modelFields) {
        const Grid& first = grids.front();
        physics::ModelWinds model;
        model.name = name;
        model.u = first.field("U_" + name).data;
        model.v = first.field("V_" + name).data;
        model.w = first.field("W_" + name).data;
        model.u.maskNonFinite();
        model.v.maskNonFinite();
        model.w.maskNonFinite();
        fine.models.push_back(std::move(model));
    }

    CoverageOptions coverage;
    coverage.minBca = settings.minBca;
    coverage.maxBca = settings.maxBca;
    fine.weights = buildWeights(fine.grid, sites, fine.observations, fine.models.size(),
                                coverage, inputs.weights);
    fine.background = backgroundProfile(inputs.sounding, fine.grid);

    // Coarse level
    for (const physics::RadarObservations& obs : fine.observations.radars) {
        coarse.observations.radars.push_back(restrictObservations(obs, transfer));
    }
    for (const physics::ModelWinds& model : fine.models) {
        physics::ModelWinds c;
        c.name = model.name;
        c.u = transfer.restrictField(model.u);
        c.v = transfer.restrictField(model.v);
        c.w = transfer.restrictField(model.w);
        coarse.models.push_back(std::move(c));
    }
    coarse.weights = restrictWeights(fine.weights, transfer);
    coarse.background.u = GridLevel::coarsenAxis(fine.background.u);
    coarse.background.v = GridLevel::coarsenAxis(fine.background.v);

    const Real rmsVr = weightedRmsVr(coarse);
    fine.rmsVr = rmsVr;
    coarse.rmsVr = rmsVr;
    MGWIND_LOG_INFO("rmsVr = {:.4f}", rmsVr);
    return levels;
}

RetrievalResult retrieveWinds(const std::vector<Grid>& grids,
                              const RetrievalInputs& inputs,
                              const RetrievalSettings& settings,
                              const physics::CostFunction& costFunction) {
    MGWIND_LOG_TIMER("Wind retrieval");

    settings.validate(!inputs.modelFields.empty());
    checkGridConformance(grids, settings.axisTolerance);

    const Shape3& shape = grids.front().shape();
    if (inputs.u0.shape() != shape || inputs.v0.shape() != shape || inputs.w0.shape() != shape) {
        throw ConfigurationError("Initial u, v and w must match the grid shape");
    }
    checkFirstGuess(inputs.u0, "u");
    checkFirstGuess(inputs.v0, "v");
    checkFirstGuess(inputs.w0, "w");

    std::vector<Grid> work = grids;
    AnalysisLevels levels = buildAnalysisLevels(work, inputs, settings);
    MGWIND_LOG_INFO("Fine grid {}x{}x{}, coarse grid {}x{}x{}, {} radar(s)",
                    shape.nz, shape.ny, shape.nx,
                    levels.coarse.shape().nz, levels.coarse.shape().ny, levels.coarse.shape().nx,
                    grids.size());

    RetrievalResult result;
    result.winds = WindField(inputs.u0, inputs.v0, inputs.w0);

    solvers::MultigridSolver solver(costFunction, levels.fine, levels.coarse,
                                    settings.cost, settings.multigrid);
    result.history = solver.solve(result.winds);

    AssemblyOptions options;
    options.velocityField = settings.velocityField;
    options.minBca = settings.minBca;
    options.maxBca = settings.maxBca;
    options.maskOutsideOpt = settings.maskOutsideOpt;
    options.maskWOutsideOpt = settings.maskWOutsideOpt;
    result.grids = assembleResult(work, result.winds, levels.fine.weights, options);

    result.weights = std::move(levels.fine.weights);
    result.rmsVr = levels.fine.rmsVr;
    return result;
}

RetrievalResult retrieveWinds(const std::vector<Grid>& grids,
                              const RetrievalInputs& inputs,
                              const RetrievalSettings& settings) {
    physics::VariationalCostFunction cost;
    return retrieveWinds(grids, inputs, settings, cost);
}

} // namespace mgwind::retrieval
