// === src/retrieval/WeightBuilder.cpp ===
#include "mgwind/retrieval/WeightBuilder.hpp"
#include "mgwind/physics/RadarGeometry.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <cmath>
#include <string>

namespace mgwind::retrieval {

namespace {

void checkOverride(const VectorX& weights, Index size, const std::string& what) {
    if (weights.size() != size) {
        throw ConfigurationError(what + " weights do not match the grid shape");
    }
    for (Index i = 0; i < weights.size(); ++i) {
        if (!(weights[i] >= Real(0))) {
            throw ConfigurationError(what + " weights must be non-negative");
        }
    }
}

VectorX restrictToZero(const VectorX& fine, const numerics::GridTransfer& transfer) {
    VectorX coarse = transfer.restrictValues(fine);
    for (Index i = 0; i < coarse.size(); ++i) {
        if (!std::isfinite(coarse[i])) {
            coarse[i] = Real(0);
        }
    }
    return coarse;
}

} // namespace

physics::WeightSet buildWeights(const GridLevel& level,
                                const std::vector<RadarSite>& sites,
                                const physics::ObservationSet& observations,
                                std::size_t numModels,
                                const CoverageOptions& options,
                                const WeightOverrides& overrides) {
    const std::size_t numRadars = observations.numRadars();
    const Shape3& shape = level.shape();
    const Index n = shape.size();
    if (numRadars == 0 || sites.size() != numRadars) {
        throw ConfigurationError("One radar site is required per observation set");
    }
    if (!(options.minBca <= options.maxBca)) {
        throw ConfigurationError("Minimum beam crossing angle exceeds the maximum");
    }

    physics::WeightSet weights;
    if (numRadars == 1) {
        const VectorX valid = observations.radars[0].radialVelocity.validity();
        weights.observation.push_back(valid);
        weights.background = VectorX::Ones(n) - valid;
    } else {
        const Real minBca = options.minBca * DEG_TO_RAD;
        const Real maxBca = options.maxBca * DEG_TO_RAD;

        // Reduction over radar pairs, starting from zero
        std::vector<VectorX> counts(numRadars, VectorX::Zero(n));
        VectorX evaluated = VectorX::Zero(n);

        for (std::size_t i = 0; i < numRadars; ++i) {
            for (std::size_t j = i + 1; j < numRadars; ++j) {
                MGWIND_LOG_DEBUG("Calculating weights for radars {} and {}", i, j);
                const VectorX bca = physics::beamCrossingAngle(sites[i], sites[j], level);
                const Field3D& vrI = observations.radars[i].radialVelocity;
                const Field3D& vrJ = observations.radars[j].radialVelocity;

                for (Index k = 0; k < shape.nz; ++k) {
                    for (Index q = 0; q < shape.planeSize(); ++q) {
                        if (!std::isfinite(bca[q])) {
                            continue;
                        }
                        const Index p = k * shape.planeSize() + q;
                        evaluated[p] = Real(1);
                        if (bca[q] < minBca || bca[q] > maxBca) {
                            continue;
                        }
                        if (vrI.isValid(p)) {
                            counts[i][p] += Real(1);
                        }
                        if (vrJ.isValid(p)) {
                            counts[j][p] += Real(1);
                        }
                    }
                }
            }
        }

        // Clip to {0, 1}
        for (const VectorX& c : counts) {
            weights.observation.push_back((c.array() > Real(0)).cast<Real>().matrix());
        }

        weights.background = VectorX::Zero(n);
        for (Index p = 0; p < n; ++p) {
            bool covered = false;
            for (const VectorX& w : weights.observation) {
                covered = covered || w[p] > Real(0);
            }
            weights.background[p] = (evaluated[p] > 0 && !covered) ? Real(1) : Real(0);
        }
    }

    // Model weights favour the model where dual-Doppler coverage is poor
    if (numModels > 0) {
        VectorX grade = coverageGrade(weights);
        VectorX mw = VectorX::Ones(n) - grade / static_cast<Real>(numRadars + 1);
        weights.model.assign(numModels, mw);
    }

    if (overrides.observation) {
        if (overrides.observation->size() != numRadars) {
            throw ConfigurationError("One observation weight array is required per radar");
        }
        for (const VectorX& w : *overrides.observation) {
            checkOverride(w, n, "Observation");
        }
        weights.observation = *overrides.observation;
    }
    if (overrides.background) {
        checkOverride(*overrides.background, n, "Background");
        weights.background = *overrides.background;
    }
    if (overrides.model) {
        if (overrides.model->size() != numModels) {
            throw ConfigurationError("One model weight array is required per model field set");
        }
        for (const VectorX& w : *overrides.model) {
            checkOverride(w, n, "Model");
        }
        weights.model = *overrides.model;
    }

    Real observed = 0.0;
    for (const VectorX& w : weights.observation) {
        observed += w.sum();
    }
    if (observed <= 0.0) {
        MGWIND_LOG_WARN("No cell has a usable observation; only the constraints act");
    }

    MGWIND_LOG_INFO("Weights: {} radar(s), {} background cell(s) of {}",
                    numRadars, static_cast<Index>(weights.background.sum()), n);
    return weights;
}

VectorX coverageGrade(const physics::WeightSet& weights) {
    if (weights.observation.empty()) {
        return VectorX();
    }
    VectorX grade = VectorX::Zero(weights.observation.front().size());
    for (const VectorX& w : weights.observation) {
        grade += w;
    }
    const Real maxGrade = grade.size() > 0 ? grade.maxCoeff() : Real(0);
    if (maxGrade > 0) {
        grade /= maxGrade;
    } else {
        grade.setZero();
    }
    return grade;
}

physics::WeightSet restrictWeights(const physics::WeightSet& fine,
                                   const numerics::GridTransfer& transfer) {
    physics::WeightSet coarse;
    for (const VectorX& w : fine.observation) {
        coarse.observation.push_back(restrictToZero(w, transfer));
    }
    coarse.background = restrictToZero(fine.background, transfer);
    for (const VectorX& w : fine.model) {
        coarse.model.push_back(restrictToZero(w, transfer));
    }
    return coarse;
}

} // namespace mgwind::retrieval
