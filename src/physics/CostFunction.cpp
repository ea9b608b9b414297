// === src/physics/CostFunction.cpp ===
#include "mgwind/physics/CostFunction.hpp"
#include "mgwind/core/Exceptions.hpp"
#include <cmath>

namespace mgwind::physics {

using numerics::FiniteDifference;

namespace {

// Density scale height of the anelastic reference profile
constexpr Real DENSITY_SCALE_HEIGHT = 10000.0;

// Projection of the wind on the beam, including hydrometeor fall speed
inline Real projectedVelocity(Real u, Real v, Real w, Real az, Real el, Real vt) {
    const Real cosEl = std::cos(el);
    return cosEl * std::sin(az) * u + cosEl * std::cos(az) * v +
           std::sin(el) * (w - std::abs(vt));
}

bool observationUsable(const RadarObservations& obs, Index p) {
    return obs.radialVelocity.isValid(p) && obs.azimuth.isValid(p) &&
           obs.elevation.isValid(p);
}

Real fallSpeedAt(const RadarObservations& obs, Index p) {
    return obs.fallSpeed.isValid(p) ? obs.fallSpeed[p] : Real(0);
}

} // namespace

void CostParameters::validate(bool haveModelFields) const {
    if (vorticity != Real(0) && (!stormU || !stormV)) {
        throw ConfigurationError(
            "Storm motion (Ut, Vt) must be given when the vertical vorticity constraint is enabled");
    }
    if (!haveModelFields && model != Real(0)) {
        throw ConfigurationError("Model weight must be zero if no model fields are specified");
    }
    for (Real c : {observation, massContinuity, smoothnessX, smoothnessY, smoothnessZ,
                   background, vorticity, model}) {
        if (c < Real(0) || !std::isfinite(c)) {
            throw ConfigurationError("Cost function coefficients must be finite and non-negative");
        }
    }
}

// Wind components of the flattened state vector
struct VariationalCostFunction::Components {
    VectorX u, v, w;
    Index n;

    Components(const VectorX& winds, const Shape3& shape) : n(shape.size()) {
        if (winds.size() != 3 * n) {
            throw ConfigurationError("Wind vector length does not match the analysis level");
        }
        u = winds.segment(0, n);
        v = winds.segment(n, n);
        w = winds.segment(2 * n, n);
    }
};

FiniteDifference VariationalCostFunction::differences(const AnalysisLevel& level) {
    return FiniteDifference(level.shape(), level.grid.dz(), level.grid.dy(), level.grid.dx());
}

VectorX VariationalCostFunction::anelasticCoefficients(const AnalysisLevel& level,
                                                       const FiniteDifference& fd) {
    VectorX z = level.grid.pointZ();
    VectorX rho = (-z / DENSITY_SCALE_HEIGHT).array().exp().matrix();
    VectorX drhoDz = fd.ddz(rho);
    return drhoDz.cwiseQuotient(rho);
}

// ---------------------------------------------------------------------------
// Public interface
// ---------------------------------------------------------------------------

Real VariationalCostFunction::value(const VectorX& winds, const AnalysisLevel& level,
                                    const CostParameters& params) const {
    return evaluateTerms(winds, level, params).total();
}

CostBreakdown VariationalCostFunction::evaluateTerms(const VectorX& winds,
                                                     const AnalysisLevel& level,
                                                     const CostParameters& params) const {
    Components c(winds, level.shape());
    CostBreakdown terms;

    terms.observation = observationCost(c, level, params);
    if (params.massContinuity > 0) {
        terms.massContinuity = massContinuityCost(c, level, params);
    }
    if (params.smoothnessX > 0 || params.smoothnessY > 0 || params.smoothnessZ > 0) {
        terms.smoothness = smoothnessCost(c, level, params);
    }
    if (params.background > 0) {
        terms.background = backgroundCost(c, level, params);
    }
    if (params.vorticity > 0) {
        terms.vorticity = vorticityCost(c, level, params);
    }
    if (params.model > 0) {
        terms.model = modelCost(c, level, params);
    }
    return terms;
}

VectorX VariationalCostFunction::gradient(const VectorX& winds, const AnalysisLevel& level,
                                          const CostParameters& params) const {
    Components c(winds, level.shape());
    VectorX grad = VectorX::Zero(winds.size());

    observationGradient(c, level, params, grad);
    if (params.massContinuity > 0) {
        massContinuityGradient(c, level, params, grad);
    }
    if (params.smoothnessX > 0 || params.smoothnessY > 0 || params.smoothnessZ > 0) {
        smoothnessGradient(c, level, params, grad);
    }
    if (params.background > 0) {
        backgroundGradient(c, level, params, grad);
    }
    if (params.vorticity > 0) {
        vorticityGradient(c, level, params, grad);
    }
    if (params.model > 0) {
        modelGradient(c, level, params, grad);
    }

    if (params.upperBoundary) {
        const Shape3& s = level.shape();
        grad.segment(2 * c.n + (s.nz - 1) * s.planeSize(), s.planeSize()).setZero();
    }
    return grad;
}

// ---------------------------------------------------------------------------
// Observation term
// ---------------------------------------------------------------------------

Real VariationalCostFunction::observationCost(const Components& c, const AnalysisLevel& level,
                                              const CostParameters& params) const {
    const Real lambda = params.observation / sqr(level.rmsVr);
    Real cost = 0.0;
    for (std::size_t r = 0; r < level.observations.numRadars(); ++r) {
        const RadarObservations& obs = level.observations.radars[r];
        const VectorX& weight = level.weights.observation[r];
        for (Index p = 0; p < c.n; ++p) {
            if (weight[p] == Real(0) || !observationUsable(obs, p)) {
                continue;
            }
            Real vr = projectedVelocity(c.u[p], c.v[p], c.w[p], obs.azimuth[p],
                                        obs.elevation[p], fallSpeedAt(obs, p));
            cost += weight[p] * sqr(obs.radialVelocity[p] - vr);
        }
    }
    return lambda * cost;
}

void VariationalCostFunction::observationGradient(const Components& c, const AnalysisLevel& level,
                                                  const CostParameters& params,
                                                  VectorX& grad) const {
    const Real lambda = params.observation / sqr(level.rmsVr);
    for (std::size_t r = 0; r < level.observations.numRadars(); ++r) {
        const RadarObservations& obs = level.observations.radars[r];
        const VectorX& weight = level.weights.observation[r];
        for (Index p = 0; p < c.n; ++p) {
            if (weight[p] == Real(0) || !observationUsable(obs, p)) {
                continue;
            }
            const Real az = obs.azimuth[p];
            const Real el = obs.elevation[p];
            Real vr = projectedVelocity(c.u[p], c.v[p], c.w[p], az, el, fallSpeedAt(obs, p));
            Real factor = Real(2) * lambda * weight[p] * (vr - obs.radialVelocity[p]);
            grad[p] += factor * std::cos(el) * std::sin(az);
            grad[c.n + p] += factor * std::cos(el) * std::cos(az);
            grad[2 * c.n + p] += factor * std::sin(el);
        }
    }
}

// ---------------------------------------------------------------------------
// Mass continuity term
// ---------------------------------------------------------------------------

Real VariationalCostFunction::massContinuityCost(const Components& c, const AnalysisLevel& level,
                                                 const CostParameters& params) const {
    FiniteDifference fd = differences(level);
    VectorX div = fd.ddx(c.u) + fd.ddy(c.v) + fd.ddz(c.w);
    if (params.anelastic) {
        div += anelasticCoefficients(level, fd).cwiseProduct(c.w);
    }
    return params.massContinuity * div.squaredNorm() / Real(2);
}

void VariationalCostFunction::massContinuityGradient(const Components& c,
                                                     const AnalysisLevel& level,
                                                     const CostParameters& params,
                                                     VectorX& grad) const {
    FiniteDifference fd = differences(level);
    VectorX div = fd.ddx(c.u) + fd.ddy(c.v) + fd.ddz(c.w);
    VectorX anel;
    if (params.anelastic) {
        anel = anelasticCoefficients(level, fd);
        div += anel.cwiseProduct(c.w);
    }

    const Real cm = params.massContinuity;
    grad.segment(0, c.n) += cm * fd.ddxT(div);
    grad.segment(c.n, c.n) += cm * fd.ddyT(div);
    VectorX gw = fd.ddzT(div);
    if (params.anelastic) {
        gw += anel.cwiseProduct(div);
    }
    grad.segment(2 * c.n, c.n) += cm * gw;
}

// ---------------------------------------------------------------------------
// Smoothness term
// ---------------------------------------------------------------------------

Real VariationalCostFunction::smoothnessCost(const Components& c, const AnalysisLevel& level,
                                             const CostParameters& params) const {
    FiniteDifference fd = differences(level);
    Real cost = 0.0;
    for (const VectorX* comp : {&c.u, &c.v, &c.w}) {
        if (params.smoothnessX > 0) {
            cost += params.smoothnessX * fd.second(*comp, Axis::X).squaredNorm();
        }
        if (params.smoothnessY > 0) {
            cost += params.smoothnessY * fd.second(*comp, Axis::Y).squaredNorm();
        }
        if (params.smoothnessZ > 0) {
            cost += params.smoothnessZ * fd.second(*comp, Axis::Z).squaredNorm();
        }
    }
    return cost;
}

void VariationalCostFunction::smoothnessGradient(const Components& c, const AnalysisLevel& level,
                                                 const CostParameters& params,
                                                 VectorX& grad) const {
    FiniteDifference fd = differences(level);
    const VectorX* comps[3] = {&c.u, &c.v, &c.w};
    const std::pair<Axis, Real> terms[3] = {{Axis::X, params.smoothnessX},
                                            {Axis::Y, params.smoothnessY},
                                            {Axis::Z, params.smoothnessZ}};
    for (int k = 0; k < 3; ++k) {
        auto g = grad.segment(k * c.n, c.n);
        for (const auto& [axis, coeff] : terms) {
            if (coeff > 0) {
                g += Real(2) * coeff * fd.secondAdjoint(fd.second(*comps[k], axis), axis);
            }
        }
    }
}

// ---------------------------------------------------------------------------
// Background term
// ---------------------------------------------------------------------------

Real VariationalCostFunction::backgroundCost(const Components& c, const AnalysisLevel& level,
                                             const CostParameters& params) const {
    const Shape3& s = level.shape();
    const VectorX& bgw = level.weights.background;
    Real cost = 0.0;
    for (Index k = 0; k < s.nz; ++k) {
        const Real ub = level.background.u[k];
        const Real vb = level.background.v[k];
        if (!std::isfinite(ub) || !std::isfinite(vb)) {
            continue;
        }
        for (Index p = k * s.planeSize(); p < (k + 1) * s.planeSize(); ++p) {
            cost += bgw[p] * (sqr(c.u[p] - ub) + sqr(c.v[p] - vb));
        }
    }
    return params.background * cost;
}

void VariationalCostFunction::backgroundGradient(const Components& c, const AnalysisLevel& level,
                                                 const CostParameters& params,
                                                 VectorX& grad) const {
    const Shape3& s = level.shape();
    const VectorX& bgw = level.weights.background;
    for (Index k = 0; k < s.nz; ++k) {
        const Real ub = level.background.u[k];
        const Real vb = level.background.v[k];
        if (!std::isfinite(ub) || !std::isfinite(vb)) {
            continue;
        }
        for (Index p = k * s.planeSize(); p < (k + 1) * s.planeSize(); ++p) {
            grad[p] += Real(2) * params.background * bgw[p] * (c.u[p] - ub);
            grad[c.n + p] += Real(2) * params.background * bgw[p] * (c.v[p] - vb);
        }
    }
}

// ---------------------------------------------------------------------------
// Vertical vorticity term
//
// Residual of the steady vertical vorticity equation in the frame moving
// with the storm:
//   R = (u-Ut) dz/dx + (v-Vt) dz/dy + w dz/dz + zeta (du/dx + dv/dy)
//       + (dw/dx dv/dz - dw/dy du/dz),   zeta = dv/dx - du/dy
// ---------------------------------------------------------------------------

namespace {

struct VorticityState {
    VectorX zeta, dZetaDx, dZetaDy, dZetaDz;
    VectorX dudx, dudy, dudz, dvdx, dvdy, dvdz, dwdx, dwdy;
    VectorX residual;
};

VorticityState vorticityState(const VectorX& u, const VectorX& v, const VectorX& w,
                              Real ut, Real vt, const FiniteDifference& fd) {
    VorticityState s;
    s.dudx = fd.ddx(u);
    s.dudy = fd.ddy(u);
    s.dudz = fd.ddz(u);
    s.dvdx = fd.ddx(v);
    s.dvdy = fd.ddy(v);
    s.dvdz = fd.ddz(v);
    s.dwdx = fd.ddx(w);
    s.dwdy = fd.ddy(w);

    s.zeta = s.dvdx - s.dudy;
    s.dZetaDx = fd.ddx(s.zeta);
    s.dZetaDy = fd.ddy(s.zeta);
    s.dZetaDz = fd.ddz(s.zeta);

    VectorX uRel = u.array() - ut;
    VectorX vRel = v.array() - vt;
    s.residual = uRel.cwiseProduct(s.dZetaDx) + vRel.cwiseProduct(s.dZetaDy) +
                 w.cwiseProduct(s.dZetaDz) + s.zeta.cwiseProduct(s.dudx + s.dvdy) +
                 s.dwdx.cwiseProduct(s.dvdz) - s.dwdy.cwiseProduct(s.dudz);
    return s;
}

} // namespace

Real VariationalCostFunction::vorticityCost(const Components& c, const AnalysisLevel& level,
                                            const CostParameters& params) const {
    FiniteDifference fd = differences(level);
    VorticityState s = vorticityState(c.u, c.v, c.w, params.stormU.value_or(0),
                                      params.stormV.value_or(0), fd);
    return params.vorticity * s.residual.squaredNorm();
}

void VariationalCostFunction::vorticityGradient(const Components& c, const AnalysisLevel& level,
                                                const CostParameters& params,
                                                VectorX& grad) const {
    FiniteDifference fd = differences(level);
    const Real ut = params.stormU.value_or(0);
    const Real vt = params.stormV.value_or(0);
    VorticityState s = vorticityState(c.u, c.v, c.w, ut, vt, fd);
    const VectorX& r = s.residual;

    // Adjoint with respect to zeta, collected from every term it enters
    VectorX uRel = c.u.array() - ut;
    VectorX vRel = c.v.array() - vt;
    VectorX gZeta = fd.ddxT(r.cwiseProduct(uRel)) + fd.ddyT(r.cwiseProduct(vRel)) +
                    fd.ddzT(r.cwiseProduct(c.w)) + r.cwiseProduct(s.dudx + s.dvdy);

    VectorX gu = r.cwiseProduct(s.dZetaDx) - fd.ddyT(gZeta) + fd.ddxT(r.cwiseProduct(s.zeta)) -
                 fd.ddzT(r.cwiseProduct(s.dwdy));
    VectorX gv = r.cwiseProduct(s.dZetaDy) + fd.ddxT(gZeta) + fd.ddyT(r.cwiseProduct(s.zeta)) +
                 fd.ddzT(r.cwiseProduct(s.dwdx));
    VectorX gw = r.cwiseProduct(s.dZetaDz) + fd.ddxT(r.cwiseProduct(s.dvdz)) -
                 fd.ddyT(r.cwiseProduct(s.dudz));

    const Real scale = Real(2) * params.vorticity;
    grad.segment(0, c.n) += scale * gu;
    grad.segment(c.n, c.n) += scale * gv;
    grad.segment(2 * c.n, c.n) += scale * gw;
}

// ---------------------------------------------------------------------------
// Model term
// ---------------------------------------------------------------------------

Real VariationalCostFunction::modelCost(const Components& c, const AnalysisLevel& level,
                                        const CostParameters& params) const {
    Real cost = 0.0;
    for (std::size_t m = 0; m < level.models.size(); ++m) {
        const ModelWinds& model = level.models[m];
        const VectorX& weight = level.weights.model[m];
        for (Index p = 0; p < c.n; ++p) {
            if (model.u.isValid(p)) {
                cost += weight[p] * sqr(c.u[p] - model.u[p]);
            }
            if (model.v.isValid(p)) {
                cost += weight[p] * sqr(c.v[p] - model.v[p]);
            }
            if (model.w.isValid(p)) {
                cost += weight[p] * sqr(c.w[p] - model.w[p]);
            }
        }
    }
    return params.model * cost;
}

void VariationalCostFunction::modelGradient(const Components& c, const AnalysisLevel& level,
                                            const CostParameters& params,
                                            VectorX& grad) const {
    const Real scale = Real(2) * params.model;
    for (std::size_t m = 0; m < level.models.size(); ++m) {
        const ModelWinds& model = level.models[m];
        const VectorX& weight = level.weights.model[m];
        for (Index p = 0; p < c.n; ++p) {
            if (model.u.isValid(p)) {
                grad[p] += scale * weight[p] * (c.u[p] - model.u[p]);
            }
            if (model.v.isValid(p)) {
                grad[c.n + p] += scale * weight[p] * (c.v[p] - model.v[p]);
            }
            if (model.w.isValid(p)) {
                grad[2 * c.n + p] += scale * weight[p] * (c.w[p] - model.w[p]);
            }
        }
    }
}

} // namespace mgwind::physics
