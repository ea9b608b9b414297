// === src/solvers/CoarseProblem.cpp ===
#include "mgwind/solvers/CoarseProblem.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <cmath>

namespace mgwind::solvers {

CoarseProblem::CoarseProblem(const physics::CostFunction& cost,
                             const physics::AnalysisLevel& level,
                             const physics::CostParameters& params,
                             VectorX residual,
                             Real residualScale)
    : cost_(cost), level_(level), params_(params),
      residual_(std::move(residual)), residualScale_(residualScale) {
    if (residual_.size() != 3 * level_.shape().size()) {
        throw ConfigurationError("Coarse residual does not match the coarse level");
    }
}

Real CoarseProblem::value(const VectorX& winds) const {
    const Real J = cost_.value(winds, level_, params_);
    Real sum = 0.0;
    for (Index i = 0; i < winds.size(); ++i) {
        if (std::isfinite(winds[i]) && std::isfinite(residual_[i])) {
            sum += sqr(J - residualScale_ * residual_[i]);
        }
    }
    return std::sqrt(sum);
}

VectorX CoarseProblem::gradient(const VectorX& winds) const {
    return cost_.gradient(winds, level_, params_) - residualScale_ * residual_;
}

void CoarseProblem::logDiagnostics(const VectorX& winds) const {
    VectorX g = gradient(winds);
    Real norm2 = 0.0;
    for (Index i = 0; i < g.size(); ++i) {
        if (std::isfinite(winds[i]) && std::isfinite(g[i])) {
            norm2 += sqr(g[i]);
        }
    }
    MGWIND_LOG_INFO("Total |cost function - residual|: {:.6e}", value(winds));
    MGWIND_LOG_INFO("Norm of gradient - residual: {:.6e}", std::sqrt(norm2));
}

} // namespace mgwind::solvers
