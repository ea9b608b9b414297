#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include "mgwind/physics/CostFunction.hpp"

namespace mgwind::solvers {

// Coarse-level objective of the multigrid cycle: the coarse cost function
// matched against the restricted fine residual.
//
//   value(x)    = || J(x) - scale * r_i ||   over entries where x_i and r_i are finite
//   gradient(x) = grad J(x) - scale * r
//
// The adapter keeps references to the cost function, level and parameters.
class CoarseProblem {
public:
    CoarseProblem(const physics::CostFunction& cost,
                  const physics::AnalysisLevel& level,
                  const physics::CostParameters& params,
                  VectorX residual,
                  Real residualScale = 0.001);

    Real value(const VectorX& winds) const;
    VectorX gradient(const VectorX& winds) const;

    // Logs the matched cost and the norm of the matched gradient at `winds`
    void logDiagnostics(const VectorX& winds) const;

    const VectorX& residual() const { return residual_; }
    Real residualScale() const { return residualScale_; }

private:
    const physics::CostFunction& cost_;
    const physics::AnalysisLevel& level_;
    const physics::CostParameters& params_;
    VectorX residual_;
    Real residualScale_;
};

} // namespace mgwind::solvers
