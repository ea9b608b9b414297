// === src/solvers/Multigrid.cpp ===
#include "mgwind/solvers/Multigrid.hpp"
#include "mgwind/solvers/CoarseProblem.hpp"
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/Logger.hpp"
#include <cmath>

namespace mgwind::solvers {

namespace {

BoundedQuasiNewton::Settings optimizerSettings(const MultigridSettings& settings) {
    settings.validate();
    BoundedQuasiNewton::Settings s;
    s.maxIterations = settings.coarseMaxIterations;
    s.pgtol = settings.coarsePgtol;
    s.memorySize = settings.coarseMemory;
    return s;
}

Real finiteNorm(const VectorX& v) {
    Real sum = 0.0;
    for (Index i = 0; i < v.size(); ++i) {
        if (std::isfinite(v[i])) {
            sum += sqr(v[i]);
        }
    }
    return std::sqrt(sum);
}

} // namespace

void MultigridSettings::validate() const {
    if (relaxationSteps < 1) {
        throw ConfigurationError("Number of relaxation steps must be at least 1");
    }
    if (!(relaxationStep > 0) || !(windBound > 0) || !(residualScale >= 0)) {
        throw ConfigurationError("Relaxation step, wind bound and residual scale must be positive");
    }
    if (coarseMaxIterations < 0 || !(coarsePgtol >= 0) || coarseMemory < 1) {
        throw ConfigurationError("Invalid coarse optimiser settings");
    }
    if (iterationIncrement < 1 || maxIterations < 0) {
        throw ConfigurationError("Iteration increment must be positive and maximum non-negative");
    }
    if (diagnosticInterval < 1) {
        throw ConfigurationError("Diagnostic interval must be positive");
    }
}

MultigridSolver::MultigridSolver(const physics::CostFunction& cost,
                                 const physics::AnalysisLevel& fine,
                                 const physics::AnalysisLevel& coarse,
                                 const physics::CostParameters& params,
                                 const MultigridSettings& settings)
    : cost_(cost), fine_(fine), coarse_(coarse), params_(params),
      settings_(settings),
      transfer_(fine.grid, coarse.grid),
      optimizer_(optimizerSettings(settings)) {
}

Real MultigridSolver::fineCost(const WindField& winds) const {
    return cost_.value(winds.flat(), fine_, params_);
}

std::vector<CycleDiagnostics> MultigridSolver::solve(WindField& winds) const {
    if (winds.shape() != fine_.shape()) {
        throw ConfigurationError("Initial winds do not match the fine grid level");
    }

    std::vector<CycleDiagnostics> history;
    const int numCycles =
        (settings_.maxIterations + settings_.iterationIncrement - 1) / settings_.iterationIncrement;
    MGWIND_LOG_INFO("Multigrid: {} cycles, fine grid {}x{}x{}, coarse grid {}x{}x{}",
                    numCycles, fine_.shape().nz, fine_.shape().ny, fine_.shape().nx,
                    coarse_.shape().nz, coarse_.shape().ny, coarse_.shape().nx);

    int iteration = 0;
    int cycleIndex = 0;
    while (iteration < settings_.maxIterations) {
        history.push_back(cycle(winds, cycleIndex, iteration));
        const CycleDiagnostics& record = history.back();
        MGWIND_LOG_INFO("Cycle {:3d} (iteration {:4d}): J = {:.6e} -> {:.6e}, |residual| = {:.3e}",
                        record.cycle, record.iteration, record.costBeforeRelaxation,
                        record.costAfterCorrection, record.residualNorm);
        iteration += settings_.iterationIncrement;
        ++cycleIndex;
    }
    return history;
}

VectorX MultigridSolver::relax(WindField& winds) const {
    VectorX gradient;
    for (int step = 0; step < settings_.relaxationSteps; ++step) {
        gradient = cost_.gradient(winds.flat(), fine_, params_);
        winds.flat() -= settings_.relaxationStep * gradient;
    }
    return gradient;
}

WindField MultigridSolver::solveCoarse(const WindField& coarseInput,
                                       const WindField& coarseResidual,
                                       bool diagnostics,
                                       CycleDiagnostics& record) const {
    CoarseProblem problem(cost_, coarse_, params_, coarseResidual.flat(),
                          settings_.residualScale);

    VectorX x = coarseInput.flat();
    BoundedQuasiNewtonResult result = optimizer_.minimize(
        x,
        [&problem](const VectorX& winds) { return problem.value(winds); },
        [&problem](const VectorX& winds) { return problem.gradient(winds); },
        -settings_.windBound, settings_.windBound);

    record.coarseIterations = result.iterations;
    record.coarseFlag = result.flag;
    record.coarseValue = result.value;
    if (!result.converged()) {
        MGWIND_LOG_DEBUG("Coarse solve stopped with flag {}: {}",
                         static_cast<int>(result.flag), result.message);
    }

    if (diagnostics) {
        problem.logDiagnostics(coarseInput.flat());
    }
    return WindField(coarse_.shape(), std::move(x));
}

CycleDiagnostics MultigridSolver::cycle(WindField& winds, int cycleIndex, int iteration) const {
    CycleDiagnostics record;
    record.cycle = cycleIndex;
    record.iteration = iteration;
    record.costBeforeRelaxation = fineCost(winds);

    // RELAX
    VectorX residual = relax(winds);
    record.costAfterRelaxation = fineCost(winds);
    record.residualNorm = finiteNorm(residual);

    // RESTRICT
    WindField coarseInput = transfer_.restrictWinds(winds);
    WindField coarseResidual =
        transfer_.restrictWinds(WindField(fine_.shape(), std::move(residual)));

    // COARSE_SOLVE
    const bool diagnostics =
        settings_.outputCostFunctions && iteration % settings_.diagnosticInterval == 0;
    WindField coarseSolution = solveCoarse(coarseInput, coarseResidual, diagnostics, record);

    // PROLONG
    WindField correction = transfer_.prolongCorrection(coarseSolution, coarseInput);
    winds.flat() += correction.flat();
    record.costAfterCorrection = fineCost(winds);

    const auto* reference = dynamic_cast<const physics::VariationalCostFunction*>(&cost_);
    if (diagnostics && reference != nullptr) {
        physics::CostBreakdown terms = reference->evaluateTerms(winds.flat(), fine_, params_);
        MGWIND_LOG_DEBUG("Cost terms: Jo = {:.4e}, Jm = {:.4e}, Js = {:.4e}, Jb = {:.4e}, "
                         "Jv = {:.4e}, Jmod = {:.4e}",
                         terms.observation, terms.massContinuity, terms.smoothness,
                         terms.background, terms.vorticity, terms.model);
    }
    return record;
}

} // namespace mgwind::solvers
