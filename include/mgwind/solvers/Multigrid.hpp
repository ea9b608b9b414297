#pragma once

#include "mgwind/core/Types.hpp"
#include "mgwind/core/WindField.hpp"
#include "mgwind/numerics/GridTransfer.hpp"
#include "mgwind/physics/AnalysisLevel.hpp"
#include "mgwind/physics/CostFunction.hpp"
#include "mgwind/solvers/BoundedQuasiNewton.hpp"
#include <vector>

namespace mgwind::solvers {

// Tunables of the two-level cycle
struct MultigridSettings {
    int relaxationSteps = 5;          // steepest descent steps per cycle
    Real relaxationStep = 1.0;
    Real residualScale = 0.001;       // weight of the fine residual on the coarse level
    Real windBound = 5.0;             // coarse box bound, +-windBound per component
    int coarseMaxIterations = 200;
    Real coarsePgtol = 1e-3;
    int coarseMemory = 10;
    int iterationIncrement = 50;      // added to the counter per cycle
    int maxIterations = 1300;
    int diagnosticInterval = 50;
    bool outputCostFunctions = true;

    // Throws ConfigurationError for non-positive counts or bounds
    void validate() const;
};

// What happened during one cycle
struct CycleDiagnostics {
    int cycle = 0;
    int iteration = 0;                // counter value at the start of the cycle
    Real costBeforeRelaxation = 0.0;
    Real costAfterRelaxation = 0.0;
    Real costAfterCorrection = 0.0;
    Real residualNorm = 0.0;          // norm of the finite fine residual entries
    int coarseIterations = 0;
    TerminationFlag coarseFlag = TerminationFlag::CONVERGED;
    Real coarseValue = 0.0;
};

// Two-level multigrid cycle for the variational wind retrieval.
//
// Each cycle relaxes the fine winds by steepest descent, restricts the winds
// and the last fine gradient (the residual) to the coarse level, minimises
// the coarse problem under box bounds and adds the prolonged coarse
// correction back to the fine winds. The counter advances by a fixed
// increment per cycle until it reaches the maximum.
class MultigridSolver {
public:
    MultigridSolver(const physics::CostFunction& cost,
                    const physics::AnalysisLevel& fine,
                    const physics::AnalysisLevel& coarse,
                    const physics::CostParameters& params,
                    const MultigridSettings& settings = MultigridSettings());

    // Run cycles until the counter reaches the maximum; updates `winds` in place
    std::vector<CycleDiagnostics> solve(WindField& winds) const;

    // One RELAX -> RESTRICT -> COARSE_SOLVE -> PROLONG pass
    CycleDiagnostics cycle(WindField& winds, int cycleIndex, int iteration) const;

    const MultigridSettings& settings() const { return settings_; }
    const numerics::GridTransfer& transfer() const { return transfer_; }

private:
    const physics::CostFunction& cost_;
    const physics::AnalysisLevel& fine_;
    const physics::AnalysisLevel& coarse_;
    const physics::CostParameters& params_;
    MultigridSettings settings_;
    numerics::GridTransfer transfer_;
    BoundedQuasiNewton optimizer_;

    // Steepest descent on the fine level; returns the last gradient
    VectorX relax(WindField& winds) const;

    // Minimise the coarse problem from `coarseInput`
    WindField solveCoarse(const WindField& coarseInput, const WindField& coarseResidual,
                          bool diagnostics, CycleDiagnostics& record) const;

    Real fineCost(const WindField& winds) const;
};

} // namespace mgwind::solvers
