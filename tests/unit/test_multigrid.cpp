// tests/unit/test_multigrid.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/numerics/GridTransfer.hpp"
#include "mgwind/solvers/CoarseProblem.hpp"
#include "mgwind/solvers/Multigrid.hpp"
#include <cmath>

using namespace mgwind;
using namespace mgwind::solvers;

// J(w) = sum (w_i - target)^2, counting gradient evaluations per level size
class QuadraticCost : public physics::CostFunction {
public:
    explicit QuadraticCost(Real target) : target_(target) {}

    Real value(const VectorX& winds, const physics::AnalysisLevel&,
               const physics::CostParameters&) const override {
        return (winds.array() - target_).square().sum();
    }

    VectorX gradient(const VectorX& winds, const physics::AnalysisLevel&,
                     const physics::CostParameters&) const override {
        if (winds.size() == 3 * fineSize) {
            ++fineGradients;
        }
        return 2.0 * (winds.array() - target_).matrix();
    }

    Index fineSize = 0;
    mutable int fineGradients = 0;

private:
    Real target_;
};

class MultigridTest : public ::testing::Test {
protected:
    void SetUp() override {
        fine.grid = GridLevel(VectorX::LinSpaced(3, 0.0, 2000.0),
                              VectorX::LinSpaced(5, -2000.0, 2000.0),
                              VectorX::LinSpaced(5, -2000.0, 2000.0));
        coarse.grid = fine.grid.coarsen();
        cost.fineSize = fine.grid.size();

        settings.relaxationStep = 0.25;
        settings.maxIterations = 200;
    }

    physics::AnalysisLevel fine;
    physics::AnalysisLevel coarse;
    physics::CostParameters params;
    MultigridSettings settings;
    QuadraticCost cost{1.5};
};

TEST_F(MultigridTest, CycleCountFollowsTheIterationCounter) {
    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(fine.shape(), 0.0);

    std::vector<CycleDiagnostics> history = solver.solve(winds);
    ASSERT_EQ(history.size(), 4u);
    for (std::size_t c = 0; c < history.size(); ++c) {
        EXPECT_EQ(history[c].cycle, static_cast<int>(c));
        EXPECT_EQ(history[c].iteration, 50 * static_cast<int>(c));
    }
    EXPECT_EQ(cost.fineGradients, 4 * settings.relaxationSteps);
}

TEST_F(MultigridTest, PartialIncrementStillRunsACycle) {
    settings.maxIterations = 120;
    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(fine.shape(), 0.0);
    EXPECT_EQ(solver.solve(winds).size(), 3u);

    settings.maxIterations = 0;
    MultigridSolver idle(cost, fine, coarse, params, settings);
    EXPECT_TRUE(idle.solve(winds).empty());
}

TEST_F(MultigridTest, RelaxationDecreasesTheCost) {
    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(fine.shape(), 0.0);

    std::vector<CycleDiagnostics> history = solver.solve(winds);
    Real previous = history.front().costBeforeRelaxation;
    for (const CycleDiagnostics& record : history) {
        EXPECT_LE(record.costAfterRelaxation, record.costBeforeRelaxation);
        // A single coarse z node has no interpolant on the fine nodes
        EXPECT_DOUBLE_EQ(record.costAfterCorrection, record.costAfterRelaxation);
        EXPECT_LE(record.costAfterCorrection, previous);
        previous = record.costAfterCorrection;
    }
    for (Index i = 0; i < winds.flat().size(); ++i) {
        EXPECT_NEAR(winds.flat()[i], 1.5, 1e-3);
    }
}

TEST_F(MultigridTest, CoarseSolveStaysWithinTheBound) {
    fine.grid = GridLevel(VectorX::LinSpaced(4, 0.0, 3000.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0));
    coarse.grid = fine.grid.coarsen();
    cost.fineSize = fine.grid.size();

    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(fine.shape(), 0.0);
    CycleDiagnostics record = solver.cycle(winds, 0, 0);

    EXPECT_TRUE(std::isfinite(record.costAfterCorrection));
    EXPECT_GT(record.residualNorm, 0.0);
    // Corrections are differences of values held in [-bound, bound]
    for (Index i = 0; i < winds.flat().size(); ++i) {
        EXPECT_TRUE(std::isfinite(winds.flat()[i]));
        EXPECT_LE(std::abs(winds.flat()[i]), 1.5 + 2.0 * settings.windBound);
    }
}

TEST_F(MultigridTest, CorrectionIsTheProlongedCoarseChange) {
    fine.grid = GridLevel(VectorX::LinSpaced(4, 0.0, 3000.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0));
    coarse.grid = fine.grid.coarsen();
    cost.fineSize = fine.grid.size();

    // Relax, restrict and solve the coarse problem step by step
    WindField relaxed(fine.shape(), 0.0);
    VectorX residual;
    for (int step = 0; step < settings.relaxationSteps; ++step) {
        residual = cost.gradient(relaxed.flat(), fine, params);
        relaxed.flat() -= settings.relaxationStep * residual;
    }
    numerics::GridTransfer transfer(fine.grid, coarse.grid);
    WindField coarseInput = transfer.restrictWinds(relaxed);
    WindField coarseResidual = transfer.restrictWinds(WindField(fine.shape(), residual));

    CoarseProblem problem(cost, coarse, params, coarseResidual.flat(), settings.residualScale);
    BoundedQuasiNewton::Settings optimizer;
    optimizer.maxIterations = settings.coarseMaxIterations;
    optimizer.pgtol = settings.coarsePgtol;
    optimizer.memorySize = settings.coarseMemory;
    VectorX x = coarseInput.flat();
    BoundedQuasiNewton(optimizer).minimize(
        x,
        [&problem](const VectorX& w) { return problem.value(w); },
        [&problem](const VectorX& w) { return problem.gradient(w); },
        -settings.windBound, settings.windBound);
    WindField correction =
        transfer.prolongCorrection(WindField(coarse.shape(), x), coarseInput);

    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(fine.shape(), 0.0);
    solver.cycle(winds, 0, 0);

    // Interior z levels lie between the coarse nodes and must move
    EXPECT_GT(correction.flat().cwiseAbs().maxCoeff(), 1e-6);
    for (Index i = 0; i < winds.flat().size(); ++i) {
        EXPECT_NEAR(winds.flat()[i], relaxed.flat()[i] + correction.flat()[i], 1e-12);
    }
}

TEST_F(MultigridTest, ShapeMismatchIsRejected) {
    MultigridSolver solver(cost, fine, coarse, params, settings);
    WindField winds(Shape3(1, 1, 1));
    EXPECT_THROW(solver.solve(winds), ConfigurationError);
}

TEST(MultigridSettingsTest, Validation) {
    MultigridSettings settings;
    EXPECT_NO_THROW(settings.validate());

    MultigridSettings steps;
    steps.relaxationSteps = 0;
    EXPECT_THROW(steps.validate(), ConfigurationError);

    MultigridSettings bound;
    bound.windBound = 0.0;
    EXPECT_THROW(bound.validate(), ConfigurationError);

    MultigridSettings increment;
    increment.iterationIncrement = 0;
    EXPECT_THROW(increment.validate(), ConfigurationError);
}
