// tests/unit/test_bounded_quasi_newton.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/solvers/BoundedQuasiNewton.hpp"
#include <cmath>

using namespace mgwind;
using namespace mgwind::solvers;

class BoundedQuasiNewtonTest : public ::testing::Test {
protected:
    void SetUp() override {
        centre.resize(4);
        centre << 2.0, -3.0, 0.5, -0.25;
        scale.resize(4);
        scale << 1.0, 10.0, 0.5, 4.0;
    }

    // Anisotropic quadratic bowl around `centre`
    Real value(const VectorX& x) const {
        return (scale.array() * (x - centre).array().square()).sum();
    }

    VectorX gradient(const VectorX& x) const {
        return 2.0 * scale.cwiseProduct(x - centre);
    }

    BoundedQuasiNewton::Objective f() const {
        return [this](const VectorX& x) { return value(x); };
    }

    BoundedQuasiNewton::Gradient g() const {
        return [this](const VectorX& x) { return gradient(x); };
    }

    VectorX centre;
    VectorX scale;
};

TEST_F(BoundedQuasiNewtonTest, UnconstrainedMinimum) {
    BoundedQuasiNewton::Settings settings;
    settings.pgtol = 1e-8;
    BoundedQuasiNewton optimizer(settings);

    VectorX x = VectorX::Zero(4);
    BoundedQuasiNewtonResult result = optimizer.minimize(x, f(), g(), -10.0, 10.0);

    EXPECT_TRUE(result.converged()) << result.message;
    for (Index i = 0; i < 4; ++i) {
        EXPECT_NEAR(x[i], centre[i], 1e-6);
    }
    EXPECT_NEAR(result.value, 0.0, 1e-10);
}

TEST_F(BoundedQuasiNewtonTest, ActiveBoundsHoldTheSolution) {
    BoundedQuasiNewton::Settings settings;
    settings.pgtol = 1e-8;
    BoundedQuasiNewton optimizer(settings);

    VectorX x = VectorX::Zero(4);
    BoundedQuasiNewtonResult result = optimizer.minimize(x, f(), g(), -1.0, 1.0);

    EXPECT_TRUE(result.converged()) << result.message;
    EXPECT_NEAR(x[0], 1.0, 1e-7);
    EXPECT_NEAR(x[1], -1.0, 1e-7);
    EXPECT_NEAR(x[2], 0.5, 1e-6);
    EXPECT_NEAR(x[3], -0.25, 1e-6);
    EXPECT_LE(result.projectedGradientNorm, 1e-8);
}

TEST_F(BoundedQuasiNewtonTest, PerVariableBounds) {
    BoundedQuasiNewton optimizer;
    VectorX lower(4), upper(4);
    lower << -5.0, -5.0, 0.75, -5.0;
    upper << 1.5, 5.0, 5.0, 5.0;

    VectorX x = VectorX::Zero(4);
    BoundedQuasiNewtonResult result = optimizer.minimize(x, f(), g(), lower, upper);

    EXPECT_TRUE(result.converged()) << result.message;
    EXPECT_NEAR(x[0], 1.5, 1e-3);
    EXPECT_NEAR(x[2], 0.75, 1e-3);
    EXPECT_NEAR(x[1], -3.0, 1e-3);
}

TEST_F(BoundedQuasiNewtonTest, NonFiniteStartIsReplaced) {
    BoundedQuasiNewton optimizer;
    VectorX x = VectorX::Zero(4);
    x[1] = NaN;

    BoundedQuasiNewtonResult result = optimizer.minimize(x, f(), g(), 1.0, 3.0);
    EXPECT_TRUE(std::isfinite(result.value));
    for (Index i = 0; i < 4; ++i) {
        EXPECT_TRUE(std::isfinite(x[i]));
        EXPECT_GE(x[i], 1.0);
        EXPECT_LE(x[i], 3.0);
    }
}

TEST_F(BoundedQuasiNewtonTest, IterationLimitIsReported) {
    BoundedQuasiNewton::Settings settings;
    settings.maxIterations = 0;
    BoundedQuasiNewton optimizer(settings);

    VectorX x = VectorX::Zero(4);
    BoundedQuasiNewtonResult result = optimizer.minimize(x, f(), g(), -10.0, 10.0);
    EXPECT_EQ(result.flag, TerminationFlag::ITERATION_LIMIT);
    EXPECT_EQ(result.iterations, 0);
    EXPECT_DOUBLE_EQ(x[0], 0.0);
}

TEST_F(BoundedQuasiNewtonTest, ProjectedGradientAtBound) {
    VectorX x(2), grad(2), lower(2), upper(2);
    x << 1.0, 0.0;
    grad << -3.0, 0.5;
    lower << -1.0, -1.0;
    upper << 1.0, 1.0;
    // First variable is pinned at its upper bound
    EXPECT_DOUBLE_EQ(BoundedQuasiNewton::projectedGradientNorm(x, grad, lower, upper), 0.5);
}

TEST_F(BoundedQuasiNewtonTest, InvalidSettingsAndBounds) {
    BoundedQuasiNewton::Settings settings;
    settings.memorySize = 0;
    EXPECT_THROW(BoundedQuasiNewton{settings}, ConfigurationError);

    BoundedQuasiNewton optimizer;
    VectorX x = VectorX::Zero(4);
    EXPECT_THROW(optimizer.minimize(x, f(), g(), 1.0, -1.0), ConfigurationError);
    EXPECT_THROW(optimizer.minimize(x, f(), g(), VectorX::Zero(2), VectorX::Ones(2)),
                 ConfigurationError);
}
