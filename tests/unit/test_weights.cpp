// tests/unit/test_weights.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/physics/RadarGeometry.hpp"
#include "mgwind/retrieval/WeightBuilder.hpp"
#include <cmath>

using namespace mgwind;
using namespace mgwind::retrieval;

class WeightBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        level = GridLevel(VectorX::LinSpaced(2, 0.0, 1000.0),
                          VectorX::LinSpaced(5, -2000.0, 2000.0),
                          VectorX::LinSpaced(5, -2000.0, 2000.0));

        west.name = "west";
        west.x = -20000.0;
        west.y = -20000.0;
        east.name = "east";
        east.x = 20000.0;
        east.y = -20000.0;
        // Collocated with west: the pair has a zero crossing angle everywhere
        twin.name = "twin";
        twin.x = -20000.0;
        twin.y = -20000.0;
    }

    physics::RadarObservations observations(Real value = 1.0) const {
        physics::RadarObservations obs;
        obs.radialVelocity = Field3D(level.shape(), value);
        obs.fallSpeed = Field3D(level.shape(), 0.0);
        obs.azimuth = Field3D(level.shape(), 0.0);
        obs.elevation = Field3D(level.shape(), 0.0);
        return obs;
    }

    GridLevel level;
    RadarSite west, east, twin;
};

TEST_F(WeightBuilderTest, WeightsAreClippedToZeroOrOne) {
    // Three radars: every cell is counted by more than one pair
    RadarSite north;
    north.x = 0.0;
    north.y = 30000.0;

    physics::ObservationSet set;
    set.radars = {observations(), observations(), observations()};
    physics::WeightSet weights = buildWeights(level, {west, east, north}, set, 0);

    ASSERT_EQ(weights.observation.size(), 3u);
    for (const VectorX& w : weights.observation) {
        for (Index p = 0; p < w.size(); ++p) {
            EXPECT_TRUE(w[p] == 0.0 || w[p] == 1.0);
        }
        EXPECT_GT(w.sum(), 0.0);
    }
}

TEST_F(WeightBuilderTest, GoodCrossingAngleWeightsBothRadars) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};
    physics::WeightSet weights = buildWeights(level, {west, east}, set, 0);

    // About 90 degrees near the origin
    for (Index p = 0; p < level.size(); ++p) {
        EXPECT_DOUBLE_EQ(weights.observation[0][p], 1.0);
        EXPECT_DOUBLE_EQ(weights.observation[1][p], 1.0);
        EXPECT_DOUBLE_EQ(weights.background[p], 0.0);
    }
    EXPECT_TRUE(weights.model.empty());
}

TEST_F(WeightBuilderTest, InvalidObservationGetsNoWeight) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};
    set.radars[1].radialVelocity.setMasked(3, true);

    physics::WeightSet weights = buildWeights(level, {west, east}, set, 0);
    EXPECT_DOUBLE_EQ(weights.observation[0][3], 1.0);
    EXPECT_DOUBLE_EQ(weights.observation[1][3], 0.0);
    EXPECT_DOUBLE_EQ(weights.background[3], 0.0);
}

TEST_F(WeightBuilderTest, PoorCrossingAngleFallsBackToBackground) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};
    physics::WeightSet weights = buildWeights(level, {west, twin}, set, 0);

    EXPECT_DOUBLE_EQ(weights.observation[0].sum(), 0.0);
    EXPECT_DOUBLE_EQ(weights.observation[1].sum(), 0.0);
    for (Index p = 0; p < level.size(); ++p) {
        EXPECT_DOUBLE_EQ(weights.background[p], 1.0);
    }
}

TEST_F(WeightBuilderTest, SingleRadarWeightsItsValidObservations) {
    physics::ObservationSet set;
    set.radars = {observations()};
    set.radars[0].radialVelocity.setMasked(0, true);
    set.radars[0].radialVelocity.setMasked(7, true);

    physics::WeightSet weights = buildWeights(level, {west}, set, 0);
    ASSERT_EQ(weights.observation.size(), 1u);
    EXPECT_DOUBLE_EQ(weights.observation[0][0], 0.0);
    EXPECT_DOUBLE_EQ(weights.background[0], 1.0);
    EXPECT_DOUBLE_EQ(weights.observation[0][7], 0.0);
    EXPECT_DOUBLE_EQ(weights.background[7], 1.0);
    EXPECT_DOUBLE_EQ(weights.observation[0][1], 1.0);
    EXPECT_DOUBLE_EQ(weights.background[1], 0.0);
    EXPECT_DOUBLE_EQ(weights.observation[0].sum(), static_cast<Real>(level.size() - 2));
}

TEST_F(WeightBuilderTest, ModelWeightsFavourPoorCoverage) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};
    set.radars[0].radialVelocity.setMasked(0, true);
    set.radars[1].radialVelocity.setMasked(0, true);
    set.radars[1].radialVelocity.setMasked(1, true);

    physics::WeightSet weights = buildWeights(level, {west, east}, set, 2);
    ASSERT_EQ(weights.model.size(), 2u);
    // Grade 0, 1/2 and 1 over (n + 1) = 3 radars
    EXPECT_NEAR(weights.model[0][0], 1.0, 1e-12);
    EXPECT_NEAR(weights.model[0][1], 1.0 - 0.5 / 3.0, 1e-12);
    EXPECT_NEAR(weights.model[1][2], 1.0 - 1.0 / 3.0, 1e-12);
}

TEST_F(WeightBuilderTest, OverridesReplaceComputedWeights) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};

    WeightOverrides overrides;
    overrides.observation = std::vector<VectorX>{VectorX::Constant(level.size(), 0.5),
                                                 VectorX::Constant(level.size(), 2.0)};
    overrides.background = VectorX::Constant(level.size(), 0.25);

    physics::WeightSet weights =
        buildWeights(level, {west, east}, set, 0, CoverageOptions(), overrides);
    EXPECT_DOUBLE_EQ(weights.observation[0][4], 0.5);
    EXPECT_DOUBLE_EQ(weights.observation[1][4], 2.0);
    EXPECT_DOUBLE_EQ(weights.background[4], 0.25);
}

TEST_F(WeightBuilderTest, InvalidOverridesAreRejected) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};

    WeightOverrides negative;
    negative.background = VectorX::Constant(level.size(), -1.0);
    EXPECT_THROW(buildWeights(level, {west, east}, set, 0, CoverageOptions(), negative),
                 ConfigurationError);

    WeightOverrides wrongShape;
    wrongShape.background = VectorX::Zero(3);
    EXPECT_THROW(buildWeights(level, {west, east}, set, 0, CoverageOptions(), wrongShape),
                 ConfigurationError);

    WeightOverrides wrongCount;
    wrongCount.observation = std::vector<VectorX>{VectorX::Zero(level.size())};
    EXPECT_THROW(buildWeights(level, {west, east}, set, 0, CoverageOptions(), wrongCount),
                 ConfigurationError);
}

TEST_F(WeightBuilderTest, RestrictedWeightsHaveNoNaN) {
    physics::ObservationSet set;
    set.radars = {observations(), observations()};
    physics::WeightSet weights = buildWeights(level, {west, east}, set, 1);

    numerics::GridTransfer transfer(level);
    physics::WeightSet coarse = restrictWeights(weights, transfer);
    ASSERT_EQ(coarse.observation.size(), 2u);
    ASSERT_EQ(coarse.model.size(), 1u);
    for (Index p = 0; p < coarse.background.size(); ++p) {
        EXPECT_TRUE(std::isfinite(coarse.background[p]));
        EXPECT_NEAR(coarse.observation[0][p], 1.0, 1e-12);
    }
}

TEST(CoverageGradeTest, NormalisedByMaximum) {
    physics::WeightSet weights;
    weights.observation = {VectorX::Zero(3), VectorX::Zero(3)};
    weights.observation[0] << 1.0, 1.0, 0.0;
    weights.observation[1] << 1.0, 0.0, 0.0;

    VectorX grade = coverageGrade(weights);
    EXPECT_DOUBLE_EQ(grade[0], 1.0);
    EXPECT_DOUBLE_EQ(grade[1], 0.5);
    EXPECT_DOUBLE_EQ(grade[2], 0.0);
}
