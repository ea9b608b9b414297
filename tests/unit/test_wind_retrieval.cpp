// tests/unit/test_wind_retrieval.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/io/SyntheticCase.hpp"
#include "mgwind/retrieval/WindRetrieval.hpp"
#include <cmath>

using namespace mgwind;
using namespace mgwind::retrieval;

class WindRetrievalTest : public ::testing::Test {
protected:
    void SetUp() override {
        level = GridLevel(VectorX::LinSpaced(4, 0.0, 3000.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0),
                          VectorX::LinSpaced(4, -1500.0, 1500.0));
        RadarSite a, b;
        a.name = "A";
        a.x = -20000.0;
        a.y = -20000.0;
        b.name = "B";
        b.x = 20000.0;
        b.y = -20000.0;
        grids = io::syntheticCase(level, {a, b}, flow);

        inputs.u0 = Field3D(level.shape(), 0.0);
        inputs.v0 = Field3D(level.shape(), 0.0);
        inputs.w0 = Field3D(level.shape(), 0.0);
        settings.multigrid.maxIterations = 50;
    }

    GridLevel level;
    io::SyntheticFlow flow;
    std::vector<Grid> grids;
    RetrievalInputs inputs;
    RetrievalSettings settings;
};

TEST_F(WindRetrievalTest, AnalysisLevelsOnBothResolutions) {
    std::vector<Grid> work = grids;
    AnalysisLevels levels = buildAnalysisLevels(work, inputs, settings);

    EXPECT_EQ(levels.fine.shape(), level.shape());
    EXPECT_EQ(levels.coarse.shape(), Shape3(2, 2, 2));
    ASSERT_EQ(levels.fine.observations.numRadars(), 2u);
    ASSERT_EQ(levels.coarse.observations.numRadars(), 2u);
    EXPECT_EQ(levels.coarse.weights.observation[0].size(), 8);
    EXPECT_TRUE(work[0].hasField("AZ"));
    EXPECT_TRUE(work[1].hasField("EL"));

    // Angles are carried in radians
    const Real az = levels.fine.observations.radars[0].azimuth[0];
    EXPECT_NEAR(az, work[0].field("AZ").data[0] * DEG_TO_RAD, 1e-12);

    // No sounding: zero background on both levels
    EXPECT_DOUBLE_EQ(levels.fine.background.u.cwiseAbs().maxCoeff(), 0.0);
    EXPECT_EQ(levels.coarse.background.u.size(), 2);
    EXPECT_DOUBLE_EQ(levels.fine.rmsVr, levels.coarse.rmsVr);
}

TEST_F(WindRetrievalTest, RmsVrOfTheWeightedObservations) {
    std::vector<Grid> work = grids;
    AnalysisLevels levels = buildAnalysisLevels(work, inputs, settings);

    const physics::AnalysisLevel& c = levels.coarse;
    Real sum = 0.0, weight = 0.0;
    for (std::size_t r = 0; r < c.observations.numRadars(); ++r) {
        const Field3D& vr = c.observations.radars[r].radialVelocity;
        for (Index p = 0; p < vr.size(); ++p) {
            if (vr.isValid(p) && c.weights.observation[r][p] > 0) {
                sum += c.weights.observation[r][p] * sqr(vr[p]);
                weight += c.weights.observation[r][p];
            }
        }
    }
    ASSERT_GT(weight, 0.0);
    EXPECT_NEAR(weightedRmsVr(c), std::sqrt(sum / weight), 1e-12);
    EXPECT_NEAR(c.rmsVr, std::sqrt(sum / weight), 1e-12);
}

TEST_F(WindRetrievalTest, RmsVrDefaultsToOneWithoutWeight) {
    physics::AnalysisLevel empty;
    empty.grid = level;
    physics::RadarObservations obs;
    obs.radialVelocity = Field3D(level.shape(), 4.0);
    empty.observations.radars.push_back(obs);
    empty.weights.observation.push_back(VectorX::Zero(level.size()));
    EXPECT_DOUBLE_EQ(weightedRmsVr(empty), 1.0);
}

TEST_F(WindRetrievalTest, SoundingFillsTheBackground) {
    Sounding sounding;
    sounding.z = VectorX::LinSpaced(2, 0.0, 2000.0);
    sounding.u = VectorX::LinSpaced(2, 2.0, 6.0);
    sounding.v = VectorX::Constant(2, -1.0);
    inputs.sounding = sounding;

    std::vector<Grid> work = grids;
    AnalysisLevels levels = buildAnalysisLevels(work, inputs, settings);
    EXPECT_NEAR(levels.fine.background.u[1], 4.0, 1e-12);
    EXPECT_NEAR(levels.fine.background.v[0], -1.0, 1e-12);
    // Above the sounding the background is undefined
    EXPECT_TRUE(std::isnan(levels.fine.background.u[3]));
    EXPECT_NEAR(levels.coarse.background.u[0], 3.0, 1e-12);

    Sounding ragged = sounding;
    ragged.u = VectorX::Zero(3);
    inputs.sounding = ragged;
    EXPECT_THROW(buildAnalysisLevels(work, inputs, settings), ConfigurationError);
}

TEST_F(WindRetrievalTest, ModelFieldsAreReadFromTheFirstGrid) {
    for (const char* prefix : {"U_", "V_", "W_"}) {
        grids[0].addField(std::string(prefix) + "hrrr", GridField(Field3D(level.shape(), 2.0)));
    }
    inputs.modelFields = {"hrrr"};

    std::vector<Grid> work = grids;
    AnalysisLevels levels = buildAnalysisLevels(work, inputs, settings);
    ASSERT_EQ(levels.fine.models.size(), 1u);
    ASSERT_EQ(levels.coarse.models.size(), 1u);
    EXPECT_EQ(levels.fine.weights.model.size(), 1u);
    EXPECT_NEAR(levels.coarse.models[0].u[0], 2.0, 1e-12);

    inputs.modelFields = {"missing"};
    EXPECT_THROW(buildAnalysisLevels(work, inputs, settings), ConfigurationError);
}

TEST_F(WindRetrievalTest, RetrievalAddsWindFieldsToEveryGrid) {
    RetrievalResult result = retrieveWinds(grids, inputs, settings);
    ASSERT_EQ(result.grids.size(), 2u);
    EXPECT_EQ(result.history.size(), 1u);
    EXPECT_EQ(result.winds.shape(), level.shape());
    for (const Grid& grid : result.grids) {
        EXPECT_TRUE(grid.hasField("u"));
        EXPECT_TRUE(grid.hasField("v"));
        EXPECT_TRUE(grid.hasField("w"));
    }
    EXPECT_FALSE(grids[0].hasField("u"));
    EXPECT_GT(result.rmsVr, 0.0);
}

TEST_F(WindRetrievalTest, ConfigurationErrorsBeforeComputation) {
    RetrievalSettings vorticity = settings;
    vorticity.cost.vorticity = 1.0;
    EXPECT_THROW(retrieveWinds(grids, inputs, vorticity), ConfigurationError);

    RetrievalSettings model = settings;
    model.cost.model = 1.0;
    EXPECT_THROW(retrieveWinds(grids, inputs, model), ConfigurationError);

    RetrievalSettings bca = settings;
    bca.minBca = 160.0;
    EXPECT_THROW(retrieveWinds(grids, inputs, bca), ConfigurationError);

    RetrievalInputs badShape = inputs;
    badShape.u0 = Field3D(Shape3(1, 1, 1));
    EXPECT_THROW(retrieveWinds(grids, badShape, settings), ConfigurationError);

    std::vector<Grid> shifted = grids;
    shifted[1].setOrigin(10.0, 0.0);
    EXPECT_THROW(retrieveWinds(shifted, inputs, settings), ConfigurationError);

    EXPECT_THROW(retrieveWinds({}, inputs, settings), ConfigurationError);

    RetrievalSettings field = settings;
    field.velocityField = "VEL";
    EXPECT_THROW(retrieveWinds(grids, inputs, field), ConfigurationError);

    RetrievalInputs negative = inputs;
    negative.weights.background = VectorX::Constant(level.size(), -0.5);
    EXPECT_THROW(retrieveWinds(grids, negative, settings), ConfigurationError);
}

TEST_F(WindRetrievalTest, MaskedFirstGuessIsRejected) {
    RetrievalInputs masked = inputs;
    masked.u0.setMasked(level.shape().index(2, 1, 1), true);
    EXPECT_THROW(retrieveWinds(grids, masked, settings), ConfigurationError);

    RetrievalInputs nonFinite = inputs;
    nonFinite.w0[level.shape().index(1, 2, 2)] = NaN;
    EXPECT_THROW(retrieveWinds(grids, nonFinite, settings), ConfigurationError);

    RetrievalResult result = retrieveWinds(grids, inputs, settings);
    for (Index i = 0; i < result.winds.flat().size(); ++i) {
        EXPECT_TRUE(std::isfinite(result.winds.flat()[i]));
    }
}
