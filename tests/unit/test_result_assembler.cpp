// tests/unit/test_result_assembler.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/retrieval/ResultAssembler.hpp"

using namespace mgwind;
using namespace mgwind::retrieval;

class ResultAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        level = GridLevel(VectorX::LinSpaced(2, 0.0, 1000.0),
                          VectorX::LinSpaced(2, 0.0, 1000.0),
                          VectorX::LinSpaced(2, 0.0, 1000.0));
        const Index n = level.size();

        for (int r = 0; r < 2; ++r) {
            Grid grid(level, RadarSite());
            GridField vr(Field3D(level.shape(), 1.0), "m/s");
            vr.standardName = "radial_velocity_of_scatterers_away_from_instrument";
            grid.addField("corrected_velocity", vr);
            grids.push_back(grid);
        }

        winds = WindField(level.shape());
        winds.u().setConstant(3.0);
        winds.v().setConstant(-2.0);
        winds.w().setConstant(0.5);

        // Cell 0 is outside the weighted region
        weights.observation = {VectorX::Ones(n), VectorX::Ones(n)};
        weights.observation[0][0] = 0.0;
        weights.observation[1][0] = 0.0;
        weights.background = VectorX::Zero(n);
        weights.background[0] = 1.0;
    }

    GridLevel level;
    std::vector<Grid> grids;
    WindField winds;
    physics::WeightSet weights;
};

TEST_F(ResultAssemblerTest, EveryGridGetsTheSameWinds) {
    std::vector<Grid> result = assembleResult(grids, winds, weights);
    ASSERT_EQ(result.size(), 2u);
    for (const Grid& grid : result) {
        ASSERT_TRUE(grid.hasField(U_FIELD));
        ASSERT_TRUE(grid.hasField(V_FIELD));
        ASSERT_TRUE(grid.hasField(W_FIELD));
        EXPECT_DOUBLE_EQ(grid.field(U_FIELD).data[3], 3.0);
        EXPECT_DOUBLE_EQ(grid.field(V_FIELD).data[3], -2.0);
        EXPECT_DOUBLE_EQ(grid.field(W_FIELD).data[3], 0.5);
        EXPECT_TRUE(grid.hasField("corrected_velocity"));
    }
    EXPECT_FALSE(grids[0].hasField(U_FIELD));
}

TEST_F(ResultAssemblerTest, MetadataFollowsTheComponent) {
    std::vector<Grid> result = assembleResult(grids, winds, weights);
    const GridField& u = result[0].field(U_FIELD);
    EXPECT_EQ(u.standardName, "u_wind");
    EXPECT_EQ(u.longName, "zonal component of wind velocity");
    EXPECT_EQ(u.units, "m/s");
    EXPECT_DOUBLE_EQ(u.attributes.at("min_bca"), 30.0);
    EXPECT_DOUBLE_EQ(u.attributes.at("max_bca"), 150.0);
    EXPECT_EQ(result[0].field(V_FIELD).longName, "meridional component of wind velocity");
    EXPECT_EQ(result[0].field(W_FIELD).standardName, "w_wind");
}

TEST_F(ResultAssemblerTest, VerticalWindIsMaskedOutsideByDefault) {
    std::vector<Grid> result = assembleResult(grids, winds, weights);
    EXPECT_TRUE(result[0].field(W_FIELD).data.isMasked(0));
    EXPECT_TRUE(result[0].field(U_FIELD).data.isValid(0));
    EXPECT_TRUE(result[0].field(W_FIELD).data.isValid(1));
}

TEST_F(ResultAssemblerTest, MaskOutsideMasksEveryComponent) {
    AssemblyOptions options;
    options.maskOutsideOpt = true;
    std::vector<Grid> result = assembleResult(grids, winds, weights, options);
    EXPECT_TRUE(result[0].field(U_FIELD).data.isMasked(0));
    EXPECT_TRUE(result[0].field(V_FIELD).data.isMasked(0));
    EXPECT_TRUE(result[0].field(W_FIELD).data.isMasked(0));
    EXPECT_EQ(result[0].field(U_FIELD).data.countValid(), level.size() - 1);
}

TEST_F(ResultAssemblerTest, NoMaskingWhenDisabled) {
    AssemblyOptions options;
    options.maskWOutsideOpt = false;
    std::vector<Grid> result = assembleResult(grids, winds, weights, options);
    EXPECT_EQ(result[0].field(W_FIELD).data.countValid(), level.size());
}

TEST_F(ResultAssemblerTest, ExistingWindFieldsAreReplaced) {
    std::vector<Grid> first = assembleResult(grids, winds, weights);
    winds.u().setConstant(7.0);
    std::vector<Grid> second = assembleResult(first, winds, weights);
    EXPECT_DOUBLE_EQ(second[1].field(U_FIELD).data[2], 7.0);
}

TEST_F(ResultAssemblerTest, NonFiniteWindsAreMasked) {
    winds.v()[5] = NaN;
    std::vector<Grid> result = assembleResult(grids, winds, weights);
    EXPECT_TRUE(result[0].field(V_FIELD).data.isMasked(5));
}

TEST_F(ResultAssemblerTest, Errors) {
    EXPECT_THROW(assembleResult({}, winds, weights), ConfigurationError);
    AssemblyOptions options;
    options.velocityField = "missing";
    EXPECT_THROW(assembleResult(grids, winds, weights, options), ConfigurationError);
}
