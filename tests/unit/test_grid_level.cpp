// tests/unit/test_grid_level.cpp
#include <gtest/gtest.h>
#include "mgwind/core/Exceptions.hpp"
#include "mgwind/core/GridLevel.hpp"
#include "mgwind/numerics/GridTransfer.hpp"

using namespace mgwind;

class GridLevelTest : public ::testing::Test {
protected:
    void SetUp() override {
        level = GridLevel(VectorX::LinSpaced(4, 0.0, 3000.0),
                          VectorX::LinSpaced(6, -2500.0, 2500.0),
                          VectorX::LinSpaced(7, -3000.0, 3000.0));
    }

    GridLevel level;
};

TEST_F(GridLevelTest, ShapeAndSpacing) {
    EXPECT_EQ(level.shape(), Shape3(4, 6, 7));
    EXPECT_EQ(level.size(), 168);
    EXPECT_DOUBLE_EQ(level.dz(), 1000.0);
    EXPECT_DOUBLE_EQ(level.dy(), 1000.0);
    EXPECT_DOUBLE_EQ(level.dx(), 1000.0);
    EXPECT_TRUE(level.canCoarsen());
}

TEST_F(GridLevelTest, CoarsenHalvesEveryAxis) {
    GridLevel coarse = level.coarsen();
    EXPECT_EQ(coarse.shape(), Shape3(2, 3, 3));

    // Midpoints of adjacent fine pairs
    EXPECT_DOUBLE_EQ(coarse.z()[0], 500.0);
    EXPECT_DOUBLE_EQ(coarse.z()[1], 2500.0);
    EXPECT_DOUBLE_EQ(coarse.y()[0], -2000.0);
    EXPECT_DOUBLE_EQ(coarse.x()[2], 1500.0);
    EXPECT_DOUBLE_EQ(coarse.dx(), 2000.0);
}

TEST_F(GridLevelTest, PointHeights) {
    VectorX z = level.pointZ();
    ASSERT_EQ(z.size(), level.size());
    EXPECT_DOUBLE_EQ(z[0], 0.0);
    EXPECT_DOUBLE_EQ(z[level.shape().index(2, 3, 4)], 2000.0);
}

TEST_F(GridLevelTest, ConstantFieldSurvivesCoarsening) {
    numerics::GridTransfer transfer(level);
    VectorX constant = VectorX::Constant(level.size(), 4.25);
    VectorX coarse = transfer.restrictValues(constant);

    ASSERT_EQ(coarse.size(), transfer.coarse().size());
    for (Index i = 0; i < coarse.size(); ++i) {
        EXPECT_NEAR(coarse[i], 4.25, 1e-12);
    }
}

TEST_F(GridLevelTest, ShortOrUnorderedAxesCannotCoarsen) {
    GridLevel flat(VectorX::Constant(1, 0.0), VectorX::LinSpaced(3, 0.0, 2.0),
                   VectorX::LinSpaced(3, 0.0, 2.0));
    EXPECT_FALSE(flat.canCoarsen());
    EXPECT_THROW(flat.coarsen(), ConfigurationError);

    VectorX decreasing(3);
    decreasing << 2.0, 1.0, 0.0;
    GridLevel reversed(VectorX::LinSpaced(2, 0.0, 1.0), decreasing, decreasing);
    EXPECT_FALSE(reversed.canCoarsen());
}
