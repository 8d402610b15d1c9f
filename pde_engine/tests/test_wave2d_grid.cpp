#include <gtest/gtest.h>

#include "wave2d_grid.hpp"
#include "wave2d_params.hpp"

TEST(Wave2DGrid, ShapeSpacingAndCoordinates) {
    Wave2DGrid grid(4);

    EXPECT_EQ(grid.n(), 4);
    EXPECT_EQ(grid.points(), 5);
    EXPECT_EQ(grid.size(), 25u);
    EXPECT_DOUBLE_EQ(grid.h(), 0.25);

    ASSERT_EQ(grid.get_x().size(), 5u);
    ASSERT_EQ(grid.get_y().size(), 5u);
    for (int i = 0; i <= 4; ++i) {
        EXPECT_DOUBLE_EQ(grid.get_x()[i], 0.25 * i);
        EXPECT_DOUBLE_EQ(grid.get_y()[i], 0.25 * i);
    }
    EXPECT_DOUBLE_EQ(grid.get_x().back(), 1.0);
}

TEST(Wave2DGrid, BuffersStartZeroWithIdenticalShape) {
    Wave2DGrid grid(3);

    for (const auto* buf : {&grid.previous(), &grid.current(), &grid.next()}) {
        ASSERT_EQ(buf->size(), 16u);
        for (double v : *buf) {
            EXPECT_EQ(v, 0.0);
        }
    }
    EXPECT_NE(&grid.previous(), &grid.current());
    EXPECT_NE(&grid.current(), &grid.next());
}

TEST(Wave2DGrid, RowMajorIndexing) {
    Wave2DGrid grid(4);
    EXPECT_EQ(grid.idx(0, 0), 0u);
    EXPECT_EQ(grid.idx(4, 0), 4u);
    EXPECT_EQ(grid.idx(0, 1), 5u);
    EXPECT_EQ(grid.idx(2, 3), 17u);
}

TEST(Wave2DGrid, RejectsTooCoarseResolution) {
    EXPECT_THROW(Wave2DGrid(1), Wave2DParameterError);
    EXPECT_THROW(Wave2DGrid(46341), Wave2DParameterError);
    EXPECT_NO_THROW(Wave2DGrid(2));

    try {
        Wave2DGrid grid(0);
        FAIL() << "expected Wave2DParameterError";
    } catch (const Wave2DParameterError& e) {
        EXPECT_EQ(e.kind(), Wave2DErrorKind::InvalidResolution);
    }

    try {
        Wave2DGrid grid(max_grid_resolution() + 1);
        FAIL() << "expected Wave2DParameterError";
    } catch (const Wave2DParameterError& e) {
        EXPECT_EQ(e.kind(), Wave2DErrorKind::InvalidResolution);
    }
}

TEST(Wave2DGrid, SizeAndIndexAreUnsigned) {
    Wave2DGrid grid(2);
    EXPECT_EQ(grid.size(), 9u);
    EXPECT_EQ(grid.idx(2, 2), grid.size() - 1);
}
