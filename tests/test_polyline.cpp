#include <gtest/gtest.h>
#include "polyline.hpp"
#include "triangle_list.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

using namespace beardmold;

TEST(SmoothTest, ZeroPassesIsIdentity) {
    Polyline line = test::jaw_arc(9);
    Polyline out = smooth(line, 0);
    ASSERT_EQ(out.size(), line.size());
    for (size_t i = 0; i < line.size(); ++i) {
        EXPECT_EQ(out[i], line[i]);
    }
}

TEST(SmoothTest, EndpointsStayFixed) {
    Polyline line = test::jaw_arc(9);
    Polyline out = smooth(line, 5);
    ASSERT_EQ(out.size(), line.size());
    EXPECT_EQ(out.front(), line.front());
    EXPECT_EQ(out.back(), line.back());
}

TEST(SmoothTest, InteriorPointIsNeighbourMean) {
    Polyline line = {{0.0, 0.0, 0.0}, {1.0, 3.0, 0.0}, {2.0, 0.0, 0.0}, {3.0, 0.0, 0.0}};
    Polyline out = smooth(line, 1);
    EXPECT_DOUBLE_EQ(out[1].x, 1.0);
    EXPECT_DOUBLE_EQ(out[1].y, 1.0);
    // Reads the previous pass, not the point smoothed just before it
    EXPECT_DOUBLE_EQ(out[2].y, 1.0);
}

TEST(SmoothTest, TooFewPointsThrows) {
    Polyline line = {{0.0, 0.0, 0.0}, {1.0, 0.0, 0.0}};
    EXPECT_THROW(smooth(line, 1), InvalidInputError);
    EXPECT_NO_THROW(smooth(line, 0));
}

TEST(TriangleAreaTest, SquaredArea) {
    // Right triangle with legs 2 and 3: |cross| = 6
    EXPECT_DOUBLE_EQ(squared_triangle_area({0, 0, 0}, {2, 0, 0}, {0, 3, 0}), 36.0);
    EXPECT_DOUBLE_EQ(squared_triangle_area({0, 0, 0}, {1, 1, 1}, {2, 2, 2}), 0.0);
}

TEST(ResampleTest, ExactHitsReturnInputPoints) {
    Polyline line = {{0.0, 1.0, 2.0}, {1.0, 3.0, 4.0}, {2.0, 5.0, 6.0}};
    Polyline out = resample_by_axis(line, {0.0, 1.0, 2.0});
    ASSERT_EQ(out.size(), 3u);
    for (size_t i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(out[i].x, line[i].x);
        EXPECT_DOUBLE_EQ(out[i].y, line[i].y);
        EXPECT_DOUBLE_EQ(out[i].z, line[i].z);
    }
}

TEST(ResampleTest, InterpolatesBetweenNeighbours) {
    Polyline line = {{0.0, 0.0, 0.0}, {2.0, 4.0, -2.0}};
    Polyline out = resample_by_axis(line, {0.5});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_DOUBLE_EQ(out[0].x, 0.5);
    EXPECT_DOUBLE_EQ(out[0].y, 1.0);
    EXPECT_DOUBLE_EQ(out[0].z, -0.5);
}

TEST(ResampleTest, ClampsToBoundaryVertex) {
    Polyline line = {{0.0, 1.0, 2.0}, {1.0, 3.0, 4.0}};
    Polyline out = resample_by_axis(line, {-5.0, 7.0});
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], Point3(0.0, 1.0, 2.0));
    EXPECT_EQ(out[1], Point3(1.0, 3.0, 4.0));
}

TEST(ResampleTest, ClampsUnsortedInputToExtremes) {
    Polyline line = {{1.0, 3.0, 4.0}, {0.5, 0.0, 0.0}, {0.0, 1.0, 2.0}};
    Polyline out = resample_by_axis(line, {-1.0, 2.0});
    EXPECT_EQ(out[0], line[2]);
    EXPECT_EQ(out[1], line[0]);
}

TEST(ResampleTest, SortsUnorderedInput) {
    Polyline line = {{2.0, 2.0, 0.0}, {0.0, 0.0, 0.0}, {1.0, 1.0, 0.0}};
    Polyline out = resample_by_axis(line, {0.5, 1.5});
    EXPECT_DOUBLE_EQ(out[0].y, 0.5);
    EXPECT_DOUBLE_EQ(out[1].y, 1.5);
}

TEST(ResampleTest, EmptyThrows) {
    EXPECT_THROW(resample_by_axis({}, {0.0}), InvalidInputError);
}

TEST(TriangleListTest, DropsDegenerateTriangles) {
    TriangleList list;
    EXPECT_TRUE(list.add({0, 0, 0}, {1, 0, 0}, {0, 1, 0}));
    EXPECT_FALSE(list.add({0, 0, 0}, {1, 0, 0}, {2, 0, 0}));
    EXPECT_FALSE(list.add({0, 0, 0}, {0, 0, 0}, {0, 1, 0}));
    EXPECT_EQ(list.size(), 1u);
    EXPECT_EQ(list.dropped(), 2u);
}

TEST(TriangleListTest, AppendKeepsOrder) {
    TriangleList a;
    a.add({0, 0, 0}, {1, 0, 0}, {0, 1, 0});
    TriangleList b;
    b.add({5, 0, 0}, {6, 0, 0}, {5, 1, 0});
    a.append(b);
    ASSERT_EQ(a.size(), 2u);
    EXPECT_DOUBLE_EQ(a[1][0].x, 5.0);
}
