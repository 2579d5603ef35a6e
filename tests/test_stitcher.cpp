#include <gtest/gtest.h>
#include "stitcher.hpp"
#include "contour_sampler.hpp"
#include "test_helpers.hpp"
#include <stdexcept>

using namespace beardmold;

TEST(StitchStripTest, TwoTrianglesPerInterval) {
    Polyline a = test::straight_line({0.0, 0.0, 1.0}, {3.0, 0.0, 1.0}, 4);
    Polyline b = test::straight_line({0.0, 0.0, 0.0}, {3.0, 0.0, 0.0}, 4);
    TriangleList strip = stitch_strip(a, b);
    ASSERT_EQ(strip.size(), 6u);

    EXPECT_EQ(strip[0][0], a[0]);
    EXPECT_EQ(strip[0][1], b[0]);
    EXPECT_EQ(strip[0][2], a[1]);
    EXPECT_EQ(strip[1][0], a[1]);
    EXPECT_EQ(strip[1][1], b[0]);
    EXPECT_EQ(strip[1][2], b[1]);
}

TEST(StitchStripTest, LengthMismatchThrows) {
    Polyline a = test::straight_line({0, 0, 0}, {1, 0, 0}, 3);
    Polyline b = test::straight_line({0, 0, 1}, {1, 0, 1}, 4);
    EXPECT_THROW(stitch_strip(a, b), std::invalid_argument);
}

TEST(StitchStripTest, CoincidentSequencesDropEverything) {
    Polyline a = test::straight_line({0, 0, 0}, {1, 0, 0}, 3);
    TriangleList strip = stitch_strip(a, a);
    EXPECT_TRUE(strip.empty());
    EXPECT_EQ(strip.dropped(), 4u);
}

class StitchContoursTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.lip_segments = 10;
        params.arc_steps = 4;
        beardline = test::jaw_arc(30);
        sample = sample_base_points(beardline, params.base_point_count());
    }

    MoldParameters params;
    Polyline beardline;
    ContourSample sample;
};

TEST_F(StitchContoursTest, WithoutNeckline) {
    LipLoft loft = LipLoft::from_sample(sample, params);
    StitchedSurface surface = stitch_contours(loft, beardline, {}, sample.xs);

    EXPECT_EQ(surface.lip_triangle_count, loft.triangles().size());
    EXPECT_EQ(surface.beard_strip_count, 2u * 10u);
    EXPECT_EQ(surface.neck_strip_count, 0u);
    EXPECT_TRUE(surface.neckline.empty());
    EXPECT_EQ(surface.triangles.size(), surface.lip_triangle_count + surface.beard_strip_count);
}

TEST_F(StitchContoursTest, WithNeckline) {
    LipLoft loft = LipLoft::from_sample(sample, params);
    Polyline neckline = test::straight_line({-0.06, 0.03, -0.05}, {0.06, 0.03, -0.05}, 7);
    StitchedSurface surface = stitch_contours(loft, beardline, neckline, sample.xs);

    EXPECT_EQ(surface.neck_strip_count, 2u * 10u);
    ASSERT_EQ(surface.neckline.size(), sample.xs.size());
    for (size_t i = 0; i < sample.xs.size(); ++i) {
        EXPECT_DOUBLE_EQ(surface.neckline[i].x, sample.xs[i]);
        EXPECT_DOUBLE_EQ(surface.beardline[i].x, sample.xs[i]);
        EXPECT_NEAR(surface.neckline[i].z, -0.05, 1e-12);
    }
    EXPECT_EQ(surface.triangles.size(),
              surface.lip_triangle_count + surface.beard_strip_count + surface.neck_strip_count);
}
