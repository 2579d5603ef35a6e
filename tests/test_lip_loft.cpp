#include <gtest/gtest.h>
#include "lip_loft.hpp"
#include "contour_sampler.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <numbers>

using namespace beardmold;

class LipLoftTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.lip_segments = 8;
        params.arc_steps = 4;
        beardline = test::straight_line({-0.05, 0.01, 0.0}, {0.05, 0.01, 0.0}, 11);
        sample = sample_base_points(beardline, params.base_point_count());
    }

    MoldParameters params;
    Polyline beardline;
    ContourSample sample;
};

TEST_F(LipLoftTest, TaperPeaksAtCenter) {
    EXPECT_DOUBLE_EQ(taper_radius(0.0, 0.0, params), params.max_lip_radius);
    // 1 / taper_mult away the taper has fully fallen off
    EXPECT_NEAR(taper_radius(1.0 / params.taper_mult, 0.0, params), params.min_lip_radius, 1e-12);
    EXPECT_DOUBLE_EQ(taper_radius(-1.0, 0.0, params), params.min_lip_radius);

    double half = taper_radius(0.5 / params.taper_mult, 0.0, params);
    EXPECT_NEAR(half, 0.5 * (params.min_lip_radius + params.max_lip_radius), 1e-12);
}

TEST_F(LipLoftTest, RingFollowsHalfLoop) {
    const Point3 base{0.0, 0.0, 0.0};
    const double r = 0.004;
    Polyline ring = lip_ring(base, r, params);
    ASSERT_EQ(ring.size(), 5u);

    // Start: one radius back and up; middle: the base point; end: back and down
    EXPECT_NEAR(ring.front().y, -r, 1e-12);
    EXPECT_NEAR(ring.front().z, r, 1e-12);
    EXPECT_NEAR(ring[2].y, 0.0, 1e-12);
    EXPECT_NEAR(ring[2].z, 0.0, 1e-12);
    EXPECT_NEAR(ring.back().y, -r, 1e-12);
    EXPECT_NEAR(ring.back().z, -r, 1e-12);
    for (const auto& p : ring) {
        EXPECT_DOUBLE_EQ(p.x, base.x);
    }
}

TEST_F(LipLoftTest, PreliftRaisesEveryPoint) {
    params.prelift = 0.001;
    Polyline lifted = lip_ring({0.0, 0.0, 0.0}, 0.004, params);
    params.prelift = 0.0;
    Polyline flat = lip_ring({0.0, 0.0, 0.0}, 0.004, params);
    for (size_t j = 0; j < flat.size(); ++j) {
        EXPECT_NEAR(lifted[j].z - flat[j].z, 0.001, 1e-12);
    }
}

TEST_F(LipLoftTest, ProfileBiasWarpsAngle) {
    params.profile_bias = 2.0;
    Polyline ring = lip_ring({0.0, 0.0, 0.0}, 0.004, params);
    // j/arc_steps = 0.5 -> angle pi/4 instead of pi/2
    EXPECT_NEAR(ring[2].z, 0.004 * std::cos(std::numbers::pi / 4.0), 1e-12);
}

TEST_F(LipLoftTest, GridShapeAndTriangleCount) {
    LipLoft loft = LipLoft::from_sample(sample, params);
    ASSERT_EQ(loft.rings().size(), 9u);
    for (const auto& ring : loft.rings()) {
        EXPECT_EQ(ring.size(), 5u);
    }
    EXPECT_EQ(loft.triangles().size(), 8u * 4u * 2u);
    EXPECT_EQ(loft.triangles().dropped(), 0u);
}

TEST_F(LipLoftTest, QuadSplitOrder) {
    LipLoft loft = LipLoft::from_sample(sample, params);
    const auto& rings = loft.rings();
    const Triangle& first = loft.triangles()[0];
    const Triangle& second = loft.triangles()[1];
    EXPECT_EQ(first[0], rings[0][0]);
    EXPECT_EQ(first[1], rings[0][1]);
    EXPECT_EQ(first[2], rings[1][0]);
    EXPECT_EQ(second[0], rings[1][0]);
    EXPECT_EQ(second[1], rings[0][1]);
    EXPECT_EQ(second[2], rings[1][1]);
}

TEST_F(LipLoftTest, FirstColumnAndBand) {
    LipLoft loft = LipLoft::from_sample(sample, params);
    Polyline column = loft.first_column();
    ASSERT_EQ(column.size(), loft.rings().size());
    for (size_t i = 0; i < column.size(); ++i) {
        EXPECT_EQ(column[i], loft.rings()[i][0]);
    }
    EXPECT_NEAR(loft.lip_band_y(), 0.01 - 0.5 * params.max_lip_radius, 1e-12);
}
