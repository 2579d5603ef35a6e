#ifndef BEARDMOLD_LOFT_LIP_LOFT_HPP
#define BEARDMOLD_LOFT_LIP_LOFT_HPP

#include <math/vec3.hpp>
#include <geometry/triangle_list.hpp>
#include <contour/contour_sampler.hpp>
#include <mold/mold_parameters.hpp>
#include <vector>

namespace beardmold {

// Tapered half-loop flange swept along the sampled base points
class LipLoft {
public:
    // Build one ring per base point and join neighbouring rings into quads
    static LipLoft from_sample(const ContourSample& sample, const MoldParameters& params);

    // rings()[i][j]: ring position j (0..arc_steps) of base point i
    const std::vector<Polyline>& rings() const { return rings_; }

    const TriangleList& triangles() const { return triangles_; }

    // Ring position 0 of every base point, left to right
    Polyline first_column() const;

    // Y band along which anchor ribs are placed
    double lip_band_y() const { return lip_band_y_; }

private:
    std::vector<Polyline> rings_;
    TriangleList triangles_;
    double lip_band_y_ = 0.0;
};

// minR + max(0, 1 - |x - center_x| * taper_mult) * (maxR - minR)
double taper_radius(double x, double center_x, const MoldParameters& params);

// Half-loop cross-section of radius r at a base point.
// Position j sits at angle pi * (j / arc_steps)^profile_bias and is offset by
// (0, -r * (1 - sin(angle)), prelift + r * cos(angle)).
Polyline lip_ring(const Point3& base, double radius, const MoldParameters& params);

}  // namespace beardmold

#endif // BEARDMOLD_LOFT_LIP_LOFT_HPP
