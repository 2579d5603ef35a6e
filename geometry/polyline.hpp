#ifndef BEARDMOLD_GEOMETRY_POLYLINE_HPP
#define BEARDMOLD_GEOMETRY_POLYLINE_HPP

#include <math/vec3.hpp>
#include <utility>
#include <vector>

namespace beardmold {

// Laplacian smoothing of an open polyline.
// Each pass replaces every interior point with the mean of itself and its two
// neighbours; the endpoints never move. Zero passes returns the input as is.
// Throws InvalidInputError for fewer than 3 points when passes > 0.
Polyline smooth(const Polyline& polyline, int passes);

// Squared magnitude of (b - a) x (c - a). Only meant for degeneracy tests.
double squared_triangle_area(const Point3& a, const Point3& b, const Point3& c);

// One point per target X, interpolated along a copy of the polyline sorted by X.
// Targets outside the X range return the nearest endpoint unchanged.
// Points sharing an X keep their input order (stable sort), which may still
// reorder near-coincident points of a contour that doubles back.
// Throws InvalidInputError for an empty polyline.
Polyline resample_by_axis(const Polyline& polyline, const std::vector<double>& target_xs);

// Minimum and maximum X over a non-empty polyline
std::pair<double, double> x_range(const Polyline& polyline);

}  // namespace beardmold

#endif // BEARDMOLD_GEOMETRY_POLYLINE_HPP
