#ifndef BEARDMOLD_CONTOUR_CONTOUR_SAMPLER_HPP
#define BEARDMOLD_CONTOUR_CONTOUR_SAMPLER_HPP

#include <math/vec3.hpp>
#include <vector>

namespace beardmold {

// Base points picked along the dominant (X) axis of the beardline
struct ContourSample {
    Polyline points;          // One beardline point per target X
    std::vector<double> xs;   // Evenly spaced target X values
    double min_x = 0.0;
    double max_x = 0.0;

    double center_x() const { return 0.5 * (min_x + max_x); }
};

// Split the beardline's X range into `count` evenly spaced targets and pick,
// for each, the beardline point with the closest X (first one wins a tie).
// A single target sits at min_x. Throws InvalidInputError for an empty beardline.
ContourSample sample_base_points(const Polyline& beardline, size_t count);

}  // namespace beardmold

#endif // BEARDMOLD_CONTOUR_CONTOUR_SAMPLER_HPP
