#ifndef BEARDMOLD_LOFT_STITCHER_HPP
#define BEARDMOLD_LOFT_STITCHER_HPP

#include "lip_loft.hpp"
#include <math/vec3.hpp>
#include <geometry/triangle_list.hpp>
#include <vector>

namespace beardmold {

// Open surface chaining the lip, the beardline and (optionally) the neckline
struct StitchedSurface {
    TriangleList triangles;     // Lip triangles followed by both strips
    Polyline beardline;         // Beardline resampled at the base-point Xs
    Polyline neckline;          // Empty when the payload had none
    size_t lip_triangle_count = 0;
    size_t beard_strip_count = 0;
    size_t neck_strip_count = 0;
};

// Triangle strip between two equal-length sequences:
// (A[i], B[i], A[i+1]) and (A[i+1], B[i], B[i+1]) for each i.
// Throws std::invalid_argument when the lengths differ.
TriangleList stitch_strip(const Polyline& a, const Polyline& b);

// Resample the contours at `xs` and strip lip -> beardline -> neckline
StitchedSurface stitch_contours(const LipLoft& loft,
                                const Polyline& beardline,
                                const Polyline& neckline,
                                const std::vector<double>& xs);

}  // namespace beardmold

#endif // BEARDMOLD_LOFT_STITCHER_HPP
