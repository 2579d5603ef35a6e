#ifndef BEARDMOLD_MOLD_MOLD_PARAMETERS_HPP
#define BEARDMOLD_MOLD_MOLD_PARAMETERS_HPP

#include <cmath>
#include <optional>
#include <string>

namespace beardmold {

// Knobs for one mold build. Lengths are in model units (meters).
struct MoldParameters {
    // Lip loft
    int lip_segments = 64;            // Base-point intervals along X
    int arc_steps = 10;               // Subdivisions of the lip half-loop
    double min_lip_radius = 0.002;    // Radius at the taper ends
    double max_lip_radius = 0.006;    // Radius at the center of the X range
    double taper_mult = 12.0;         // Taper falloff per unit distance from center
    double profile_bias = 1.0;        // >1 delays the curl's departure from the base point
    double prelift = 0.0;             // Z lift applied to every ring point

    // Contour cleanup
    int smooth_passes = 2;
    int neckline_smooth_passes = 3;

    // Solid
    double extrude_depth = 0.003;     // Shell thickness; the back copy sits at -extrude_depth in Z

    // Anchor ribs
    bool anchor_ribs = false;
    int rib_count = 6;
    double rib_width = 0.002;         // X
    double rib_depth = 0.004;         // Y
    double rib_height = 0.003;        // Z
    double rib_drop = 0.001;          // Gap between solid top and rib top

    // Holes
    double hole_radius = 0.0015875;   // 1/16 inch
    double embed_offset = 0.0025;
    int hole_segments = 32;

    // Kernel cleanup
    double voxel_remesh = 0.0006;     // <= 0 disables the remesh stage
    double merge_distance = 1e-6;
    int fill_hole_sides = 0;          // 0 = cap every boundary loop

    // Export
    std::string stl_units = "mm";
    std::optional<double> stl_scale;  // Overrides stl_units when set

    // Derived properties
    int base_point_count() const {
        return lip_segments + 1;
    }

    double thickness() const {
        return std::abs(extrude_depth);
    }

    // Signed offset of the solid's back face along Z
    double solidify_depth() const {
        return -extrude_depth;
    }

    bool remesh_enabled() const {
        return voxel_remesh > 0.0;
    }

    // Meters to millimeters unless told otherwise
    double export_scale() const;

    // Throws InvalidInputError on the first out-of-range field
    void validate() const;
};

}  // namespace beardmold

#endif // BEARDMOLD_MOLD_MOLD_PARAMETERS_HPP
