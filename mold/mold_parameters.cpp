#include "mold_parameters.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cctype>

namespace beardmold {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw InvalidInputError(message);
    }
}

}  // namespace

double MoldParameters::export_scale() const {
    if (stl_scale) {
        return *stl_scale;
    }
    return lowercase(stl_units) == "mm" ? 1000.0 : 1.0;
}

void MoldParameters::validate() const {
    require(lip_segments >= 1, "lipSegments must be at least 1");
    require(arc_steps >= 1, "arcSteps must be at least 1");
    require(min_lip_radius >= 0.0, "minLipRadius must not be negative");
    require(max_lip_radius >= min_lip_radius, "maxLipRadius must not be below minLipRadius");
    require(profile_bias > 0.0, "profileBias must be positive");
    require(smooth_passes >= 0 && neckline_smooth_passes >= 0, "smoothing passes must not be negative");
    require(extrude_depth != 0.0, "extrudeDepth must not be zero");
    require(!anchor_ribs || rib_count >= 1, "ribCount must be at least 1 when anchorRibs is set");
    require(!anchor_ribs || (rib_width > 0.0 && rib_depth > 0.0 && rib_height > 0.0),
            "rib dimensions must be positive");
    require(hole_radius > 0.0, "holeRadius must be positive");
    require(hole_segments >= 3, "holeSegments must be at least 3");
    require(merge_distance >= 0.0, "mergeDistance must not be negative");
    require(fill_hole_sides >= 0, "fillHoleSides must not be negative");

    require(export_scale() > 0.0, "stlScale must be positive");
}

}  // namespace beardmold
