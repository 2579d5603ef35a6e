#ifndef BEARDMOLD_SERIALIZATION_CONFIG_JSON_HPP
#define BEARDMOLD_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <mold/mold_parameters.hpp>
#include <stdexcept>

namespace beardmold {

// Vec3 serialization: written as [x, y, z]; read from either [x, y, z] or
// {"x": .., "y": .., "z": ..}
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    if (j.is_array()) {
        if (j.size() != 3) {
            throw std::invalid_argument("point array must have 3 elements");
        }
        v.x = j[0].get<double>();
        v.y = j[1].get<double>();
        v.z = j[2].get<double>();
    } else {
        v.x = j.at("x").get<double>();
        v.y = j.at("y").get<double>();
        v.z = j.at("z").get<double>();
    }
}

// MoldParameters serialization, camelCase keys
inline void to_json(nlohmann::json& j, const MoldParameters& p) {
    j = {
        {"lipSegments", p.lip_segments},
        {"arcSteps", p.arc_steps},
        {"minLipRadius", p.min_lip_radius},
        {"maxLipRadius", p.max_lip_radius},
        {"taperMult", p.taper_mult},
        {"profileBias", p.profile_bias},
        {"prelift", p.prelift},
        {"smoothPasses", p.smooth_passes},
        {"necklineSmoothPasses", p.neckline_smooth_passes},
        {"extrudeDepth", p.extrude_depth},
        {"anchorRibs", p.anchor_ribs},
        {"ribCount", p.rib_count},
        {"ribWidth", p.rib_width},
        {"ribDepth", p.rib_depth},
        {"ribHeight", p.rib_height},
        {"ribDrop", p.rib_drop},
        {"holeRadius", p.hole_radius},
        {"embedOffset", p.embed_offset},
        {"holeSegments", p.hole_segments},
        {"voxelRemesh", p.voxel_remesh},
        {"mergeDistance", p.merge_distance},
        {"fillHoleSides", p.fill_hole_sides},
        {"stlUnits", p.stl_units}
    };
    if (p.stl_scale) {
        j["stlScale"] = *p.stl_scale;
    }
}

// Missing keys keep their defaults
inline void from_json(const nlohmann::json& j, MoldParameters& p) {
    const MoldParameters d;
    p.lip_segments = j.value("lipSegments", d.lip_segments);
    p.arc_steps = j.value("arcSteps", d.arc_steps);
    p.min_lip_radius = j.value("minLipRadius", d.min_lip_radius);
    p.max_lip_radius = j.value("maxLipRadius", d.max_lip_radius);
    p.taper_mult = j.value("taperMult", d.taper_mult);
    p.profile_bias = j.value("profileBias", d.profile_bias);
    p.prelift = j.value("prelift", d.prelift);
    p.smooth_passes = j.value("smoothPasses", d.smooth_passes);
    p.neckline_smooth_passes = j.value("necklineSmoothPasses", d.neckline_smooth_passes);
    p.extrude_depth = j.value("extrudeDepth", d.extrude_depth);
    p.anchor_ribs = j.value("anchorRibs", d.anchor_ribs);
    p.rib_count = j.value("ribCount", d.rib_count);
    p.rib_width = j.value("ribWidth", d.rib_width);
    p.rib_depth = j.value("ribDepth", d.rib_depth);
    p.rib_height = j.value("ribHeight", d.rib_height);
    p.rib_drop = j.value("ribDrop", d.rib_drop);
    p.hole_radius = j.value("holeRadius", d.hole_radius);
    p.embed_offset = j.value("embedOffset", d.embed_offset);
    p.hole_segments = j.value("holeSegments", d.hole_segments);
    p.voxel_remesh = j.value("voxelRemesh", d.voxel_remesh);
    p.merge_distance = j.value("mergeDistance", d.merge_distance);
    p.fill_hole_sides = j.value("fillHoleSides", d.fill_hole_sides);
    p.stl_units = j.value("stlUnits", d.stl_units);
    if (j.contains("stlScale") && !j["stlScale"].is_null()) {
        p.stl_scale = j["stlScale"].get<double>();
    } else {
        p.stl_scale.reset();
    }
}

}  // namespace beardmold

#endif // BEARDMOLD_SERIALIZATION_CONFIG_JSON_HPP
