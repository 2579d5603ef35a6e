#ifndef BEARDMOLD_SERIALIZATION_STATS_JSON_HPP
#define BEARDMOLD_SERIALIZATION_STATS_JSON_HPP

#include <nlohmann/json.hpp>
#include "config_json.hpp"
#include <report/mesh_stats.hpp>

namespace beardmold {

// {tris, verts, bbox_m: {min, max}, dim_m, dim_mm, thickness_m, params,
//  non_manifold_edges, stl_scale}
inline nlohmann::json stats_to_json(const MeshStats& stats, const MoldParameters& params) {
    return {
        {"tris", stats.triangles},
        {"verts", stats.vertices},
        {"bbox_m", {
            {"min", stats.bbox.min},
            {"max", stats.bbox.max}
        }},
        {"dim_m", stats.dim_m},
        {"dim_mm", stats.dim_mm},
        {"thickness_m", stats.thickness_m},
        {"params", params},
        {"non_manifold_edges", stats.non_manifold_edges},
        {"stl_scale", stats.stl_scale}
    };
}

}  // namespace beardmold

#endif // BEARDMOLD_SERIALIZATION_STATS_JSON_HPP
