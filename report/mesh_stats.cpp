#include "mesh_stats.hpp"
#include <serialization/json_serialization.hpp>
#include <serialization/stats_json.hpp>
#include "logging.hpp"

namespace beardmold {

MeshStats compute_stats(const Solid& solid, double scale, double thickness) {
    MeshStats stats;
    stats.triangles = solid.triangle_count();
    stats.vertices = solid.vertex_count();
    stats.bbox = solid.bounding_box();
    stats.dim_m = stats.bbox.size();
    stats.dim_mm = stats.dim_m * scale;
    stats.thickness_m = thickness;
    stats.non_manifold_edges = solid.mesh().non_manifold_edge_count();
    stats.stl_scale = scale;
    return stats;
}

std::string stats_path_for(const std::string& output_path) {
    return output_path + ".stats.json";
}

void write_stats(const std::string& path, const MeshStats& stats,
                 const MoldParameters& params) {
    auto log = beardmold::logging::get_logger();
    json::write_json_file(path, stats_to_json(stats, params));
    log->debug("Reporter: wrote {}", path);
}

}  // namespace beardmold
