#ifndef BEARDMOLD_REPORT_MESH_STATS_HPP
#define BEARDMOLD_REPORT_MESH_STATS_HPP

#include <kernel/solid.hpp>
#include <mold/mold_parameters.hpp>
#include <math/vec3.hpp>
#include <string>

namespace beardmold {

// Size and health of the solid as it will be printed
struct MeshStats {
    size_t triangles = 0;
    size_t vertices = 0;
    BoundingBox bbox;           // Model units
    Vec3 dim_m;                 // bbox.max - bbox.min
    Vec3 dim_mm;                // dim_m * stl_scale
    double thickness_m = 0.0;
    size_t non_manifold_edges = 0;
    double stl_scale = 1.0;
};

MeshStats compute_stats(const Solid& solid, double scale, double thickness);

// "<output>.stats.json"
std::string stats_path_for(const std::string& output_path);

// Write the statistics sidecar. Throws std::runtime_error on I/O failure.
void write_stats(const std::string& path, const MeshStats& stats,
                 const MoldParameters& params);

}  // namespace beardmold

#endif // BEARDMOLD_REPORT_MESH_STATS_HPP
