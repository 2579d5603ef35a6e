#include "native_kernel.hpp"
#include "open3d_cleanup.hpp"
#include "primitives.hpp"
#include "stl_writer.hpp"
#include "tess_triangulator.hpp"
#include <common/errors.hpp>
#include "logging.hpp"
#include <stdexcept>
#include <string>

namespace beardmold {

Solid NativeKernel::build_solid(const IndexedMesh& mesh) {
    if (mesh.empty()) {
        throw KernelOperationError("build_solid", "mesh has no faces");
    }
    return Solid(mesh);
}

Solid NativeKernel::make_box(const Vec3& min, const Vec3& max) {
    return build_solid(primitives::box(min, max));
}

Solid NativeKernel::make_cylinder(const Vec3& center, double radius, double height,
                                  int segments) {
    if (radius <= 0.0 || height <= 0.0) {
        throw KernelOperationError("make_cylinder", "radius and height must be positive");
    }
    try {
        return build_solid(primitives::cylinder(center, radius, height, segments));
    } catch (const std::invalid_argument& e) {
        throw KernelOperationError("make_cylinder", e.what());
    }
}

size_t NativeKernel::merge_by_distance(Solid& solid, double tolerance) {
    IndexedMesh mesh = solid.mesh();
    size_t removed = cleanup::merge_close_vertices(mesh, tolerance);
    if (mesh.empty()) {
        throw KernelOperationError("merge_by_distance",
                                   "every face collapsed at tolerance " + std::to_string(tolerance));
    }
    solid.replace(std::move(mesh));
    return removed;
}

size_t NativeKernel::fill_holes(Solid& solid, size_t max_sides) {
    IndexedMesh mesh = solid.mesh();
    size_t capped = 0;

    for (const auto& loop : mesh.boundary_loops()) {
        if (max_sides != 0 && loop.size() > max_sides) {
            continue;
        }

        // The cap runs against the boundary direction
        std::vector<VertexId> cap(loop.rbegin(), loop.rend());
        Polyline polygon;
        polygon.reserve(cap.size());
        for (VertexId v : cap) {
            polygon.push_back(mesh.vertices()[v]);
        }

        for (const auto& tri : triangulate_polygon(polygon)) {
            mesh.add_face(cap[tri[0]], cap[tri[1]], cap[tri[2]]);
        }
        ++capped;
    }

    solid.replace(std::move(mesh));
    return capped;
}

size_t NativeKernel::recalculate_normals(Solid& solid) {
    IndexedMesh mesh = solid.mesh();
    size_t flipped = cleanup::orient_outward(mesh);
    solid.replace(std::move(mesh));
    return flipped;
}

std::vector<Face> NativeKernel::triangulate_polygon(const Polyline& polygon) {
    return triangulation::tessellate(polygon);
}

void NativeKernel::apply_boolean(Solid&, const Solid&, BooleanOp op) {
    throw KernelOperationError(std::string("boolean ") + to_string(op),
                               "boolean kernel not available - rebuild with manifold");
}

void NativeKernel::voxel_remesh(Solid&, double) {
    throw KernelOperationError("voxel_remesh", "remesh kernel not available - rebuild with manifold");
}

void NativeKernel::export_stl(const Solid& solid, const std::string& path, double scale) {
    auto log = beardmold::logging::get_logger();
    try {
        write_binary_stl(solid.mesh(), path, scale);
    } catch (const std::runtime_error& e) {
        throw KernelOperationError("export_stl", e.what());
    }
    log->debug("NativeKernel: wrote {} facets to {} (scale={})",
               solid.triangle_count(), path, scale);
}

}  // namespace beardmold
