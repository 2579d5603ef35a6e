#include "open3d_cleanup.hpp"
#include <common/errors.hpp>
#include "logging.hpp"

#ifdef BEARDMOLD_HAS_OPEN3D

#include <open3d/geometry/TriangleMesh.h>
#include <tuple>
#include <utility>
#include <vector>

namespace beardmold {
namespace cleanup {

namespace {

open3d::geometry::TriangleMesh to_open3d(const IndexedMesh& mesh) {
    open3d::geometry::TriangleMesh o3d;
    o3d.vertices_.reserve(mesh.vertex_count());
    for (const auto& p : mesh.vertices()) {
        o3d.vertices_.emplace_back(p.x, p.y, p.z);
    }
    o3d.triangles_.reserve(mesh.face_count());
    for (const auto& f : mesh.faces()) {
        o3d.triangles_.emplace_back(static_cast<int>(f[0]), static_cast<int>(f[1]),
                                    static_cast<int>(f[2]));
    }
    return o3d;
}

IndexedMesh from_open3d(const open3d::geometry::TriangleMesh& o3d) {
    IndexedMesh mesh;
    for (const auto& v : o3d.vertices_) {
        mesh.add_vertex({v(0), v(1), v(2)});
    }
    for (const auto& t : o3d.triangles_) {
        mesh.add_face(static_cast<VertexId>(t(0)), static_cast<VertexId>(t(1)),
                      static_cast<VertexId>(t(2)));
    }
    return mesh;
}

// Same corners in the same cyclic order
bool same_winding(const Face& a, const Face& b) {
    for (size_t shift = 0; shift < 3; ++shift) {
        if (a[0] == b[shift] && a[1] == b[(shift + 1) % 3] && a[2] == b[(shift + 2) % 3]) {
            return true;
        }
    }
    return false;
}

}  // namespace

size_t merge_close_vertices(IndexedMesh& mesh, double tolerance) {
    open3d::geometry::TriangleMesh o3d = to_open3d(mesh);
    const size_t before = o3d.vertices_.size();

    o3d.MergeCloseVertices(tolerance);
    o3d.RemoveDegenerateTriangles();
    o3d.RemoveUnreferencedVertices();

    mesh = from_open3d(o3d);
    return before > mesh.vertex_count() ? before - mesh.vertex_count() : 0;
}

size_t orient_outward(IndexedMesh& mesh) {
    open3d::geometry::TriangleMesh o3d = to_open3d(mesh);
    if (!o3d.OrientTriangles()) {
        throw KernelOperationError("recalculate_normals",
                                   "Open3D could not orient the mesh (non-manifold or non-orientable)");
    }

    // Signed volume per edge-connected patch
    const std::vector<int> patch_of = std::get<0>(o3d.ClusterConnectedTriangles());
    std::vector<double> volume;
    for (size_t t = 0; t < o3d.triangles_.size(); ++t) {
        const size_t patch = static_cast<size_t>(patch_of[t]);
        if (patch >= volume.size()) {
            volume.resize(patch + 1, 0.0);
        }
        const Eigen::Vector3i& tri = o3d.triangles_[t];
        volume[patch] += o3d.vertices_[tri(0)].dot(
            o3d.vertices_[tri(1)].cross(o3d.vertices_[tri(2)]));
    }

    size_t changed = 0;
    for (size_t t = 0; t < o3d.triangles_.size(); ++t) {
        Eigen::Vector3i tri = o3d.triangles_[t];
        if (volume[static_cast<size_t>(patch_of[t])] < 0.0) {
            std::swap(tri(1), tri(2));
        }
        Face oriented{static_cast<VertexId>(tri(0)), static_cast<VertexId>(tri(1)),
                      static_cast<VertexId>(tri(2))};
        if (!same_winding(mesh.faces()[t], oriented)) {
            ++changed;
        }
        mesh.faces()[t] = oriented;
    }
    return changed;
}

}  // namespace cleanup
}  // namespace beardmold

#else  // BEARDMOLD_HAS_OPEN3D not defined

namespace beardmold {
namespace cleanup {

size_t merge_close_vertices(IndexedMesh&, double) {
    auto log = beardmold::logging::get_logger();
    log->debug("Open3D not available - compile with Open3D for vertex merging");
    throw KernelOperationError("merge_by_distance", "Open3D not available - rebuild with Open3D");
}

size_t orient_outward(IndexedMesh&) {
    auto log = beardmold::logging::get_logger();
    log->debug("Open3D not available - compile with Open3D for face orientation");
    throw KernelOperationError("recalculate_normals", "Open3D not available - rebuild with Open3D");
}

}  // namespace cleanup
}  // namespace beardmold

#endif  // BEARDMOLD_HAS_OPEN3D
