#include "solidifier.hpp"
#include <common/errors.hpp>
#include "logging.hpp"

namespace beardmold {

IndexedMesh Solidifier::solidify(const TriangleList& surface, double depth,
                                 SolidifyReport* report) {
    return solidify(IndexedMesh::from_triangles(surface), depth, report);
}

IndexedMesh Solidifier::solidify(const IndexedMesh& sheet, double depth,
                                 SolidifyReport* report) {
    if (sheet.empty()) {
        throw InvalidInputError("surface to solidify has no triangles");
    }

    auto log = beardmold::logging::get_logger();

    // A vertex shared by two fans would get four side faces on its
    // front-to-back edge
    IndexedMesh surface = sheet;
    const size_t split = surface.split_non_manifold_vertices();
    if (split > 0) {
        log->debug("Solidifier: split {} pinched vertices", split);
    }

    const std::vector<BoundaryEdge> boundary = surface.boundary_edges();
    const VertexId n = static_cast<VertexId>(surface.vertex_count());
    const Vec3 offset{0.0, 0.0, depth};

    IndexedMesh solid;
    for (const auto& p : surface.vertices()) {
        solid.add_vertex(p);
    }
    for (const auto& p : surface.vertices()) {
        solid.add_vertex(p + offset);
    }

    // Front
    for (const auto& f : surface.faces()) {
        solid.add_face(f[0], f[1], f[2]);
    }

    // Back, reverse-wound
    for (const auto& f : surface.faces()) {
        solid.add_face(f[0] + n, f[2] + n, f[1] + n);
    }

    // Side walls joining the front and back boundary loops
    size_t side_faces = 0;
    for (const auto& e : boundary) {
        VertexId a = e.from;
        VertexId b = e.to;
        VertexId a_back = a + n;
        VertexId b_back = b + n;
        if (solid.add_face(b, a, a_back)) ++side_faces;
        if (solid.add_face(b, a_back, b_back)) ++side_faces;
    }

    log->debug("Solidifier: {} front faces, {} boundary edges, depth={:.5f} -> {} faces",
               surface.face_count(), boundary.size(), depth, solid.face_count());

    if (report) {
        report->front_faces = surface.face_count();
        report->boundary_edges = boundary.size();
        report->side_faces = side_faces;
        report->split_vertices = split;
    }

    return solid;
}

}  // namespace beardmold
