#ifndef BEARDMOLD_MESH_INDEXED_MESH_HPP
#define BEARDMOLD_MESH_INDEXED_MESH_HPP

#include <math/vec3.hpp>
#include <geometry/triangle_list.hpp>
#include <array>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace beardmold {

using VertexId = uint32_t;
using Face = std::array<VertexId, 3>;

// Vertex positions are deduplicated on coordinates rounded to this step
constexpr double VERTEX_WELD_STEP = 1e-6;

// Undirected edge key, smaller index first
using EdgeKey = std::pair<VertexId, VertexId>;

inline EdgeKey make_edge_key(VertexId a, VertexId b) {
    return a < b ? EdgeKey{a, b} : EdgeKey{b, a};
}

// Edge bordering exactly one face, directed as it runs in that face
struct BoundaryEdge {
    VertexId from = 0;
    VertexId to = 0;
};

struct BoundingBox {
    Vec3 min;
    Vec3 max;
    bool valid = false;

    Vec3 size() const { return valid ? max - min : vec3::zero(); }

    void expand(const Vec3& p) {
        if (!valid) {
            min = p;
            max = p;
            valid = true;
        } else {
            min = component_min(min, p);
            max = component_max(max, p);
        }
    }
};

// Shared-vertex triangle mesh; the canonical form handed to the mesh kernel.
// Every face references three distinct vertices.
class IndexedMesh {
public:
    IndexedMesh() = default;

    // Weld a triangle soup on VERTEX_WELD_STEP and drop faces that collapse
    static IndexedMesh from_triangles(const TriangleList& triangles);

    // Append a vertex without welding
    VertexId add_vertex(const Point3& p);

    // Returns false for a face with repeated indices.
    // Throws std::out_of_range for an index past the vertex array.
    bool add_face(VertexId a, VertexId b, VertexId c);

    // Append all vertices and faces of another mesh
    void append(const IndexedMesh& other);

    const std::vector<Point3>& vertices() const { return vertices_; }
    std::vector<Point3>& vertices() { return vertices_; }
    const std::vector<Face>& faces() const { return faces_; }
    std::vector<Face>& faces() { return faces_; }

    size_t vertex_count() const { return vertices_.size(); }
    size_t face_count() const { return faces_.size(); }
    bool empty() const { return faces_.empty(); }

    // Number of faces incident to every undirected edge
    std::map<EdgeKey, int> edge_incidence() const;

    std::vector<BoundaryEdge> boundary_edges() const;

    // Closed vertex chains made of boundary edges, in boundary direction
    std::vector<std::vector<VertexId>> boundary_loops() const;

    // Edges whose incidence is not exactly two
    size_t non_manifold_edge_count() const;

    // Every edge shared by exactly two faces
    bool is_closed() const;

    BoundingBox bounding_box() const;

    // Divergence-theorem volume; positive for an outward-wound closed mesh
    double signed_volume() const;

    // Give every face fan after the first around a vertex its own copy of
    // that vertex, so sheets touching at a single point come apart there.
    // Fans are faces joined through an edge at the vertex. Returns vertices added.
    size_t split_non_manifold_vertices();

    // Drop vertices no face references, remapping indices
    void remove_unreferenced_vertices();

    // Reverse the winding of every face
    void flip();

    TriangleList to_triangles() const;

private:
    std::vector<Point3> vertices_;
    std::vector<Face> faces_;
};

}  // namespace beardmold

#endif // BEARDMOLD_MESH_INDEXED_MESH_HPP
