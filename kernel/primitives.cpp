#include "primitives.hpp"
#include <cmath>
#include <numbers>
#include <stdexcept>

namespace beardmold {
namespace primitives {

IndexedMesh box(const Vec3& min, const Vec3& max) {
    IndexedMesh mesh;

    // Corner i has bit 0 = +X, bit 1 = +Y, bit 2 = +Z
    for (int i = 0; i < 8; ++i) {
        mesh.add_vertex({
            (i & 1) ? max.x : min.x,
            (i & 2) ? max.y : min.y,
            (i & 4) ? max.z : min.z
        });
    }

    static const int faces[12][3] = {
        {0, 2, 3}, {0, 3, 1},   // -Z
        {4, 5, 7}, {4, 7, 6},   // +Z
        {0, 1, 5}, {0, 5, 4},   // -Y
        {2, 6, 7}, {2, 7, 3},   // +Y
        {0, 4, 6}, {0, 6, 2},   // -X
        {1, 3, 7}, {1, 7, 5}    // +X
    };
    for (const auto& f : faces) {
        mesh.add_face(f[0], f[1], f[2]);
    }
    return mesh;
}

IndexedMesh cylinder(const Vec3& center, double radius, double height, int segments) {
    if (segments < 3) {
        throw std::invalid_argument("cylinder needs at least 3 segments");
    }

    IndexedMesh mesh;
    const double half = 0.5 * height;
    const VertexId n = static_cast<VertexId>(segments);

    // Bottom ring [0, n), top ring [n, 2n), then the two cap centers
    for (int ring = 0; ring < 2; ++ring) {
        double z = ring == 0 ? -half : half;
        for (int k = 0; k < segments; ++k) {
            double theta = 2.0 * std::numbers::pi * k / segments;
            mesh.add_vertex(center + Vec3{radius * std::cos(theta), radius * std::sin(theta), z});
        }
    }
    VertexId bottom_center = mesh.add_vertex(center + Vec3{0.0, 0.0, -half});
    VertexId top_center = mesh.add_vertex(center + Vec3{0.0, 0.0, half});

    for (VertexId k = 0; k < n; ++k) {
        VertexId next = (k + 1) % n;
        VertexId b0 = k, b1 = next;
        VertexId t0 = k + n, t1 = next + n;

        mesh.add_face(b0, b1, t1);
        mesh.add_face(b0, t1, t0);
        mesh.add_face(top_center, t0, t1);
        mesh.add_face(bottom_center, b1, b0);
    }
    return mesh;
}

}  // namespace primitives
}  // namespace beardmold
