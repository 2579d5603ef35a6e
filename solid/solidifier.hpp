#ifndef BEARDMOLD_SOLID_SOLIDIFIER_HPP
#define BEARDMOLD_SOLID_SOLIDIFIER_HPP

#include <geometry/triangle_list.hpp>
#include <mesh/indexed_mesh.hpp>

namespace beardmold {

// Counts describing one extrusion, for logging and tests
struct SolidifyReport {
    size_t front_faces = 0;
    size_t boundary_edges = 0;
    size_t side_faces = 0;
    size_t split_vertices = 0;
};

// Extrude an open, outward-facing surface along Z into a closed shell
class Solidifier {
public:
    // Front faces as given; back copy offset by (0, 0, depth) with reversed
    // winding (back vertex = front vertex + n); one quad per boundary edge
    // a -> b made of (b, a, a') and (b, a', b').
    // Vertices where separate face fans touch are split first, so each fan
    // gets its own side wall. The result is closed when the boundary edges
    // form closed loops; this is not checked.
    // Throws InvalidInputError for a surface with no faces.
    static IndexedMesh solidify(const TriangleList& surface, double depth,
                                SolidifyReport* report = nullptr);

    static IndexedMesh solidify(const IndexedMesh& surface, double depth,
                                SolidifyReport* report = nullptr);
};

}  // namespace beardmold

#endif // BEARDMOLD_SOLID_SOLIDIFIER_HPP
