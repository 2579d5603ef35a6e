#ifndef BEARDMOLD_KERNEL_PRIMITIVES_HPP
#define BEARDMOLD_KERNEL_PRIMITIVES_HPP

#include <math/vec3.hpp>
#include <mesh/indexed_mesh.hpp>

namespace beardmold {
namespace primitives {

// Closed, outward-wound meshes for parametric cutters

IndexedMesh box(const Vec3& min, const Vec3& max);

// Z-aligned, centered on `center`, `segments` facets around
IndexedMesh cylinder(const Vec3& center, double radius, double height, int segments);

}  // namespace primitives
}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_PRIMITIVES_HPP
