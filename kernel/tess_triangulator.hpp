#ifndef BEARDMOLD_KERNEL_TESS_TRIANGULATOR_HPP
#define BEARDMOLD_KERNEL_TESS_TRIANGULATOR_HPP

#include <geometry/polyline.hpp>
#include <mesh/indexed_mesh.hpp>
#include <vector>

namespace beardmold {
namespace triangulation {

// libtess2 triangulation of a simple 3D polygon (odd winding rule).
// Output triangles index into `polygon` and keep its winding. Fewer than three
// corners give no triangles. Throws KernelOperationError when tessellation
// fails or would need vertices the polygon does not have.
std::vector<Face> tessellate(const Polyline& polygon);

}  // namespace triangulation
}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_TESS_TRIANGULATOR_HPP
