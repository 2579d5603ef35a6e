#ifndef BEARDMOLD_KERNEL_OPEN3D_CLEANUP_HPP
#define BEARDMOLD_KERNEL_OPEN3D_CLEANUP_HPP

// <open3d/...> stays in open3d_cleanup.cpp so only the core library needs
// Open3D on its include path.

#include <mesh/indexed_mesh.hpp>

namespace beardmold {
namespace cleanup {

// Open3D MergeCloseVertices, then drop degenerate faces and unused vertices.
// Returns vertices removed.
size_t merge_close_vertices(IndexedMesh& mesh, double tolerance);

// Open3D OrientTriangles, then turn every connected patch with negative
// signed volume inside out. Returns faces whose winding changed.
// Throws KernelOperationError for a mesh Open3D cannot orient.
size_t orient_outward(IndexedMesh& mesh);

}  // namespace cleanup
}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_OPEN3D_CLEANUP_HPP
