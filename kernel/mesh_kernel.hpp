#ifndef BEARDMOLD_KERNEL_MESH_KERNEL_HPP
#define BEARDMOLD_KERNEL_MESH_KERNEL_HPP

#include "solid.hpp"
#include <math/vec3.hpp>
#include <mesh/indexed_mesh.hpp>
#include <memory>
#include <string>
#include <vector>

namespace beardmold {

enum class BooleanOp {
    Union,
    Difference
};

inline const char* to_string(BooleanOp op) {
    return op == BooleanOp::Union ? "union" : "difference";
}

// Mesh-processing capability the pipeline delegates to.
// Every operation either succeeds or throws KernelOperationError, and each may
// fail independently of the others.
class MeshKernel {
public:
    virtual ~MeshKernel() = default;

    virtual std::string name() const = 0;

    // Solid from an indexed mesh; vertices are welded as given
    virtual Solid build_solid(const IndexedMesh& mesh) = 0;

    // Axis-aligned box cutter
    virtual Solid make_box(const Vec3& min, const Vec3& max) = 0;

    // Z-aligned cylinder cutter centered on `center`
    virtual Solid make_cylinder(const Vec3& center, double radius, double height,
                                int segments) = 0;

    // Collapse vertices closer than `tolerance`; returns vertices removed
    virtual size_t merge_by_distance(Solid& solid, double tolerance) = 0;

    // Cap boundary loops of at most `max_sides` vertices (0 = any size);
    // returns loops capped
    virtual size_t fill_holes(Solid& solid, size_t max_sides) = 0;

    // Make face winding consistent and outward; returns faces flipped
    virtual size_t recalculate_normals(Solid& solid) = 0;

    // Triangles (indices into `polygon`) covering a simple 3D polygon,
    // wound the same way as the polygon
    virtual std::vector<Face> triangulate_polygon(const Polyline& polygon) = 0;

    // target = target (op) cutter
    virtual void apply_boolean(Solid& target, const Solid& cutter, BooleanOp op) = 0;

    // Rebuild the surface at a uniform resolution
    virtual void voxel_remesh(Solid& solid, double voxel_size) = 0;

    // Binary STL with every coordinate multiplied by `scale`
    virtual void export_stl(const Solid& solid, const std::string& path, double scale) = 0;
};

// "native", "manifold" or "auto" (manifold when compiled in, else native).
// Throws std::invalid_argument for an unknown name.
std::unique_ptr<MeshKernel> create_kernel(const std::string& name);

// True when a kernel with boolean and remesh support is compiled in
bool boolean_kernel_available();

}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_MESH_KERNEL_HPP
