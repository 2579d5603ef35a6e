#ifndef BEARDMOLD_KERNEL_NATIVE_KERNEL_HPP
#define BEARDMOLD_KERNEL_NATIVE_KERNEL_HPP

#include "mesh_kernel.hpp"

namespace beardmold {

// Base kernel: solids, cutter primitives and STL export in process; vertex
// merging and orientation through Open3D; polygon triangulation (and so hole
// capping) through libtess2. A request whose library is not compiled in
// throws KernelOperationError, as do booleans and remeshing.
class NativeKernel : public MeshKernel {
public:
    std::string name() const override { return "native"; }

    Solid build_solid(const IndexedMesh& mesh) override;
    Solid make_box(const Vec3& min, const Vec3& max) override;
    Solid make_cylinder(const Vec3& center, double radius, double height,
                        int segments) override;

    size_t merge_by_distance(Solid& solid, double tolerance) override;
    size_t fill_holes(Solid& solid, size_t max_sides) override;
    size_t recalculate_normals(Solid& solid) override;
    std::vector<Face> triangulate_polygon(const Polyline& polygon) override;

    void apply_boolean(Solid& target, const Solid& cutter, BooleanOp op) override;
    void voxel_remesh(Solid& solid, double voxel_size) override;

    void export_stl(const Solid& solid, const std::string& path, double scale) override;
};

}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_NATIVE_KERNEL_HPP
