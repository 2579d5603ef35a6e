#ifndef BEARDMOLD_KERNEL_SOLID_HPP
#define BEARDMOLD_KERNEL_SOLID_HPP

#include <mesh/indexed_mesh.hpp>
#include <utility>

namespace beardmold {

// Watertight mesh owned by one pipeline run and edited in place by kernel
// requests. Callers outside the kernel read positions, counts and extent only.
class Solid {
public:
    Solid() = default;
    explicit Solid(IndexedMesh mesh) : mesh_(std::move(mesh)) {}

    const IndexedMesh& mesh() const { return mesh_; }

    // Swap in a kernel result
    void replace(IndexedMesh mesh) { mesh_ = std::move(mesh); }

    const std::vector<Point3>& positions() const { return mesh_.vertices(); }
    size_t vertex_count() const { return mesh_.vertex_count(); }
    size_t triangle_count() const { return mesh_.face_count(); }
    bool empty() const { return mesh_.empty(); }

    BoundingBox bounding_box() const { return mesh_.bounding_box(); }

private:
    IndexedMesh mesh_;
};

}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_SOLID_HPP
