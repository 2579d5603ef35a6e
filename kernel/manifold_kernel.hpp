#ifndef BEARDMOLD_KERNEL_MANIFOLD_KERNEL_HPP
#define BEARDMOLD_KERNEL_MANIFOLD_KERNEL_HPP

// Conversion helpers live in manifold_kernel.cpp so that <manifold/manifold.h>
// stays out of translation units that do not link the library.

#include "native_kernel.hpp"

namespace beardmold {

// Native kernel plus booleans and remeshing through the manifold library
class ManifoldKernel : public NativeKernel {
public:
    std::string name() const override { return "manifold"; }

    void apply_boolean(Solid& target, const Solid& cutter, BooleanOp op) override;

    // Simplify at a quarter voxel, then refine to edges no longer than a voxel
    void voxel_remesh(Solid& solid, double voxel_size) override;
};

}  // namespace beardmold

#endif // BEARDMOLD_KERNEL_MANIFOLD_KERNEL_HPP
