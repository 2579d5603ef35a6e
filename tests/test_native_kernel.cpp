#include <gtest/gtest.h>
#include "native_kernel.hpp"
#include "primitives.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

using namespace beardmold;

class NativeKernelTest : public ::testing::Test {
protected:
    NativeKernel kernel;
};

TEST_F(NativeKernelTest, BuildSolidRejectsEmptyMesh) {
    EXPECT_THROW(kernel.build_solid(IndexedMesh{}), KernelOperationError);
}

TEST_F(NativeKernelTest, BoxCutter) {
    Solid box = kernel.make_box({-1, -1, 0}, {1, 1, 0.5});
    EXPECT_EQ(box.triangle_count(), 12u);
    EXPECT_EQ(box.vertex_count(), 8u);
    EXPECT_TRUE(box.mesh().is_closed());
    EXPECT_NEAR(box.mesh().signed_volume(), 2.0, 1e-12);
}

TEST_F(NativeKernelTest, CylinderCutterIsCentered) {
    Solid cyl = kernel.make_cylinder({1, 2, 3}, 0.5, 2.0, 24);
    EXPECT_EQ(cyl.triangle_count(), 4u * 24u);
    EXPECT_TRUE(cyl.mesh().is_closed());
    EXPECT_GT(cyl.mesh().signed_volume(), 0.0);

    BoundingBox bb = cyl.bounding_box();
    EXPECT_NEAR(bb.min.z, 2.0, 1e-12);
    EXPECT_NEAR(bb.max.z, 4.0, 1e-12);
    EXPECT_NEAR(bb.max.x, 1.5, 1e-12);
    EXPECT_NEAR(0.5 * (bb.min.y + bb.max.y), 2.0, 1e-3);
}

TEST_F(NativeKernelTest, CylinderRejectsBadDimensions) {
    EXPECT_THROW(kernel.make_cylinder({0, 0, 0}, 0.0, 1.0, 16), KernelOperationError);
    EXPECT_THROW(kernel.make_cylinder({0, 0, 0}, 1.0, -1.0, 16), KernelOperationError);
    EXPECT_THROW(kernel.make_cylinder({0, 0, 0}, 1.0, 1.0, 2), KernelOperationError);
}

TEST_F(NativeKernelTest, FillHolesRespectsSideLimit) {
    IndexedMesh open = primitives::box({0, 0, 0}, {1, 1, 1});
    open.faces().erase(open.faces().begin() + 2, open.faces().begin() + 4);
    Solid solid = kernel.build_solid(open);
    EXPECT_EQ(kernel.fill_holes(solid, 3), 0u);
    EXPECT_FALSE(solid.mesh().is_closed());
}

TEST_F(NativeKernelTest, TriangleNeedsNoTessellator) {
    auto tris = kernel.triangulate_polygon({{0, 0, 0}, {1, 0, 0}, {0, 1, 0}});
    ASSERT_EQ(tris.size(), 1u);
    EXPECT_EQ(tris[0], (Face{0, 1, 2}));
    EXPECT_TRUE(kernel.triangulate_polygon({{0, 0, 0}, {1, 0, 0}}).empty());
}

#ifndef BEARDMOLD_HAS_OPEN3D
TEST_F(NativeKernelTest, CleanupWithoutOpen3DLeavesSolidUntouched) {
    Solid box = kernel.make_box({0, 0, 0}, {1, 1, 1});
    try {
        kernel.merge_by_distance(box, 1e-6);
        FAIL() << "expected KernelOperationError";
    } catch (const KernelOperationError& e) {
        EXPECT_EQ(e.operation(), "merge_by_distance");
    }
    EXPECT_THROW(kernel.recalculate_normals(box), KernelOperationError);
    EXPECT_EQ(box.vertex_count(), 8u);
    EXPECT_TRUE(box.mesh().is_closed());
}
#endif

#ifndef BEARDMOLD_HAS_TESS2
TEST_F(NativeKernelTest, CappingWithoutTessellatorThrows) {
    IndexedMesh open = primitives::box({0, 0, 0}, {1, 1, 1});
    open.faces().erase(open.faces().begin() + 2, open.faces().begin() + 4);
    Solid solid = kernel.build_solid(open);
    EXPECT_THROW(kernel.fill_holes(solid, 0), KernelOperationError);
    EXPECT_THROW(kernel.triangulate_polygon({{0, 0, 0}, {1, 0, 0}, {1, 1, 0}, {0, 1, 0}}),
                 KernelOperationError);
}
#endif

TEST_F(NativeKernelTest, ClosedSolidNeedsNoCapping) {
    Solid box = kernel.make_box({0, 0, 0}, {1, 1, 1});
    EXPECT_EQ(kernel.fill_holes(box, 0), 0u);
    EXPECT_EQ(box.triangle_count(), 12u);
}

TEST_F(NativeKernelTest, BooleanAndRemeshUnavailable) {
    Solid a = kernel.make_box({0, 0, 0}, {1, 1, 1});
    Solid b = kernel.make_box({0.5, 0.5, 0.5}, {2, 2, 2});
    try {
        kernel.apply_boolean(a, b, BooleanOp::Difference);
        FAIL() << "expected KernelOperationError";
    } catch (const KernelOperationError& e) {
        EXPECT_EQ(e.operation(), "boolean difference");
    }
    EXPECT_THROW(kernel.voxel_remesh(a, 0.1), KernelOperationError);
    // Target untouched
    EXPECT_EQ(a.triangle_count(), 12u);
}

TEST_F(NativeKernelTest, ExportWritesScaledBinaryStl) {
    test::TempDir dir;
    Solid box = kernel.make_box({0, 0, 0}, {0.01, 0.02, 0.03});
    std::string path = dir.file("box.stl");
    kernel.export_stl(box, path, 1000.0);

    EXPECT_EQ(std::filesystem::file_size(path), 84u + 50u * 12u);

    std::ifstream in(path, std::ios::binary);
    char header[80];
    in.read(header, 80);
    EXPECT_EQ(std::string(header, 9), "beardmold");
    uint32_t count = 0;
    in.read(reinterpret_cast<char*>(&count), sizeof(count));
    EXPECT_EQ(count, 12u);

    // Largest coordinate across every facet corner is 30 mm
    float max_z = 0.0f;
    for (uint32_t i = 0; i < count; ++i) {
        float facet[12];
        uint16_t attribute = 0;
        in.read(reinterpret_cast<char*>(facet), sizeof(facet));
        in.read(reinterpret_cast<char*>(&attribute), sizeof(attribute));
        for (int k = 1; k < 4; ++k) {
            max_z = std::max(max_z, facet[3 * k + 2]);
        }
    }
    EXPECT_NEAR(max_z, 30.0f, 1e-4f);
}

TEST_F(NativeKernelTest, ExportToMissingDirectoryFails) {
    Solid box = kernel.make_box({0, 0, 0}, {1, 1, 1});
    EXPECT_THROW(kernel.export_stl(box, "/nonexistent-dir/beardmold/out.stl", 1.0),
                 KernelOperationError);
}

TEST(KernelFactoryTest, CreatesByName) {
    EXPECT_EQ(create_kernel("native")->name(), "native");
    EXPECT_EQ(create_kernel("Manifold")->name(), "manifold");
    EXPECT_EQ(create_kernel("auto")->name(),
              boolean_kernel_available() ? "manifold" : "native");
    EXPECT_THROW(create_kernel("cgal"), std::invalid_argument);
}
