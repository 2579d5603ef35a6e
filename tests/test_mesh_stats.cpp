#include <gtest/gtest.h>
#include "mesh_stats.hpp"
#include "json_serialization.hpp"
#include "native_kernel.hpp"
#include "primitives.hpp"
#include "test_helpers.hpp"

using namespace beardmold;

TEST(MeshStatsTest, BoxDimensions) {
    NativeKernel kernel;
    Solid box = kernel.make_box({-0.05, 0.0, -0.003}, {0.05, 0.02, 0.0});
    MeshStats stats = compute_stats(box, 1000.0, 0.003);

    EXPECT_EQ(stats.triangles, 12u);
    EXPECT_EQ(stats.vertices, 8u);
    EXPECT_NEAR(stats.dim_m.x, 0.10, 1e-12);
    EXPECT_NEAR(stats.dim_m.y, 0.02, 1e-12);
    EXPECT_NEAR(stats.dim_m.z, 0.003, 1e-12);
    EXPECT_NEAR(stats.dim_mm.x, 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(stats.thickness_m, 0.003);
    EXPECT_EQ(stats.non_manifold_edges, 0u);
    EXPECT_DOUBLE_EQ(stats.stl_scale, 1000.0);
}

TEST(MeshStatsTest, CountsOpenEdges) {
    IndexedMesh open = primitives::box({0, 0, 0}, {1, 1, 1});
    open.faces().erase(open.faces().begin() + 2, open.faces().begin() + 4);
    MeshStats stats = compute_stats(Solid(open), 1.0, 0.1);
    EXPECT_EQ(stats.non_manifold_edges, 4u);
}

TEST(MeshStatsTest, SidecarPath) {
    EXPECT_EQ(stats_path_for("/tmp/out/mold.stl"), "/tmp/out/mold.stl.stats.json");
}

TEST(MeshStatsTest, WritesSidecarDocument) {
    test::TempDir dir;
    NativeKernel kernel;
    Solid box = kernel.make_box({0, 0, 0}, {0.1, 0.02, 0.003});
    MoldParameters params;
    MeshStats stats = compute_stats(box, params.export_scale(), params.thickness());

    std::string path = dir.file("mold.stl.stats.json");
    write_stats(path, stats, params);
    nlohmann::json j = json::read_json_file(path);

    EXPECT_EQ(j["tris"].get<size_t>(), 12u);
    EXPECT_EQ(j["verts"].get<size_t>(), 8u);
    ASSERT_TRUE(j["bbox_m"].contains("min"));
    ASSERT_TRUE(j["bbox_m"].contains("max"));
    EXPECT_NEAR(j["bbox_m"]["max"][0].get<double>(), 0.1, 1e-12);
    EXPECT_EQ(j["dim_m"].size(), 3u);
    EXPECT_NEAR(j["dim_mm"][0].get<double>(), 100.0, 1e-9);
    EXPECT_DOUBLE_EQ(j["thickness_m"].get<double>(), 0.003);
    EXPECT_EQ(j["params"]["lipSegments"].get<int>(), 64);
    EXPECT_EQ(j["non_manifold_edges"].get<size_t>(), 0u);
    EXPECT_DOUBLE_EQ(j["stl_scale"].get<double>(), 1000.0);
}
