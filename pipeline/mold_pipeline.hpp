#ifndef BEARDMOLD_PIPELINE_MOLD_PIPELINE_HPP
#define BEARDMOLD_PIPELINE_MOLD_PIPELINE_HPP

#include "mold_payload.hpp"
#include <features/feature_engine.hpp>
#include <kernel/mesh_kernel.hpp>
#include <report/mesh_stats.hpp>
#include <solid/solidifier.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace beardmold {

enum class PipelineStage {
    ParseInput,
    SampleContour,
    LoftLip,
    Stitch,
    Solidify,
    ApplyRibs,
    Remesh,
    ReportStats,
    ApplyHoles,
    Export,
    Done
};

const char* to_string(PipelineStage stage);

struct PipelineResult {
    std::vector<PipelineStage> stages;   // In the order visited
    FeatureReport features;
    SolidifyReport solidify;
    MeshStats stats;                     // Taken before holes are cut
    std::string stats_path;
    std::string output_path;
    double export_scale = 1.0;

    // Echoed from the payload for the summary line
    std::string job_id;
    std::string overlay;
    size_t beardline_points = 0;
    size_t neckline_points = 0;
    size_t hole_count = 0;

    bool visited(PipelineStage stage) const;
};

// Drives one mold build from payload to STL:
// ParseInput -> SampleContour -> LoftLip -> Stitch -> Solidify -> ApplyRibs? ->
// Remesh? -> ReportStats -> ApplyHoles? -> Export -> Done
class MoldPipeline {
public:
    explicit MoldPipeline(MeshKernel& kernel);

    // Throws InvalidInputError before any mesh work, ExportError when the
    // STL could not be written (the stats sidecar is kept), and
    // KernelOperationError when the kernel rejects the solid outright.
    PipelineResult run(const MoldPayload& payload, const std::string& output_path);
    PipelineResult run(const nlohmann::json& payload, const std::string& output_path);
    PipelineResult run_file(const std::string& input_path, const std::string& output_path);

private:
    // Kernel weld of the open sheet; merging runs before extrusion so that
    // split vertices stay apart in the shell
    Solid build_sheet(const TriangleList& triangles, const MoldParameters& params);
    Solid build_solid(const IndexedMesh& shell, const MoldParameters& params);

    MeshKernel& kernel_;
};

// One-line report printed after a successful export
std::string format_summary(const PipelineResult& result);

}  // namespace beardmold

#endif // BEARDMOLD_PIPELINE_MOLD_PIPELINE_HPP
