#include "mold_pipeline.hpp"
#include <common/errors.hpp>
#include <contour/contour_sampler.hpp>
#include <loft/lip_loft.hpp>
#include <loft/stitcher.hpp>
#include "logging.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace beardmold {

const char* to_string(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::ParseInput: return "ParseInput";
        case PipelineStage::SampleContour: return "SampleContour";
        case PipelineStage::LoftLip: return "LoftLip";
        case PipelineStage::Stitch: return "Stitch";
        case PipelineStage::Solidify: return "Solidify";
        case PipelineStage::ApplyRibs: return "ApplyRibs";
        case PipelineStage::Remesh: return "Remesh";
        case PipelineStage::ReportStats: return "ReportStats";
        case PipelineStage::ApplyHoles: return "ApplyHoles";
        case PipelineStage::Export: return "Export";
        case PipelineStage::Done: return "Done";
    }
    return "Unknown";
}

bool PipelineResult::visited(PipelineStage stage) const {
    return std::find(stages.begin(), stages.end(), stage) != stages.end();
}

MoldPipeline::MoldPipeline(MeshKernel& kernel) : kernel_(kernel) {}

PipelineResult MoldPipeline::run(const nlohmann::json& payload, const std::string& output_path) {
    return run(parse_payload(payload), output_path);
}

PipelineResult MoldPipeline::run_file(const std::string& input_path, const std::string& output_path) {
    auto log = beardmold::logging::get_logger();
    log->info("Reading payload: {}", input_path);
    return run(load_payload(input_path), output_path);
}

PipelineResult MoldPipeline::run(const MoldPayload& payload, const std::string& output_path) {
    auto log = beardmold::logging::get_logger();
    const MoldParameters& params = payload.params;

    PipelineResult result;
    result.output_path = output_path;
    result.stats_path = stats_path_for(output_path);
    result.export_scale = params.export_scale();
    result.job_id = payload.job_id;
    result.overlay = payload.overlay;
    result.beardline_points = payload.beardline.size();
    result.neckline_points = payload.neckline.size();
    result.hole_count = payload.hole_centers.size();

    auto enter = [&](PipelineStage stage) {
        log->debug("Stage: {}", to_string(stage));
        result.stages.push_back(stage);
    };

    // 1. Parse input
    enter(PipelineStage::ParseInput);
    if (payload.beardline.empty()) {
        throw InvalidInputError("beardline is missing or empty");
    }
    params.validate();

    // 2. Sample base points
    enter(PipelineStage::SampleContour);
    ContourSample sample = sample_base_points(payload.beardline,
                                              static_cast<size_t>(params.base_point_count()));

    // 3. Loft the lip
    enter(PipelineStage::LoftLip);
    LipLoft loft = LipLoft::from_sample(sample, params);

    // 4. Stitch lip, beardline and neckline
    enter(PipelineStage::Stitch);
    StitchedSurface surface = stitch_contours(loft, payload.beardline, payload.neckline, sample.xs);
    log->debug("Stitched surface: {} triangles ({} lip, {} beard strip, {} neck strip, {} dropped)",
               surface.triangles.size(), surface.lip_triangle_count,
               surface.beard_strip_count, surface.neck_strip_count,
               surface.triangles.dropped());

    // 5. Solidify
    enter(PipelineStage::Solidify);
    if (surface.triangles.empty()) {
        throw InvalidInputError("stitched surface has no triangles");
    }
    Solid sheet = build_sheet(surface.triangles, params);
    IndexedMesh shell = Solidifier::solidify(sheet.mesh(), params.solidify_depth(),
                                             &result.solidify);
    Solid solid = build_solid(shell, params);

    FeatureEngine features(kernel_, params);

    // 6. Anchor ribs
    if (params.anchor_ribs) {
        enter(PipelineStage::ApplyRibs);
        features.apply_anchor_ribs(solid, sample.min_x, sample.max_x, loft.lip_band_y(),
                                   result.features);
    }

    // 7. Remesh
    if (params.remesh_enabled()) {
        enter(PipelineStage::Remesh);
        features.apply_remesh(solid, result.features);
    }

    // 8. Statistics, before holes change the outline
    enter(PipelineStage::ReportStats);
    result.stats = compute_stats(solid, result.export_scale, params.thickness());
    try {
        write_stats(result.stats_path, result.stats, params);
    } catch (const std::runtime_error& e) {
        throw MoldError(std::string("cannot write statistics: ") + e.what());
    }
    log->info("Mesh: {} triangles, {} vertices, {:.2f} x {:.2f} x {:.2f} mm",
              result.stats.triangles, result.stats.vertices,
              result.stats.dim_mm.x, result.stats.dim_mm.y, result.stats.dim_mm.z);
    if (result.stats.non_manifold_edges > 0) {
        log->warn("Mesh has {} non-manifold edges", result.stats.non_manifold_edges);
    }

    // 9. Holes
    if (!payload.hole_centers.empty()) {
        enter(PipelineStage::ApplyHoles);
        features.apply_holes(solid, payload.hole_centers, result.features);
    }

    // 10. Export
    enter(PipelineStage::Export);
    try {
        kernel_.export_stl(solid, output_path, result.export_scale);
    } catch (const KernelOperationError& e) {
        log->error("Export failed, statistics kept at {}", result.stats_path);
        throw ExportError(e.what(), result.stats_path);
    }

    enter(PipelineStage::Done);
    log->info("Wrote {} ({} triangles)", output_path, solid.triangle_count());
    return result;
}

Solid MoldPipeline::build_sheet(const TriangleList& triangles, const MoldParameters& params) {
    auto log = beardmold::logging::get_logger();

    Solid sheet = kernel_.build_solid(IndexedMesh::from_triangles(triangles));

    // Cleanup requests are best-effort
    try {
        size_t merged = kernel_.merge_by_distance(sheet, params.merge_distance);
        log->debug("Solidify: merged {} vertices", merged);
    } catch (const KernelOperationError& e) {
        log->warn("Solidify: merge skipped: {}", e.what());
    }
    return sheet;
}

Solid MoldPipeline::build_solid(const IndexedMesh& shell, const MoldParameters& params) {
    auto log = beardmold::logging::get_logger();

    Solid solid = kernel_.build_solid(shell);

    try {
        size_t capped = kernel_.fill_holes(solid, static_cast<size_t>(params.fill_hole_sides));
        log->debug("Solidify: capped {} boundary loops", capped);
    } catch (const KernelOperationError& e) {
        log->warn("Solidify: hole fill skipped: {}", e.what());
    }

    try {
        size_t flipped = kernel_.recalculate_normals(solid);
        log->debug("Solidify: flipped {} faces", flipped);
    } catch (const KernelOperationError& e) {
        log->warn("Solidify: normal recalculation skipped: {}", e.what());
    }

    log->info("Solidify: {} triangles, {} vertices", solid.triangle_count(), solid.vertex_count());
    return solid;
}

std::string format_summary(const PipelineResult& result) {
    auto or_na = [](const std::string& s) { return s.empty() ? std::string("N/A") : s; };

    std::ostringstream out;
    out << "STL export complete"
        << " | scale=" << result.export_scale
        << " | jobID=" << or_na(result.job_id)
        << " overlay=" << or_na(result.overlay)
        << " verts(beardline)=" << result.beardline_points
        << " neckline=" << result.neckline_points
        << " holes=" << result.hole_count
        << std::fixed << std::setprecision(2)
        << " | dim_mm=" << result.stats.dim_mm.x
        << "x" << result.stats.dim_mm.y
        << "x" << result.stats.dim_mm.z;
    return out.str();
}

}  // namespace beardmold
