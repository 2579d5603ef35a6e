#include "feature_engine.hpp"
#include <common/errors.hpp>
#include "logging.hpp"
#include <algorithm>

namespace beardmold {

namespace {

size_t count_successes(const std::vector<CutterResult>& results) {
    return static_cast<size_t>(std::count_if(results.begin(), results.end(),
        [](const CutterResult& r) { return r.success; }));
}

}  // namespace

size_t FeatureReport::ribs_applied() const {
    return count_successes(ribs);
}

size_t FeatureReport::holes_applied() const {
    return count_successes(holes);
}

size_t FeatureReport::failures() const {
    size_t failed = (ribs.size() - ribs_applied()) + (holes.size() - holes_applied());
    if (remesh && !remesh->success) {
        ++failed;
    }
    return failed;
}

std::vector<CutterBox> rib_boxes(double min_x, double max_x, double band_y,
                                 double top_z, const MoldParameters& params) {
    std::vector<CutterBox> boxes;
    if (params.rib_count <= 0) {
        return boxes;
    }

    const double span = max_x - min_x;
    const double half_w = 0.5 * params.rib_width;
    const double half_d = 0.5 * params.rib_depth;
    const double z_top = top_z - params.rib_drop;

    boxes.reserve(static_cast<size_t>(params.rib_count));
    for (int k = 0; k < params.rib_count; ++k) {
        double cx = min_x + (k + 0.5) * span / params.rib_count;
        boxes.push_back({
            Vec3(cx - half_w, band_y - half_d, z_top - params.rib_height),
            Vec3(cx + half_w, band_y + half_d, z_top)
        });
    }
    return boxes;
}

Vec3 hole_cylinder_center(const Point3& hole, const MoldParameters& params) {
    return Vec3(hole.x, hole.y, hole.z - (params.embed_offset + 0.5 * params.thickness()));
}

FeatureEngine::FeatureEngine(MeshKernel& kernel, const MoldParameters& params)
    : kernel_(kernel), params_(params) {}

void FeatureEngine::apply_anchor_ribs(Solid& solid, double min_x, double max_x,
                                      double band_y, FeatureReport& report) {
    auto log = beardmold::logging::get_logger();

    const double top_z = solid.bounding_box().max.z;
    auto boxes = rib_boxes(min_x, max_x, band_y, top_z, params_);
    log->debug("FeatureEngine: {} anchor ribs, band_y={:.5f}, top_z={:.5f}",
               boxes.size(), band_y, top_z);

    for (size_t i = 0; i < boxes.size(); ++i) {
        CutterResult result;
        result.index = i;
        result.kind = "rib";
        try {
            Solid rib = kernel_.make_box(boxes[i].min, boxes[i].max);
            kernel_.apply_boolean(solid, rib, BooleanOp::Union);
            result.success = true;
        } catch (const KernelOperationError& e) {
            result.message = e.what();
            log->warn("FeatureEngine: rib {} skipped: {}", i, e.what());
        }
        report.ribs.push_back(result);
    }

    log->info("FeatureEngine: {}/{} ribs unioned", report.ribs_applied(), boxes.size());
}

void FeatureEngine::apply_remesh(Solid& solid, FeatureReport& report) {
    auto log = beardmold::logging::get_logger();

    CutterResult result;
    result.kind = "remesh";
    try {
        kernel_.voxel_remesh(solid, params_.voxel_remesh);
        result.success = true;
        log->debug("FeatureEngine: remeshed at {} -> {} triangles",
                   params_.voxel_remesh, solid.triangle_count());
    } catch (const KernelOperationError& e) {
        result.message = e.what();
        log->warn("FeatureEngine: remesh skipped: {}", e.what());
    }
    report.remesh = result;
}

void FeatureEngine::apply_holes(Solid& solid, const Polyline& hole_centers,
                                FeatureReport& report) {
    auto log = beardmold::logging::get_logger();
    const double height = params_.thickness();

    for (size_t i = 0; i < hole_centers.size(); ++i) {
        CutterResult result;
        result.index = i;
        result.kind = "hole";
        try {
            Solid cutter = kernel_.make_cylinder(hole_cylinder_center(hole_centers[i], params_),
                                                 params_.hole_radius, height,
                                                 params_.hole_segments);
            kernel_.apply_boolean(solid, cutter, BooleanOp::Difference);
            result.success = true;
        } catch (const KernelOperationError& e) {
            result.message = e.what();
            log->warn("FeatureEngine: hole {} skipped: {}", i, e.what());
        }
        report.holes.push_back(result);
    }

    log->info("FeatureEngine: {}/{} holes subtracted", report.holes_applied(), hole_centers.size());
}

}  // namespace beardmold
