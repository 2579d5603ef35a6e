#ifndef BEARDMOLD_FEATURES_FEATURE_ENGINE_HPP
#define BEARDMOLD_FEATURES_FEATURE_ENGINE_HPP

#include <kernel/mesh_kernel.hpp>
#include <mold/mold_parameters.hpp>
#include <math/vec3.hpp>
#include <optional>
#include <string>
#include <vector>

namespace beardmold {

// Outcome of one kernel request made by a feature stage
struct CutterResult {
    size_t index = 0;
    std::string kind;       // "rib", "hole" or "remesh"
    bool success = false;
    std::string message;    // Kernel error text when the request failed
};

struct FeatureReport {
    std::vector<CutterResult> ribs;
    std::vector<CutterResult> holes;
    std::optional<CutterResult> remesh;

    size_t ribs_applied() const;
    size_t holes_applied() const;
    size_t failures() const;
};

// Axis-aligned extent of one cutter box
struct CutterBox {
    Vec3 min;
    Vec3 max;
};

// Rib boxes evenly spread over [min_x, max_x]: centers at
// min_x + (k + 0.5) * span / rib_count, centered on band_y in Y,
// tops at top_z - rib_drop.
std::vector<CutterBox> rib_boxes(double min_x, double max_x, double band_y,
                                 double top_z, const MoldParameters& params);

// Center of the hole cylinder under a hole point, sunk by
// embed_offset + thickness / 2
Vec3 hole_cylinder_center(const Point3& hole, const MoldParameters& params);

// Applies ribs, remesh and holes to a solid through a mesh kernel.
// Each request is best-effort: a KernelOperationError is recorded in the
// report, logged as a warning, and the next request proceeds.
class FeatureEngine {
public:
    FeatureEngine(MeshKernel& kernel, const MoldParameters& params);

    // Union rib_count boxes into the solid along the lip band
    void apply_anchor_ribs(Solid& solid, double min_x, double max_x, double band_y,
                           FeatureReport& report);

    // One voxel remesh request at params.voxel_remesh
    void apply_remesh(Solid& solid, FeatureReport& report);

    // Subtract one cylinder per hole center
    void apply_holes(Solid& solid, const Polyline& hole_centers, FeatureReport& report);

private:
    MeshKernel& kernel_;
    MoldParameters params_;
};

}  // namespace beardmold

#endif // BEARDMOLD_FEATURES_FEATURE_ENGINE_HPP
