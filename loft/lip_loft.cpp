#include "lip_loft.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <numbers>

namespace beardmold {

double taper_radius(double x, double center_x, const MoldParameters& params) {
    double falloff = std::max(0.0, 1.0 - std::abs(x - center_x) * params.taper_mult);
    return params.min_lip_radius + falloff * (params.max_lip_radius - params.min_lip_radius);
}

Polyline lip_ring(const Point3& base, double radius, const MoldParameters& params) {
    Polyline ring;
    ring.reserve(static_cast<size_t>(params.arc_steps) + 1);

    for (int j = 0; j <= params.arc_steps; ++j) {
        double t = static_cast<double>(j) / static_cast<double>(params.arc_steps);
        double angle = std::numbers::pi * std::pow(t, params.profile_bias);
        ring.push_back(base + Vec3{
            0.0,
            -radius * (1.0 - std::sin(angle)),
            params.prelift + radius * std::cos(angle)
        });
    }
    return ring;
}

LipLoft LipLoft::from_sample(const ContourSample& sample, const MoldParameters& params) {
    auto log = beardmold::logging::get_logger();

    LipLoft loft;
    const double center_x = sample.center_x();

    loft.rings_.reserve(sample.points.size());
    double mean_y = 0.0;
    for (const auto& base : sample.points) {
        double r = taper_radius(base.x, center_x, params);
        loft.rings_.push_back(lip_ring(base, r, params));
        mean_y += base.y;
    }
    if (!sample.points.empty()) {
        mean_y /= static_cast<double>(sample.points.size());
    }
    loft.lip_band_y_ = mean_y - 0.5 * params.max_lip_radius;

    // Quad cells between consecutive rings; diagonal split keeps normals
    // outward for base points ordered left to right
    for (size_t i = 0; i + 1 < loft.rings_.size(); ++i) {
        const Polyline& left = loft.rings_[i];
        const Polyline& right = loft.rings_[i + 1];
        for (size_t j = 0; j + 1 < left.size(); ++j) {
            const Point3& top_left = left[j];
            const Point3& bottom_left = left[j + 1];
            const Point3& top_right = right[j];
            const Point3& bottom_right = right[j + 1];

            loft.triangles_.add(top_left, bottom_left, top_right);
            loft.triangles_.add(top_right, bottom_left, bottom_right);
        }
    }

    log->debug("LipLoft: {} rings x {} positions, {} triangles ({} degenerate dropped)",
               loft.rings_.size(), params.arc_steps + 1,
               loft.triangles_.size(), loft.triangles_.dropped());

    return loft;
}

Polyline LipLoft::first_column() const {
    Polyline column;
    column.reserve(rings_.size());
    for (const auto& ring : rings_) {
        column.push_back(ring.front());
    }
    return column;
}

}  // namespace beardmold
