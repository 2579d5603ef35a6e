#include "contour_sampler.hpp"
#include <geometry/polyline.hpp>
#include <common/errors.hpp>
#include "logging.hpp"
#include <cmath>
#include <limits>
#include <tuple>

namespace beardmold {

ContourSample sample_base_points(const Polyline& beardline, size_t count) {
    if (beardline.empty()) {
        throw InvalidInputError("beardline is empty");
    }

    ContourSample sample;
    std::tie(sample.min_x, sample.max_x) = x_range(beardline);

    const double span = sample.max_x - sample.min_x;
    sample.xs.reserve(count);
    sample.points.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        double t = count > 1 ? static_cast<double>(i) / static_cast<double>(count - 1) : 0.0;
        double target = sample.min_x + span * t;
        sample.xs.push_back(target);

        size_t best = 0;
        double best_distance = std::numeric_limits<double>::infinity();
        for (size_t k = 0; k < beardline.size(); ++k) {
            double d = std::abs(beardline[k].x - target);
            if (d < best_distance) {
                best_distance = d;
                best = k;
            }
        }
        sample.points.push_back(beardline[best]);
    }

    auto log = beardmold::logging::get_logger();
    log->debug("ContourSampler: {} base points over x=[{:.5f}, {:.5f}] from {} beardline points",
               sample.points.size(), sample.min_x, sample.max_x, beardline.size());

    return sample;
}

}  // namespace beardmold
