#include "polyline.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <string>

namespace beardmold {

Polyline smooth(const Polyline& polyline, int passes) {
    if (passes <= 0) {
        return polyline;
    }
    if (polyline.size() < 3) {
        throw InvalidInputError("cannot smooth a polyline with " +
                                std::to_string(polyline.size()) + " points");
    }

    Polyline current = polyline;
    for (int pass = 0; pass < passes; ++pass) {
        Polyline next = current;
        for (size_t i = 1; i + 1 < current.size(); ++i) {
            next[i] = (current[i - 1] + current[i] + current[i + 1]) / 3.0;
        }
        current = std::move(next);
    }
    return current;
}

double squared_triangle_area(const Point3& a, const Point3& b, const Point3& c) {
    return (b - a).cross(c - a).length_squared();
}

Polyline resample_by_axis(const Polyline& polyline, const std::vector<double>& target_xs) {
    if (polyline.empty()) {
        throw InvalidInputError("cannot resample an empty polyline");
    }

    Polyline sorted = polyline;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Point3& a, const Point3& b) { return a.x < b.x; });

    const Point3& first = sorted.front();
    const Point3& last = sorted.back();

    Polyline result;
    result.reserve(target_xs.size());

    for (double x : target_xs) {
        if (x <= first.x) {
            result.push_back(first);
            continue;
        }
        if (x >= last.x) {
            result.push_back(last);
            continue;
        }

        // First point strictly past x; its predecessor is at or before x
        auto upper = std::upper_bound(sorted.begin(), sorted.end(), x,
                                      [](double value, const Point3& p) { return value < p.x; });
        const Point3& b = *upper;
        const Point3& a = *(upper - 1);

        double span = b.x - a.x;
        double t = span > 0.0 ? (x - a.x) / span : 0.0;
        Point3 p = lerp(a, b, t);
        p.x = x;
        result.push_back(p);
    }

    return result;
}

std::pair<double, double> x_range(const Polyline& polyline) {
    if (polyline.empty()) {
        throw InvalidInputError("empty polyline has no X range");
    }
    auto [lo, hi] = std::minmax_element(polyline.begin(), polyline.end(),
                                        [](const Point3& a, const Point3& b) { return a.x < b.x; });
    return {lo->x, hi->x};
}

}  // namespace beardmold
