#include "stitcher.hpp"
#include <geometry/polyline.hpp>
#include "logging.hpp"
#include <stdexcept>
#include <string>

namespace beardmold {

TriangleList stitch_strip(const Polyline& a, const Polyline& b) {
    if (a.size() != b.size()) {
        throw std::invalid_argument("stitch_strip: sequences differ in length (" +
                                    std::to_string(a.size()) + " vs " +
                                    std::to_string(b.size()) + ")");
    }

    TriangleList strip;
    for (size_t i = 0; i + 1 < a.size(); ++i) {
        strip.add(a[i], b[i], a[i + 1]);
        strip.add(a[i + 1], b[i], b[i + 1]);
    }
    return strip;
}

StitchedSurface stitch_contours(const LipLoft& loft,
                                const Polyline& beardline,
                                const Polyline& neckline,
                                const std::vector<double>& xs) {
    auto log = beardmold::logging::get_logger();

    StitchedSurface surface;
    surface.triangles.append(loft.triangles());
    surface.lip_triangle_count = loft.triangles().size();

    surface.beardline = resample_by_axis(beardline, xs);
    TriangleList beard_strip = stitch_strip(loft.first_column(), surface.beardline);
    surface.beard_strip_count = beard_strip.size();
    surface.triangles.append(beard_strip);

    if (!neckline.empty()) {
        surface.neckline = resample_by_axis(neckline, xs);
        TriangleList neck_strip = stitch_strip(surface.beardline, surface.neckline);
        surface.neck_strip_count = neck_strip.size();
        surface.triangles.append(neck_strip);
    }

    log->debug("Stitcher: lip={} beard_strip={} neck_strip={} ({} degenerate dropped)",
               surface.lip_triangle_count, surface.beard_strip_count,
               surface.neck_strip_count, surface.triangles.dropped());

    return surface;
}

}  // namespace beardmold
