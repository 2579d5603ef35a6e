#include "tess_triangulator.hpp"
#include <common/errors.hpp>
#include "logging.hpp"

#ifdef BEARDMOLD_HAS_TESS2
#include <tesselator.h>
#include <memory>
#include <utility>
#endif

namespace beardmold {
namespace triangulation {

#ifdef BEARDMOLD_HAS_TESS2
namespace {

// Newell normal; its direction gives the polygon's winding
Vec3 polygon_normal(const Polyline& polygon) {
    Vec3 normal = vec3::zero();
    for (size_t i = 0; i < polygon.size(); ++i) {
        const Point3& a = polygon[i];
        const Point3& b = polygon[(i + 1) % polygon.size()];
        normal.x += (a.y - b.y) * (a.z + b.z);
        normal.y += (a.z - b.z) * (a.x + b.x);
        normal.z += (a.x - b.x) * (a.y + b.y);
    }
    return normal;
}

}  // namespace
#endif

std::vector<Face> tessellate(const Polyline& polygon) {
    if (polygon.size() < 3) {
        return {};
    }
    if (polygon.size() == 3) {
        return {Face{0, 1, 2}};
    }

#ifdef BEARDMOLD_HAS_TESS2
    // Centered on the bounding box; libtess2 works in float
    BoundingBox box;
    for (const auto& p : polygon) {
        box.expand(p);
    }
    const Vec3 mid = (box.min + box.max) * 0.5;

    std::vector<float> coords;
    coords.reserve(polygon.size() * 3);
    for (const auto& p : polygon) {
        Vec3 d = p - mid;
        coords.push_back(static_cast<float>(d.x));
        coords.push_back(static_cast<float>(d.y));
        coords.push_back(static_cast<float>(d.z));
    }

    std::unique_ptr<TESStesselator, decltype(&tessDeleteTess)> tess(tessNewTess(nullptr),
                                                                    &tessDeleteTess);
    if (!tess) {
        throw KernelOperationError("triangulate_polygon", "cannot create tessellator");
    }
    tessAddContour(tess.get(), 3, coords.data(), static_cast<int>(3 * sizeof(float)),
                   static_cast<int>(polygon.size()));
    if (!tessTesselate(tess.get(), TESS_WINDING_ODD, TESS_POLYGONS, 3, 3, nullptr)) {
        throw KernelOperationError("triangulate_polygon", "libtess2 tessellation failed");
    }

    const TESSindex* remap = tessGetVertexIndices(tess.get());
    const TESSindex* elements = tessGetElements(tess.get());
    const int element_count = tessGetElementCount(tess.get());
    const Vec3 normal = polygon_normal(polygon);

    std::vector<Face> faces;
    faces.reserve(static_cast<size_t>(element_count));
    for (int e = 0; e < element_count; ++e) {
        Face face{};
        for (int k = 0; k < 3; ++k) {
            TESSindex out = elements[3 * e + k];
            if (out == TESS_UNDEF || remap[out] == TESS_UNDEF) {
                throw KernelOperationError("triangulate_polygon",
                                           "polygon is self-intersecting");
            }
            face[static_cast<size_t>(k)] = static_cast<VertexId>(remap[out]);
        }

        const Point3& a = polygon[face[0]];
        const Point3& b = polygon[face[1]];
        const Point3& c = polygon[face[2]];
        if ((b - a).cross(c - a).dot(normal) < 0.0) {
            std::swap(face[1], face[2]);
        }
        faces.push_back(face);
    }
    return faces;
#else
    auto log = beardmold::logging::get_logger();
    log->debug("libtess2 not available - compile with libtess2 for polygon triangulation");
    throw KernelOperationError("triangulate_polygon", "libtess2 not available - rebuild with libtess2");
#endif
}

}  // namespace triangulation
}  // namespace beardmold
