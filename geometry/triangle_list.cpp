#include "triangle_list.hpp"
#include "polyline.hpp"

namespace beardmold {

bool TriangleList::add(const Point3& a, const Point3& b, const Point3& c) {
    if (squared_triangle_area(a, b, c) < DEGENERATE_AREA_EPSILON) {
        ++dropped_;
        return false;
    }
    triangles_.push_back(Triangle{{a, b, c}});
    return true;
}

void TriangleList::append(const TriangleList& other) {
    triangles_.insert(triangles_.end(), other.triangles_.begin(), other.triangles_.end());
    dropped_ += other.dropped_;
}

}  // namespace beardmold
