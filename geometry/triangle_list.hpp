#ifndef BEARDMOLD_GEOMETRY_TRIANGLE_LIST_HPP
#define BEARDMOLD_GEOMETRY_TRIANGLE_LIST_HPP

#include <math/vec3.hpp>
#include <array>
#include <vector>

namespace beardmold {

// Triangles whose squared cross-product area falls below this are dropped
constexpr double DEGENERATE_AREA_EPSILON = 1e-18;

struct Triangle {
    std::array<Point3, 3> corners;

    const Point3& operator[](size_t i) const { return corners[i]; }
};

// Triangle soup with degeneracy filtering on insertion
class TriangleList {
public:
    TriangleList() = default;

    // Returns false (and keeps nothing) for a degenerate triangle
    bool add(const Point3& a, const Point3& b, const Point3& c);

    // Concatenate another list, preserving order
    void append(const TriangleList& other);

    size_t size() const { return triangles_.size(); }
    bool empty() const { return triangles_.empty(); }
    size_t dropped() const { return dropped_; }

    const std::vector<Triangle>& triangles() const { return triangles_; }
    const Triangle& operator[](size_t i) const { return triangles_[i]; }

    std::vector<Triangle>::const_iterator begin() const { return triangles_.begin(); }
    std::vector<Triangle>::const_iterator end() const { return triangles_.end(); }

private:
    std::vector<Triangle> triangles_;
    size_t dropped_ = 0;
};

}  // namespace beardmold

#endif // BEARDMOLD_GEOMETRY_TRIANGLE_LIST_HPP
