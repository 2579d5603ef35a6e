#ifndef BEARDMOLD_MATH_VEC3_HPP
#define BEARDMOLD_MATH_VEC3_HPP

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace beardmold {

// Model space: X = left-right across the face, Y = depth, Z = vertical.
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    // Arithmetic operators
    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(double scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(double scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    // Compound assignment
    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator-=(const Vec3& other) {
        x -= other.x; y -= other.y; z -= other.z;
        return *this;
    }

    constexpr Vec3& operator*=(double scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    // Dot product
    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    // Magnitude squared (no sqrt)
    constexpr double length_squared() const {
        return x * x + y * y + z * z;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    Vec3 normalized() const {
        double len = length();
        if (len > 0.0) {
            return *this / len;
        }
        return {0.0, 0.0, 0.0};
    }

    double distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    // Comparison (exact)
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }

    constexpr bool operator!=(const Vec3& other) const {
        return !(*this == other);
    }

    // Array access
    constexpr double& operator[](size_t i) {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }

    constexpr double operator[](size_t i) const {
        if (i == 0) return x;
        if (i == 1) return y;
        return z;
    }
};

// Contour points are plain positions
using Point3 = Vec3;

// Ordered point sequence; order encodes the traversal direction
using Polyline = std::vector<Point3>;

// Scalar * Vec3
constexpr Vec3 operator*(double scalar, const Vec3& v) {
    return v * scalar;
}

// Linear interpolation
constexpr Vec3 lerp(const Vec3& a, const Vec3& b, double t) {
    return a * (1.0 - t) + b * t;
}

// Component-wise min/max
inline Vec3 component_min(const Vec3& a, const Vec3& b) {
    return {std::min(a.x, b.x), std::min(a.y, b.y), std::min(a.z, b.z)};
}

inline Vec3 component_max(const Vec3& a, const Vec3& b) {
    return {std::max(a.x, b.x), std::max(a.y, b.y), std::max(a.z, b.z)};
}

// Common constants
namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace beardmold

#endif // BEARDMOLD_MATH_VEC3_HPP
