#ifndef DRAPE_MATH_RAY_HPP
#define DRAPE_MATH_RAY_HPP

#include "vec3.hpp"
#include <optional>

namespace drape {

struct Ray {
    Vec3 origin;
    Vec3 direction;

    constexpr Ray() = default;
    constexpr Ray(const Vec3& o, const Vec3& d) : origin(o), direction(d) {}

    constexpr Vec3 at(float t) const {
        return origin + direction * t;
    }
};

// Moller-Trumbore ray/triangle test.
// Returns the parametric distance t >= 0 along the ray (in units of
// ray.direction) or nullopt when the ray misses or is parallel to the
// triangle plane. Both triangle faces are hit.
inline std::optional<float> intersect_triangle(const Ray& ray,
                                               const Vec3& p1,
                                               const Vec3& p2,
                                               const Vec3& p3,
                                               float epsilon = 1e-7f) {
    Vec3 edge1 = p2 - p1;
    Vec3 edge2 = p3 - p1;
    Vec3 h = ray.direction.cross(edge2);
    float det = edge1.dot(h);
    if (det > -epsilon && det < epsilon) {
        return std::nullopt;
    }

    float inv_det = 1.0f / det;
    Vec3 s = ray.origin - p1;
    float u = inv_det * s.dot(h);
    if (u < 0.0f || u > 1.0f) {
        return std::nullopt;
    }

    Vec3 q = s.cross(edge1);
    float v = inv_det * ray.direction.dot(q);
    if (v < 0.0f || u + v > 1.0f) {
        return std::nullopt;
    }

    float t = inv_det * edge2.dot(q);
    if (t < 0.0f) {
        return std::nullopt;
    }
    return t;
}

}  // namespace drape

#endif // DRAPE_MATH_RAY_HPP
