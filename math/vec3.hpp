#ifndef DRAPE_MATH_VEC3_HPP
#define DRAPE_MATH_VEC3_HPP

#include <cmath>

namespace drape {

// Three-component float vector used for particle state and mesh buffers.
// Layout is three packed floats so a std::vector<Vec3> can be handed to
// a renderer as a plain vertex array.
struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const {
        return {x + other.x, y + other.y, z + other.z};
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return {x - other.x, y - other.y, z - other.z};
    }

    constexpr Vec3 operator*(float scalar) const {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vec3 operator/(float scalar) const {
        return {x / scalar, y / scalar, z / scalar};
    }

    constexpr Vec3 operator-() const {
        return {-x, -y, -z};
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr Vec3& operator*=(float scalar) {
        x *= scalar; y *= scalar; z *= scalar;
        return *this;
    }

    constexpr float dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const {
        return {
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        };
    }

    constexpr float length_squared() const {
        return x * x + y * y + z * z;
    }

    float length() const {
        return std::sqrt(length_squared());
    }

    // Zero-length vectors normalize to zero instead of NaN
    Vec3 normalized() const {
        float len = length();
        if (len > 0.0f) {
            return *this / len;
        }
        return {0.0f, 0.0f, 0.0f};
    }

    float distance_to(const Vec3& other) const {
        return (*this - other).length();
    }

    bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
    }

    // Exact comparison; != is synthesized
    constexpr bool operator==(const Vec3& other) const {
        return x == other.x && y == other.y && z == other.z;
    }
};

constexpr Vec3 operator*(float scalar, const Vec3& v) {
    return v * scalar;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0f, 0.0f, 0.0f}; }
}

}  // namespace drape

#endif // DRAPE_MATH_VEC3_HPP
