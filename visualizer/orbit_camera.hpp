#ifndef DRAPE_VISUALIZER_ORBIT_CAMERA_HPP
#define DRAPE_VISUALIZER_ORBIT_CAMERA_HPP

#include <math/ray.hpp>
#include <math/vec3.hpp>
#include <algorithm>
#include <cmath>

namespace drape {

// Orbit camera: looks at `target` from `distance` away after rotating
// by `pitch` about x and `yaw` about y. Matches the fixed-function
// modelview  T(0,0,-distance) * Rx(pitch) * Ry(yaw) * T(-target).
struct OrbitCamera {
    float distance = 20.0f;
    float yaw = 0.0f;             // Radians, about +y
    float pitch = 0.3f;           // Radians, about +x
    Vec3 target;
    float fov_y = 0.785398f;      // 45 degrees

    void rotate(float d_yaw, float d_pitch) {
        yaw += d_yaw;
        pitch = std::clamp(pitch + d_pitch, -1.5f, 1.5f);
    }

    void zoom(float factor) {
        distance = std::max(0.1f, distance * factor);
    }

    // Camera-space vector to world space: Ry(-yaw) * Rx(-pitch) * v
    Vec3 to_world(const Vec3& v) const {
        float cp = std::cos(-pitch);
        float sp = std::sin(-pitch);
        Vec3 r{v.x, v.y * cp - v.z * sp, v.y * sp + v.z * cp};
        float cy = std::cos(-yaw);
        float sy = std::sin(-yaw);
        return {r.x * cy + r.z * sy, r.y, -r.x * sy + r.z * cy};
    }

    Vec3 eye() const {
        return target + to_world(Vec3(0.0f, 0.0f, distance));
    }

    // Ray from the eye through window pixel (px, py); origin top-left
    Ray pixel_ray(double px, double py, int width, int height) const {
        float aspect = height > 0 ? static_cast<float>(width) / static_cast<float>(height) : 1.0f;
        float ndc_x = static_cast<float>(2.0 * px / std::max(width, 1) - 1.0);
        float ndc_y = static_cast<float>(1.0 - 2.0 * py / std::max(height, 1));
        float tan_half = std::tan(fov_y * 0.5f);
        Vec3 dir_cam{ndc_x * tan_half * aspect, ndc_y * tan_half, -1.0f};
        return Ray(eye(), to_world(dir_cam).normalized());
    }
};

}  // namespace drape

#endif // DRAPE_VISUALIZER_ORBIT_CAMERA_HPP
