#ifndef DRAPE_CLOTH_TRIANGLES_HPP
#define DRAPE_CLOTH_TRIANGLES_HPP

#include "particle_grid.hpp"
#include <array>
#include <cstddef>

namespace drape {

// Triangle of three particle ids, in winding order
struct Triangle {
    ParticleId a = 0;
    ParticleId b = 0;
    ParticleId c = 0;
};

// Decomposition of quad (x, y), shared by wind, normals, mesh buffers
// and picking:
//   A = (x+1, y), (x, y), (x, y+1)
//   B = (x+1, y+1), (x+1, y), (x, y+1)
inline std::array<Triangle, 2> quad_triangles(const ParticleGrid& grid, int x, int y) {
    return {{
        {grid.index(x + 1, y), grid.index(x, y), grid.index(x, y + 1)},
        {grid.index(x + 1, y + 1), grid.index(x + 1, y), grid.index(x, y + 1)},
    }};
}

inline size_t quad_count(const ParticleGrid& grid) {
    if (grid.cols() < 2 || grid.rows() < 2) {
        return 0;
    }
    return static_cast<size_t>(grid.cols() - 1) * static_cast<size_t>(grid.rows() - 1);
}

// Quads are visited column by column (x outer, y inner). Mesh buffers
// use the same order, so quad (x, y) owns buffer slots
// [6 * (x * (rows - 1) + y), +6).
template <typename Fn>
void for_each_triangle(const ParticleGrid& grid, Fn&& fn) {
    for (int x = 0; x < grid.cols() - 1; ++x) {
        for (int y = 0; y < grid.rows() - 1; ++y) {
            for (const Triangle& tri : quad_triangles(grid, x, y)) {
                fn(tri);
            }
        }
    }
}

// Unnormalized face normal (p2 - p1) x (p3 - p1); its length is twice
// the triangle area.
inline Vec3 face_normal(const ParticleGrid& grid, const Triangle& tri) {
    const auto& particles = grid.particles();
    const Vec3& p1 = particles[tri.a].position;
    const Vec3& p2 = particles[tri.b].position;
    const Vec3& p3 = particles[tri.c].position;
    return (p2 - p1).cross(p3 - p1);
}

}  // namespace drape

#endif // DRAPE_CLOTH_TRIANGLES_HPP
