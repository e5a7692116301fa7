#include "cloth_forces.hpp"
#include "triangles.hpp"
#ifdef _OPENMP
#include <omp.h>
#endif

namespace drape {

void add_uniform_force(ParticleGrid& grid, const Vec3& f) {
    auto& particles = grid.particles();

    #pragma omp parallel for schedule(static) if(particles.size() > 256)
    for (size_t i = 0; i < particles.size(); ++i) {
        particles[i].add_force(f);
    }
}

void add_wind_force(ParticleGrid& grid, const Vec3& dir) {
    // Sequential: neighbouring triangles share vertices and the
    // summation order must stay reproducible.
    auto& particles = grid.particles();
    for_each_triangle(grid, [&](const Triangle& tri) {
        Vec3 normal = face_normal(grid, tri);
        Vec3 force = normal * normal.normalized().dot(dir);
        particles[tri.a].add_force(force);
        particles[tri.b].add_force(force);
        particles[tri.c].add_force(force);
    });
}

bool add_point_force(ParticleGrid& grid, int x, int y, float dx, float dy) {
    if (!grid.in_bounds(x, y)) {
        return false;
    }
    grid.particle(x, y).add_force(Vec3(dx, dy, 0.0f));
    return true;
}

}  // namespace drape
