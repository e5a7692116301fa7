#ifndef DRAPE_CLOTH_PARTICLE_HPP
#define DRAPE_CLOTH_PARTICLE_HPP

#include <math/vec3.hpp>
#include <math/vec2.hpp>
#include <cstdint>

namespace drape {

using ParticleId = uint32_t;

// One point mass of the cloth lattice.
// Velocity is implicit: Verlet integration derives it from
// position - old_position.
struct Particle {
    Vec3 position;
    Vec3 old_position;            // Position before the last integration step
    Vec3 acceleration;            // Accumulated forces, cleared after each step
    Vec2 tex_coord;               // Fixed at creation
    Vec3 accumulated_normal;      // Sum of unit face normals of adjacent triangles

    bool movable = true;

    // Only movable particles can be displaced; pinned ones ignore the offset.
    void offset(const Vec3& delta) {
        if (movable) {
            position += delta;
        }
    }

    // Stored even when pinned; integration discards it.
    void add_force(const Vec3& f) {
        acceleration += f;
    }

    void reset_normal() {
        accumulated_normal = vec3::zero();
    }

    // Accumulates the unit face normal, so shading weights every
    // adjacent triangle equally regardless of its area.
    void add_normal(const Vec3& face_normal) {
        accumulated_normal += face_normal.normalized();
    }

    void make_unmovable() {
        movable = false;
    }
};

}  // namespace drape

#endif // DRAPE_CLOTH_PARTICLE_HPP
